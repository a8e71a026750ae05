#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace rcopy::infra {

/// Однострочный индикатор "[bar] i/total (pct%) - Processing: name".
/// Рисуется синхронно в update(); на ход копирования не влияет.
class ProgressMonitor {
public:
    struct Stats {
        std::size_t total_files = 0;
        std::size_t processed_files = 0;
        std::size_t failed_files = 0;
        std::chrono::steady_clock::time_point start_time{};
    };

    /// enabled && !quiet && stdout — терминал.
    explicit ProgressMonitor(bool enabled = true, bool quiet = false);
    ~ProgressMonitor();

    ProgressMonitor(const ProgressMonitor&) = delete;
    ProgressMonitor& operator=(const ProgressMonitor&) = delete;

    void update(std::size_t current, std::size_t total, std::string_view file_name, bool succeeded);

    /// Завершает строку индикатора, если она была нарисована.
    void finish();

    [[nodiscard]] auto get_stats() const -> Stats;
    [[nodiscard]] auto is_enabled() const -> bool { return enabled_; }

    /// Строка индикатора без управляющих последовательностей; width — ширина терминала.
    [[nodiscard]] static auto format_line(std::size_t current, std::size_t total,
                                          std::string_view file_name, std::size_t width,
                                          std::chrono::duration<double> elapsed = {}) -> std::string;

private:
    void render_(std::string_view file_name) const;

    std::size_t processed_files_ = 0;
    std::size_t total_files_ = 0;
    std::size_t failed_files_ = 0;

    const bool enabled_;
    bool rendered_ = false;
    std::chrono::steady_clock::time_point start_time_;
};

} // namespace rcopy::infra
