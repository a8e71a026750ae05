#pragma once

#include <cstddef>
#include <filesystem>

namespace rcopy::core {

enum class SessionMode {
    Copy,
    Retry
};

/// Итог одной сессии для вывода в CLI.
struct SessionReport {
    SessionMode mode = SessionMode::Copy;

    std::filesystem::path destination;
    std::filesystem::path progress_log;
    std::filesystem::path error_log;

    std::size_t discovered = 0;   // copy: файлов в источнике
    std::size_t skipped = 0;      // copy: уже были в журнале прогресса
    std::size_t attempted = 0;    // сколько файлов реально пробовали
    std::size_t copied = 0;
    std::size_t failed = 0;
    std::size_t not_attempted = 0; // остались в worklist после прерывания

    bool interrupted = false;
    bool nothing_to_do = false;   // пустой worklist

    [[nodiscard]] auto all_done() const -> bool { return failed == 0 && not_attempted == 0; }
};

} // namespace rcopy::core
