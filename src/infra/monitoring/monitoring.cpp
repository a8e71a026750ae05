#include "monitoring.hpp"
#include <fmt/core.h>
#include <algorithm>
#include <cmath>
#include <iostream>

#include <sys/ioctl.h>
#include <unistd.h>

namespace rcopy::infra {

namespace {

constexpr std::size_t kBarWidth = 30;

auto terminal_width() -> std::size_t {
    winsize ws{};
    if (::ioctl(STDOUT_FILENO, TIOCGWINSZ, &ws) == 0 && ws.ws_col > 0) {
        return ws.ws_col;
    }
    return 80;
}

auto format_eta(double eta_sec) -> std::string {
    if (!std::isfinite(eta_sec) || eta_sec <= 0) {
        return "--:--";
    }
    int seconds = static_cast<int>(eta_sec);
    int hours = seconds / 3600;
    int minutes = (seconds % 3600) / 60;
    seconds = seconds % 60;
    if (hours > 0) {
        return fmt::format("{:02d}:{:02d}:{:02d}", hours, minutes, seconds);
    }
    return fmt::format("{:02d}:{:02d}", minutes, seconds);
}

} // namespace

ProgressMonitor::ProgressMonitor(bool enabled, bool quiet)
    : enabled_(enabled && !quiet && ::isatty(STDOUT_FILENO) == 1)
    , start_time_(std::chrono::steady_clock::now())
{}

ProgressMonitor::~ProgressMonitor() {
    finish();
}

void ProgressMonitor::finish() {
    if (rendered_) {
        std::cout << "\n" << std::flush; // финальный перенос
        rendered_ = false;
    }
}

void ProgressMonitor::update(std::size_t current, std::size_t total, std::string_view file_name, bool succeeded) {
    processed_files_ = current;
    total_files_ = total;
    if (!succeeded) {
        ++failed_files_;
    }
    if (enabled_) {
        render_(file_name);
        rendered_ = true;
    }
}

auto ProgressMonitor::get_stats() const -> Stats {
    return Stats{
        .total_files = total_files_,
        .processed_files = processed_files_,
        .failed_files = failed_files_,
        .start_time = start_time_
    };
}

auto ProgressMonitor::format_line(std::size_t current, std::size_t total,
                                  std::string_view file_name, std::size_t width,
                                  std::chrono::duration<double> elapsed) -> std::string
{
    if (total == 0) return {};

    const double fraction = std::min(1.0, static_cast<double>(current) / static_cast<double>(total));
    const auto filled = static_cast<std::size_t>(fraction * kBarWidth);

    // ETA по среднему времени на файл
    double eta_sec = 0.0;
    if (current > 0 && elapsed.count() > 0) {
        eta_sec = elapsed.count() / static_cast<double>(current) * static_cast<double>(total - current);
    }

    std::string bar;
    for (std::size_t i = 0; i < kBarWidth; ++i) {
        bar += i < filled ? "█" : "░";
    }

    auto head = fmt::format("[{}] {}/{} ({:.0f}%) ETA {} - Processing: ",
                            bar, current, total, fraction * 100.0, format_eta(eta_sec));

    // Имя обрезается слева, чтобы строка влезла в терминал
    const std::size_t visible_head = kBarWidth + (head.size() - bar.size());
    std::size_t max_name = width > visible_head + 10 ? width - visible_head - 1 : 10;
    std::string name(file_name);
    if (name.size() > max_name) {
        name = "..." + name.substr(name.size() - (max_name - 3));
    }
    return head + name;
}

void ProgressMonitor::render_(std::string_view file_name) const {
    auto elapsed = std::chrono::duration<double>(std::chrono::steady_clock::now() - start_time_);
    auto line = format_line(processed_files_, total_files_, file_name, terminal_width(), elapsed);

    // Очистка строки и вывод
    std::cout << "\r\033[K" << line << std::flush;
}

} // namespace rcopy::infra
