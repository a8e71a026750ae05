#pragma once

#include <string>
#include "../../core/session/session_report.hpp"

namespace rcopy::cli {

/// Итоговый отчёт в текстовом виде (copy или retry).
[[nodiscard]] auto format_report(const core::SessionReport& report) -> std::string;

void print_report(const core::SessionReport& report);

} // namespace rcopy::cli
