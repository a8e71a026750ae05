#include "report.hpp"
#include <fmt/core.h>
#include <string_view>

namespace rcopy::cli {

namespace {

constexpr std::string_view kRule = "--------------------------------------------------";

auto format_copy(const core::SessionReport& r) -> std::string {
    std::string out = fmt::format("{}\n", kRule);
    out += r.interrupted ? "Copy operation interrupted.\n" : "Copy operation finished.\n";
    out += fmt::format("Total files in source:      {}\n", r.discovered);
    out += fmt::format("Skipped (already copied):   {}\n", r.skipped);
    out += fmt::format("Successfully copied now:    {}\n", r.copied);
    out += fmt::format("Errors during this session: {}\n", r.failed);
    if (r.not_attempted > 0) {
        out += fmt::format("Not attempted (stopped):    {}\n", r.not_attempted);
    }

    if (r.failed > 0) {
        out += fmt::format("\nDetails for failed files are in: {}\n", r.error_log.string());
        out += "Run 'rcopy retry' with the same directories to copy them again.\n";
    } else if (r.nothing_to_do && r.discovered > 0) {
        out += "\nAll files were already copied.\n";
    }
    return out;
}

auto format_retry(const core::SessionReport& r) -> std::string {
    if (r.nothing_to_do) {
        return "No failed files found in the error log. Nothing to retry.\n";
    }

    std::string out = fmt::format("{}\n", kRule);
    out += r.interrupted ? "Retry operation interrupted.\n" : "Retry operation finished.\n";
    out += fmt::format("Files attempted to retry:   {}\n", r.attempted);
    out += fmt::format("Successfully copied:        {}\n", r.copied);
    out += fmt::format("Still failing:              {}\n", r.failed);
    if (r.not_attempted > 0) {
        out += fmt::format("Not attempted (stopped):    {}\n", r.not_attempted);
    }

    if (!r.all_done()) {
        out += fmt::format("\nThe remaining failed files are still listed in: {}\n", r.error_log.string());
    } else if (r.attempted > 0) {
        out += "\nSuccess! All previously failed files have been copied.\n";
    }
    return out;
}

} // namespace

auto format_report(const core::SessionReport& report) -> std::string {
    return report.mode == core::SessionMode::Retry ? format_retry(report) : format_copy(report);
}

void print_report(const core::SessionReport& report) {
    fmt::print("\n{}", format_report(report));
}

} // namespace rcopy::cli
