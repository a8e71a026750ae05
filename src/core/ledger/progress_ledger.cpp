#include "progress_ledger.hpp"
#include "line_reader.hpp"
#include "../../adapters/fs.hpp"
#include <spdlog/spdlog.h>
#include <utility>

namespace rcopy::core {

ProgressLedger::ProgressLedger(std::filesystem::path path, bool sync, bool case_sensitive)
    : path_(std::move(path))
    , sync_(sync)
    , case_sensitive_(case_sensitive) {}

auto ProgressLedger::load() const -> infra::Result<PathSet> {
    auto lines = detail::read_nonempty_lines(path_);
    if (!lines) {
        return std::unexpected(std::move(lines.error()));
    }

    PathSet done(case_sensitive_);
    for (const auto& line : *lines) {
        done.insert(line);
    }
    spdlog::debug("Progress ledger {}: {} lines, {} unique paths",
                  path_.string(), lines->size(), done.size());
    return done;
}

auto ProgressLedger::record_success(const std::filesystem::path& file) const -> infra::VoidResult {
    std::string line = file.string();
    line += '\n';
    return adapters::fs::append_durable(path_, line, sync_);
}

} // namespace rcopy::core
