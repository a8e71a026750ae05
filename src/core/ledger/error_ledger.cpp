#include "error_ledger.hpp"
#include "line_reader.hpp"
#include "../../adapters/fs.hpp"
#include <algorithm>
#include <system_error>
#include <utility>
#include <spdlog/spdlog.h>

namespace rcopy::core {

namespace {

auto join_lines(const std::vector<ErrorRecord>& records) -> std::string {
    std::string out;
    for (const auto& record : records) {
        out += record.to_line();
        out += '\n';
    }
    return out;
}

} // namespace

auto ErrorRecord::to_line() const -> std::string {
    std::string msg = message;
    std::ranges::replace(msg, '\n', ' ');
    std::ranges::replace(msg, '\r', ' ');
    std::string line;
    line.reserve(path.size() + 1 + msg.size());
    line += path;
    line += kErrorRecordDelimiter;
    line += msg;
    return line;
}

auto ErrorRecord::parse(std::string_view line) -> std::optional<ErrorRecord> {
    const auto pos = line.find(kErrorRecordDelimiter);
    auto path = line.substr(0, pos);
    if (path.empty()) {
        return std::nullopt;
    }
    ErrorRecord record{.path = std::string(path), .message = {}};
    if (pos != std::string_view::npos) {
        record.message = std::string(line.substr(pos + 1));
    }
    return record;
}

ErrorLedger::ErrorLedger(std::filesystem::path path)
    : path_(std::move(path)) {}

auto ErrorLedger::load_records() const -> infra::Result<std::vector<ErrorRecord>> {
    auto lines = detail::read_nonempty_lines(path_);
    if (!lines) {
        return std::unexpected(std::move(lines.error()));
    }

    std::vector<ErrorRecord> records;
    records.reserve(lines->size());
    for (const auto& line : *lines) {
        if (auto record = ErrorRecord::parse(line)) {
            records.push_back(std::move(*record));
        } else {
            spdlog::debug("Dropping malformed error record: '{}'", line);
        }
    }
    return records;
}

auto ErrorLedger::load_failed_paths() const -> infra::Result<std::vector<std::string>> {
    auto records = load_records();
    if (!records) {
        return std::unexpected(std::move(records.error()));
    }

    std::vector<std::string> paths;
    paths.reserve(records->size());
    for (auto& record : *records) {
        paths.push_back(std::move(record.path));
    }
    return paths;
}

auto ErrorLedger::overwrite(const std::vector<ErrorRecord>& records) const -> infra::VoidResult {
    return adapters::fs::overwrite_durable(path_, join_lines(records));
}

auto ErrorLedger::append(const std::vector<ErrorRecord>& records) const -> infra::VoidResult {
    if (records.empty()) {
        return {};
    }
    return adapters::fs::append_durable(path_, join_lines(records));
}

auto ErrorLedger::supersede(const PathSet& attempted,
                            const std::vector<ErrorRecord>& failures) const -> infra::VoidResult
{
    std::error_code ec;
    const bool existed = std::filesystem::exists(path_, ec);
    if (!existed && failures.empty()) {
        return {};
    }

    auto previous = load_records();
    if (!previous) {
        return std::unexpected(std::move(previous.error()));
    }

    std::vector<ErrorRecord> merged;
    merged.reserve(previous->size() + failures.size());
    for (auto& record : *previous) {
        if (!attempted.contains(record.path)) {
            merged.push_back(std::move(record));
        }
    }
    const auto kept = merged.size();
    merged.insert(merged.end(), failures.begin(), failures.end());

    spdlog::debug("Error ledger {}: kept {} of {} previous records, {} new",
                  path_.string(), kept, previous->size(), failures.size());
    return overwrite(merged);
}

} // namespace rcopy::core
