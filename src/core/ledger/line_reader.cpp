#include "line_reader.hpp"
#include <fstream>
#include <system_error>
#include <fmt/core.h>

namespace rcopy::core::detail {

auto read_nonempty_lines(const std::filesystem::path& path)
    -> infra::Result<std::vector<std::string>>
{
    std::vector<std::string> lines;

    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
                fmt::format("Cannot stat {}: {}", path.string(), ec.message())));
        }
        return lines;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
            fmt::format("Cannot open {}", path.string())));
    }

    std::string line;
    while (std::getline(in, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (!line.empty()) {
            lines.push_back(std::move(line));
        }
    }

    if (in.bad()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
            fmt::format("Read error on {}", path.string())));
    }
    return lines;
}

} // namespace rcopy::core::detail
