#include "discovery.hpp"
#include <algorithm>
#include <regex>
#include <string_view>
#include <system_error>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace rcopy::core {

namespace {

auto compile_patterns(const std::vector<std::string>& patterns, std::string_view kind)
    -> std::vector<std::regex>
{
    std::vector<std::regex> compiled;
    for (const auto& pattern : patterns) {
        try {
            compiled.emplace_back(pattern);
        } catch (const std::regex_error& e) {
            spdlog::warn("Invalid {} pattern '{}': {}", kind, pattern, e.what());
        }
    }
    return compiled;
}

bool matches_any(const std::vector<std::regex>& patterns, const std::string& name) {
    return std::ranges::any_of(patterns, [&](const std::regex& re) {
        return std::regex_match(name, re);
    });
}

} // namespace

auto discover_files(const std::filesystem::path& root, const DiscoveryOptions& options)
    -> infra::Result<std::vector<std::filesystem::path>>
{
    std::error_code ec;
    const auto abs_root = std::filesystem::absolute(root, ec).lexically_normal();
    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiscoveryFailed,
            fmt::format("Cannot resolve {}: {}", root.string(), ec.message())));
    }

    const auto excludes = compile_patterns(options.exclude_patterns, "exclude");
    const auto includes = compile_patterns(options.include_patterns, "include");

    auto iter_options = std::filesystem::directory_options::none;
    if (options.follow_symlinks) {
        iter_options |= std::filesystem::directory_options::follow_directory_symlink;
    }

    std::vector<std::filesystem::path> files;
    std::filesystem::recursive_directory_iterator it(abs_root, iter_options, ec);
    const std::filesystem::recursive_directory_iterator end;
    for (; !ec && it != end; it.increment(ec)) {
        const auto& entry = *it;
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec)) {
            continue;
        }

        const auto name = entry.path().filename().string();
        if (matches_any(excludes, name)) continue;
        if (!includes.empty() && !matches_any(includes, name)) continue;

        files.push_back(entry.path());
    }

    if (ec) {
        return std::unexpected(infra::make_error(infra::ErrorCode::DiscoveryFailed,
            fmt::format("Failed to traverse {}: {}", abs_root.string(), ec.message())));
    }

    std::ranges::sort(files);

    spdlog::debug("Discovered {} files under {}", files.size(), abs_root.string());
    return files;
}

} // namespace rcopy::core
