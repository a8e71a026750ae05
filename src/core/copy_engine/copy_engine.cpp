#include "copy_engine.hpp"
#include <string_view>
#include <utility>
#include <spdlog/spdlog.h>
#include <fmt/core.h>

namespace rcopy::core {

auto derive_destination(const std::filesystem::path& source_root,
                        const std::filesystem::path& destination_root,
                        const std::filesystem::path& source)
    -> infra::Result<std::filesystem::path>
{
    const std::string_view root = source_root.native();
    std::string_view file = source.native();

    if (!file.starts_with(root)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Path is not under source root {}", source_root.string())));
    }

    file.remove_prefix(root.size());
    // /data/src2/a.txt не лежит под /data/src
    const bool root_ends_with_separator =
        !root.empty() && root.back() == std::filesystem::path::preferred_separator;
    if (!root_ends_with_separator && !file.empty() &&
        file.front() != std::filesystem::path::preferred_separator) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            fmt::format("Path is not under source root {}", source_root.string())));
    }
    while (!file.empty() && file.front() == std::filesystem::path::preferred_separator) {
        file.remove_prefix(1);
    }
    if (file.empty()) {
        return std::unexpected(infra::make_error(infra::ErrorCode::InvalidPath,
            "Path names the source root itself"));
    }

    return destination_root / std::filesystem::path(file);
}

CopySessionEngine::CopySessionEngine(SessionContext context, const extensions::VerifiedCopier& copier)
    : context_(std::move(context)), copier_(copier) {}

auto CopySessionEngine::process_file(const std::filesystem::path& source) -> infra::VoidResult {
    auto destination = derive_destination(context_.source_root, context_.destination_root, source);
    if (!destination) {
        return std::unexpected(std::move(destination.error()));
    }

    if (auto res = copier_.copy(source, *destination); !res) {
        return res;
    }

    // Только после успешной верификации; fsync до перехода к следующему файлу
    if (auto res = context_.progress.record_success(source); !res) {
        return std::unexpected(infra::make_error(infra::ErrorCode::LedgerIOFailed,
            fmt::format("Copied, but progress ledger update failed: {}", res.error().message)));
    }
    return {};
}

auto CopySessionEngine::run(const std::vector<std::filesystem::path>& worklist) -> SessionOutcome {
    SessionOutcome outcome;

    if (worklist.empty()) {
        spdlog::info("No files to process in this session.");
        return outcome;
    }

    const auto total = worklist.size();
    outcome.attempted.reserve(total);

    for (std::size_t i = 0; i < total; ++i) {
        if (context_.stop_requested && context_.stop_requested()) {
            spdlog::warn("Interrupted: stopping after {} of {} files", i, total);
            outcome.interrupted = true;
            break;
        }

        const auto& source = worklist[i];
        outcome.attempted.push_back(source);

        auto res = process_file(source);
        if (res) {
            ++outcome.copied;
        } else {
            const auto& err = res.error();
            spdlog::error("ERROR processing {} [{}]: {}", source.filename().string(), err.kind_name(), err.message);
            outcome.failures.push_back(ErrorRecord{.path = source.string(), .message = err.message});
        }

        if (context_.on_progress) {
            context_.on_progress(ProgressEvent{
                .current = i + 1,
                .total = total,
                .file_name = source.filename().string(),
                .succeeded = res.has_value()
            });
        }
    }

    return outcome;
}

} // namespace rcopy::core
