#include "verifier.hpp"
#include "../adapters/fs.hpp"
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <system_error>
#include <utility>

namespace rcopy::extensions {

VerifiedCopier::VerifiedCopier()
    : primitive_(&adapters::fs::copy_file_auto) {}

VerifiedCopier::VerifiedCopier(CopyPrimitive primitive)
    : primitive_(std::move(primitive)) {}

auto VerifiedCopier::compare_sizes(const std::filesystem::path& src,
                                   const std::filesystem::path& dst)
    -> infra::Result<SizeCheck>
{
    auto src_size = adapters::fs::file_size(src);
    if (!src_size) {
        return std::unexpected(std::move(src_size.error()));
    }

    auto dst_size = adapters::fs::file_size(dst);
    if (!dst_size) {
        return std::unexpected(std::move(dst_size.error()));
    }

    return SizeCheck{.source_bytes = *src_size, .destination_bytes = *dst_size};
}

auto VerifiedCopier::copy(const std::filesystem::path& src,
                          const std::filesystem::path& dst) const -> infra::VoidResult
{
    std::error_code ec;
    if (!std::filesystem::exists(src, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::FileNotFound,
            "Source file not found (it may have been moved or deleted)."));
    }

    if (std::filesystem::exists(dst, ec) && std::filesystem::equivalent(src, dst, ec)) {
        return std::unexpected(infra::make_error(infra::ErrorCode::IOFailure,
            fmt::format("Source and destination are the same file: {}", dst.string())));
    }

    if (dst.has_parent_path()) {
        std::filesystem::create_directories(dst.parent_path(), ec);
        if (ec) {
            return std::unexpected(infra::make_error_from(ec,
                fmt::format("Cannot create directory {}", dst.parent_path().string())));
        }
    }

    if (auto res = primitive_(src, dst); !res) {
        return res;
    }

    auto sizes = compare_sizes(src, dst);
    if (!sizes) {
        return std::unexpected(std::move(sizes.error()));
    }
    if (!sizes->matches()) {
        spdlog::debug("Size mismatch: {} ({} bytes) vs {} ({} bytes)",
                      src.string(), sizes->source_bytes,
                      dst.string(), sizes->destination_bytes);
        return std::unexpected(infra::make_error(infra::ErrorCode::VerificationFailed,
            fmt::format("Verification failed. Copied file size does not match source ({} != {} bytes).",
                        sizes->destination_bytes, sizes->source_bytes)));
    }

    return {};
}

} // namespace rcopy::extensions
