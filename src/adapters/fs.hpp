#pragma once

#include <filesystem>
#include <expected>
#include <cstddef>
#include <cstdint>
#include <string_view>
#include "../infra/error_handler/error.hpp"

namespace rcopy::adapters::fs {

enum class CopyStrategy {
    Buffered,    // < 1 MB
    MMap,        // >= 1 MB
};

[[nodiscard]] auto select_strategy(std::uintmax_t file_size) -> CopyStrategy;

/// Побайтовое копирование с перезаписью dst. Размер не проверяется.
[[nodiscard]] auto copy_file(
    const std::filesystem::path& src,
    const std::filesystem::path& dst,
    CopyStrategy strategy = CopyStrategy::Buffered
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_buffered(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

[[nodiscard]] auto copy_file_mmap(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

/// Копирование с автоматическим выбором стратегии по размеру src.
[[nodiscard]] auto copy_file_auto(
    const std::filesystem::path& src,
    const std::filesystem::path& dst
) -> infra::VoidResult;

[[nodiscard]] auto file_size(const std::filesystem::path& path)
    -> infra::Result<std::uintmax_t>;

/// Дописывает data в конец файла (O_APPEND, файл создаётся при отсутствии).
/// При sync == true возвращается только после fsync.
[[nodiscard]] auto append_durable(
    const std::filesystem::path& path,
    std::string_view data,
    bool sync = true
) -> infra::VoidResult;

/// Полностью заменяет содержимое файла на data (O_TRUNC) и делает fsync.
[[nodiscard]] auto overwrite_durable(
    const std::filesystem::path& path,
    std::string_view data
) -> infra::VoidResult;

} // namespace rcopy::adapters::fs
