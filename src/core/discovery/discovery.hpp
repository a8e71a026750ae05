#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace rcopy::core {

struct DiscoveryOptions {
    bool follow_symlinks = false;           // заходить в симлинки на каталоги
    std::vector<std::string> exclude_patterns; // regex по имени файла
    std::vector<std::string> include_patterns; // regex по имени файла, пусто = все
};

/// Все обычные файлы под root (рекурсивно) в виде абсолютных путей,
/// отсортированные по path::operator<. Ошибка обхода = DiscoveryFailed.
[[nodiscard]] auto discover_files(const std::filesystem::path& root,
                                  const DiscoveryOptions& options = {})
    -> infra::Result<std::vector<std::filesystem::path>>;

} // namespace rcopy::core
