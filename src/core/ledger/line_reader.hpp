#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "../../infra/error_handler/error.hpp"

namespace rcopy::core::detail {

/// Непустые строки текстового журнала (без '\r' в конце).
/// Отсутствующий файл = пустой список.
[[nodiscard]] auto read_nonempty_lines(const std::filesystem::path& path)
    -> infra::Result<std::vector<std::string>>;

} // namespace rcopy::core::detail
