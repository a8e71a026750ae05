#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string_view>

namespace rcopy::args_parser{
    struct CLIArgs;
}

namespace rcopy::infra {

/// Что делать с журналом ошибок после обычной (не retry) сессии.
enum class ErrorLogPolicy {
    Supersede, // записи по повторно пройденным путям заменяются новыми
    Append     // только дописывать в конец
};

struct Config {
    // Logging
    std::optional<std::string> log_level; // trace|debug|info|warn|error|critical|off
    bool verbose = false;

    // Behavior
    bool progress = true;
    bool quiet = false;
    bool fsync_progress = true;
    bool follow_symlinks = false;
    bool case_sensitive_ledger = false;
    ErrorLogPolicy error_log_policy = ErrorLogPolicy::Supersede;

    // Ledger files (inside destination root)
    std::string progress_log_name = ".copy_progress.log";
    std::string error_log_name = ".copy_errors.log";

    // Filename filters (regex), пусто = без фильтрации
    std::vector<std::string> exclude_patterns;
    std::vector<std::string> include_patterns;

    // Слияние с другим Config (например, из CLI)
    void merge_with(const Config& other);
};

[[nodiscard]] auto parse_error_log_policy(std::string_view text) -> std::optional<ErrorLogPolicy>;

/// Загружает конфигурацию из конкретного YAML-файла.
[[nodiscard]] auto load_config_from_path(const std::filesystem::path& path)
    -> std::expected<Config, std::string>;

/// Загружает конфигурацию из файла YAML.
/// Если задан explicit_path, читается только он (и он обязан существовать).
/// Иначе ищет файл в порядке:
///   1. ./.rcopy.yaml
///   2. $XDG_CONFIG_HOME/rcopy/config.yaml или ~/.config/rcopy/config.yaml
/// Возвращает Config по умолчанию, если файл не найден.
[[nodiscard]] auto load_config_from_file(
    const std::optional<std::filesystem::path>& explicit_path = std::nullopt)
    -> std::expected<Config, std::string>;

/// Создаёт Config из CLI аргументов (структура из args_parser)
[[nodiscard]] auto config_from_cli(const struct rcopy::args_parser::CLIArgs& args) -> Config;

/// Применяет log_level / verbose / quiet к spdlog.
void apply_logging(const Config& config);

} // namespace rcopy::infra
