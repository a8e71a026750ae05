#include <yaml-cpp/yaml.h>
#include <spdlog/spdlog.h>
#include <fmt/core.h>
#include <algorithm>
#include <cstdlib>
#include <system_error>

#include "config.hpp"
#include "../../cli/args_parser/args_parser.hpp"

namespace rcopy::infra {
    void Config::merge_with(const Config& other) {
        if (other.log_level) log_level = other.log_level;
        if (other.verbose) verbose = true;
        if (!other.progress) progress = false; // CLI может отключить
        if (other.quiet) quiet = true;
    }

    auto parse_error_log_policy(std::string_view text) -> std::optional<ErrorLogPolicy> {
        if (text == "supersede") return ErrorLogPolicy::Supersede;
        if (text == "append") return ErrorLogPolicy::Append;
        return std::nullopt;
    }

    static auto get_config_paths() -> std::vector<std::filesystem::path> {
        std::vector<std::filesystem::path> paths;

        // 1. Локальный файл
        paths.push_back(".rcopy.yaml");

        // 2. Глобальный файл
        const char* config_home = std::getenv("XDG_CONFIG_HOME");
        if (config_home && std::filesystem::exists(config_home)) {
            paths.push_back(std::filesystem::path(config_home) / "rcopy" / "config.yaml");
        } else {
            const char* home = std::getenv("HOME");
            if (home) {
                paths.push_back(std::filesystem::path(home) / ".config" / "rcopy" / "config.yaml");
            }
        }

        return paths;
    }

    auto load_config_from_path(const std::filesystem::path& path)
        -> std::expected<Config, std::string>
    {
        try {
            YAML::Node config = YAML::LoadFile(path.string());
            Config cfg{};

            if (config["log_level"]) {
                auto level = config["log_level"].as<std::string>();
                if (spdlog::level::from_str(level) == spdlog::level::off && level != "off") {
                    return std::unexpected(fmt::format("{}: unknown log_level '{}'", path.string(), level));
                }
                cfg.log_level = level;
            }

            if (config["progress"]) cfg.progress = config["progress"].as<bool>();
            if (config["quiet"]) cfg.quiet = config["quiet"].as<bool>();
            if (config["fsync_progress"]) cfg.fsync_progress = config["fsync_progress"].as<bool>();
            if (config["follow_symlinks"]) cfg.follow_symlinks = config["follow_symlinks"].as<bool>();
            if (config["case_sensitive_ledger"]) {
                cfg.case_sensitive_ledger = config["case_sensitive_ledger"].as<bool>();
            }

            if (config["error_log_policy"]) {
                auto text = config["error_log_policy"].as<std::string>();
                auto policy = parse_error_log_policy(text);
                if (!policy) {
                    return std::unexpected(fmt::format("{}: unknown error_log_policy '{}'", path.string(), text));
                }
                cfg.error_log_policy = *policy;
            }

            if (config["progress_log_name"]) cfg.progress_log_name = config["progress_log_name"].as<std::string>();
            if (config["error_log_name"]) cfg.error_log_name = config["error_log_name"].as<std::string>();
            if (cfg.progress_log_name.empty() || cfg.error_log_name.empty() ||
                cfg.progress_log_name == cfg.error_log_name) {
                return std::unexpected(fmt::format("{}: ledger file names must be non-empty and distinct", path.string()));
            }
            for (const auto& name : {cfg.progress_log_name, cfg.error_log_name}) {
                const std::filesystem::path ledger(name);
                if (ledger.is_absolute() || ledger.has_parent_path() || name == "." || name == "..") {
                    return std::unexpected(fmt::format("{}: ledger file name '{}' must be a plain file name",
                                                       path.string(), name));
                }
            }

            if (config["exclude"]) {
                for (const auto& pat : config["exclude"]) {
                    cfg.exclude_patterns.push_back(pat.as<std::string>());
                }
            }
            if (config["include"]) {
                for (const auto& pat : config["include"]) {
                    cfg.include_patterns.push_back(pat.as<std::string>());
                }
            }

            spdlog::debug("Loaded config from {}", path.string());
            return cfg;

        } catch (const std::exception& e) {
            return std::unexpected(fmt::format("Failed to parse {}: {}", path.string(), e.what()));
        }
    }

    auto load_config_from_file(const std::optional<std::filesystem::path>& explicit_path)
        -> std::expected<Config, std::string>
    {
        if (explicit_path) {
            std::error_code ec;
            if (!std::filesystem::is_regular_file(*explicit_path, ec)) {
                return std::unexpected(fmt::format("Config file not found: {}", explicit_path->string()));
            }
            return load_config_from_path(*explicit_path);
        }

        for (const auto& path : get_config_paths()) {
            std::error_code ec;
            if (!std::filesystem::exists(path, ec)) continue;
            return load_config_from_path(path);
        }

        // Файл не найден — возвращаем пустой конфиг (не ошибка!)
        return Config{};
    }

    [[nodiscard]]
    auto config_from_cli(const __CLI& args) -> Config {
        Config cfg{};
        cfg.verbose = args.verbose;
        cfg.progress = args.progress;
        cfg.quiet = args.quiet;
        return cfg;
    }

    void apply_logging(const Config& config) {
        auto level = spdlog::level::info;
        if (config.log_level) level = spdlog::level::from_str(*config.log_level);
        if (config.quiet) level = std::max(level, spdlog::level::warn);
        if (config.verbose) level = std::min(level, spdlog::level::debug);
        spdlog::set_level(level);
    }

} // namespace rcopy::infra
