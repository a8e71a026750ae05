#include <fmt/core.h>

#include "infra/config/config.hpp"
#include "infra/error_handler/error.hpp"
#include "infra/interrupt.hpp"
#include "infra/monitoring/monitoring.hpp"
#include "cli/args_parser/args_parser.hpp"
#include "cli/report/report.hpp"
#include "core/session/session.hpp"
#include "extensions/verifier.hpp"
#include <git_info.hpp>
#include <spdlog/spdlog.h>
#include <chrono>
#include <filesystem>
#include <optional>

using GIT = rcopy::build_info::GitInfo;
using ARGS = rcopy::args_parser::CLIArgs;

constexpr auto load_from_cli = rcopy::infra::config_from_cli;
constexpr auto load_config_file = rcopy::infra::load_config_from_file;
constexpr auto args_parser = rcopy::args_parser::parse_args;
constexpr auto git = rcopy::build_info::get_git_info();

static auto
__out_git_verse(const GIT& git)
-> void {
    fmt::print("rcopy {}\n", git.version);
    fmt::print("Git branch: {}\n", git.branch);
    fmt::print("Git commit: {}\n", git.commit);
    fmt::print("Git commit short: {}\n", git.commit_short);
    fmt::print("Git dirty: {}\n", git.dirty ? "yes" : "no");
    fmt::print("Build timestamp (UTC): {}\n", git.timestamp);
}

static auto
__to_request(const ARGS& args)
-> rcopy::core::SessionRequest {
    return rcopy::core::SessionRequest{
        .mode = args.mode == rcopy::args_parser::Mode::Retry
            ? rcopy::core::SessionMode::Retry
            : rcopy::core::SessionMode::Copy,
        .source = args.source,
        .destination = args.destination,
    };
}

int main(int argc, char** argv)
{
    try {
        spdlog::set_level(spdlog::level::info);
        spdlog::set_pattern("[%Y-%m-%d %H:%M:%S] [%l] %v");

        rcopy::infra::install_signal_handler();

        int parse_exit = 0;
        auto args_opt = args_parser(argc, argv, parse_exit);
        if (!args_opt) {
            return parse_exit; // --help или ошибка
        }
        const auto& args = *args_opt;

        if (args.version) {
            __out_git_verse(git);
            return 0;
        }

        // 1. Загрузить из файла
        std::optional<std::filesystem::path> config_path;
        if (args.config_file) config_path = *args.config_file;
        auto config_res = load_config_file(config_path);
        if (!config_res) {
            spdlog::error("Config error: {}", config_res.error());
            return 1;
        }
        auto config = config_res.value();

        // 2. Переопределить из CLI
        config.merge_with(load_from_cli(args)); // CLI имеет приоритет
        rcopy::infra::apply_logging(config);

        rcopy::infra::ProgressMonitor monitor(config.progress, config.quiet);
        if (monitor.is_enabled()) {
            // лог-строка затирает индикатор, следующий update() перерисует его ниже
            spdlog::set_pattern("\r\033[K[%Y-%m-%d %H:%M:%S] [%l] %v");
        }

        rcopy::extensions::VerifiedCopier copier;
        auto start_time = std::chrono::steady_clock::now();

        auto result = rcopy::core::run_session(
            __to_request(args), config, copier,
            [&monitor](const rcopy::core::ProgressEvent& ev) {
                monitor.update(ev.current, ev.total, ev.file_name, ev.succeeded);
            },
            [] { return rcopy::infra::is_interrupted(); });

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start_time);

        if (!result) {
            spdlog::error("Copy operation failed: {}", result.error().message);
            return result.error().to_exit_code();
        }

        monitor.finish();
        rcopy::cli::print_report(*result);
        spdlog::debug("Time elapsed: {:.2f} seconds", duration.count() / 1000.0);

        if (result->interrupted) {
            return 130;
        }
        return 0;
    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        return 1;
    }
}
