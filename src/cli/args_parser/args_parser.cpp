#include "args_parser.hpp"

#include <CLI/CLI.hpp>

namespace rcopy::args_parser {

namespace {

void add_common(CLI::App& cmd, CLIArgs& args) {
    cmd.add_option("source-dir", args.source, "The source directory to copy files from.")
        ->required()
        ->check(CLI::ExistingDirectory);
    cmd.add_option("dest-dir", args.destination, "The destination directory where files will be copied.")
        ->required();
}

} // namespace

std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code)
{
    CLIArgs args;
    bool no_progress = false;

    CLI::App app{"A robust file copier that performs a full, resumable copy."};
    app.name("rcopy");
    app.require_subcommand(0, 1);
    app.fallthrough();

    app.add_flag("-q,--quiet", args.quiet, "Only print warnings, errors and the final report");
    app.add_flag("-v,--verbose", args.verbose, "Enable debug logging");
    app.add_flag("--no-progress", no_progress, "Do not render the progress line");
    app.add_option("--config", args.config_file, "Path to a YAML config file")
        ->check(CLI::ExistingFile);
    app.add_flag("--version", args.version, "Print build information and exit");

    auto* retry = app.add_subcommand("retry", "Retries copying only the files that failed in a previous run.");
    add_common(*retry, args);

    // Позиционные аргументы корневой команды нужны, только если нет подкоманды
    CLIArgs root_paths;
    app.add_option("source-dir", root_paths.source, "The source directory to copy files from.")
        ->check(CLI::ExistingDirectory);
    app.add_option("dest-dir", root_paths.destination, "The destination directory where files will be copied.");

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& e) {
        exit_code = app.exit(e);
        return std::nullopt;
    }

    args.progress = !no_progress;
    if (args.version) {
        return args;
    }

    if (retry->parsed()) {
        args.mode = Mode::Retry;
        return args;
    }

    if (root_paths.source.empty() || root_paths.destination.empty()) {
        exit_code = app.exit(CLI::RequiredError("source-dir and dest-dir"));
        return std::nullopt;
    }

    args.mode = Mode::Copy;
    args.source = root_paths.source;
    args.destination = root_paths.destination;
    return args;
}

} // namespace rcopy::args_parser
