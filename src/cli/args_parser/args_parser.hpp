#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <optional>

namespace rcopy::args_parser {

enum class Mode {
    Copy,  // rcopy <source> <dest>
    Retry  // rcopy retry <source> <dest>
};

struct CLIArgs
{
    Mode mode{Mode::Copy};
    std::string source;                     // <source-dir>, должен существовать
    std::string destination;                // <dest-dir>, создаётся при необходимости
    bool progress{true};                    // --no-progress
    bool quiet{false};                      // -q, --quiet
    bool verbose{false};                    // -v, --verbose
    std::optional<std::string> config_file; // --config FILE
    bool version{false};                    // --version
};

/// Parses command-line arguments and returns a CLIArgs struct.
/// Returns std::nullopt after --help or a parse error (already reported);
/// exit_code receives the process status to return in that case.
std::optional<CLIArgs> parse_args(int argc, char const* const* argv, int& exit_code);

} // namespace rcopy::args_parser

using __CLI = rcopy::args_parser::CLIArgs;
