#pragma once

#include <string>
#include <vector>
#include <cstdint>
#include <expected>
#include <optional>

namespace copysort::args_parser {
    struct CLIArgs
{
    std::string source;                     // первый позиционный аргумент
    std::string destination;                // второй позиционный аргумент
    std::optional<std::string> manifest;    // --manifest PATH
    std::optional<std::uint32_t> workers;   // -j, --workers N
    std::optional<std::size_t> buffer_size; // --buffer-size BYTES
    bool progress{true};                    // --no-progress
    bool quiet{false};                      // -q, --quiet
    bool verbose{false};                    // -v, --verbose
    bool version{false};                    // --version
};

/// Parses command-line arguments.
/// On --help or a usage error returns the exit status CLI11 chose.
std::expected<CLIArgs, int> parse_args(int argc, char const* const* argv);

} // namespace copysort::args_parser
