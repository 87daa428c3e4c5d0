#ifndef SLOPCC_DRIVER_HPP
#define SLOPCC_DRIVER_HPP

#include <cstdio>
#include <memory_resource>
#include <string>
#include <string_view>

#include "slopcc/fwd.hpp"

namespace slopcc {

struct Cli_Options;

/// @brief Process exit codes of the `slopcc` executable.
enum struct Exit_Code : int {
    success = 0,
    /// @brief An input could not be read, an error was diagnosed,
    /// or an unimplemented phase was requested.
    failure = 1,
    /// @brief The command line was malformed.
    usage = 2,
};

/// @brief Appends `text` to `out`, with new-lines, tabs, quotes, backslashes,
/// and other unprintable bytes escaped as in a C string literal.
void append_escaped(std::pmr::u8string& out, std::u8string_view text);

/// @brief Registers, tokenizes, and diagnoses every input named by `options`.
/// @param out the stream for regular output (tokens, `-E` output, version, etc.)
/// @param err the stream for diagnostics
/// @param colors if `true`, diagnostics are colored with ANSI escape sequences
[[nodiscard]]
Exit_Code run(const Cli_Options& options, std::FILE* out, std::FILE* err, bool colors);

} // namespace slopcc

#endif
