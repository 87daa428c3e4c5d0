#ifndef SLOPCC_PRINT_HPP
#define SLOPCC_PRINT_HPP

#include <cstddef>
#include <cstdio>
#include <memory_resource>
#include <string>
#include <string_view>
#include <system_error>

#include "slopcc/util/io.hpp"
#include "slopcc/util/result.hpp"

#include "slopcc/fwd.hpp"

namespace slopcc {

/// @brief Distinguishes the parts of printed diagnostics,
/// so that they can be colored when printed to a terminal.
enum struct Diagnostic_Highlight : Default_Underlying {
    text,
    code_position,
    code_citation,
    line_number,
    punctuation,
    position_indicator,
    note,
    warning,
    error,
    id,
};

/// @brief Appends `text` to `out`, surrounded by the ANSI sequences for `highlight`
/// if `colors` is `true`.
void append_highlighted(
    std::pmr::u8string& out,
    std::u8string_view text,
    Diagnostic_Highlight highlight,
    bool colors
);

/// @brief Prints a position within a file, consisting of the file name and line/column.
/// @param colon_suffix if `true`, appends a `:`
void print_file_position(
    std::pmr::u8string& out,
    const Resolved_Span& position,
    bool colors,
    bool colon_suffix = true
);

/// @brief Prints the line of `file` which contains the start of `span`,
/// preceded by its line number and followed by a line of `^~~~` indicators
/// underneath the affected bytes.
void print_affected_line(
    std::pmr::u8string& out,
    const Source_File& file,
    const Span& span,
    bool colors
);

/// @brief Prints `diagnostic` as `SEVERITY: file:line:column: message [id]`,
/// followed by the affected line if the diagnostic has a location.
void print_diagnostic(
    std::pmr::u8string& out,
    const Diagnostic& diagnostic,
    const Source_Map& sources,
    bool colors
);

/// @brief Prints a message stating that `file` could not be read due to `error`.
/// If `system_error` holds an error, its message is appended in parentheses.
void print_io_error(
    std::pmr::u8string& out,
    std::u8string_view file,
    IO_Error_Code error,
    bool colors,
    std::error_code system_error = {}
);

/// @brief Writes every diagnostic in `diagnostics` to `stream`.
/// Colors are used iff `colors` is `true`.
[[nodiscard]]
Result<void, IO_Error_Code> print_diagnostics(
    std::FILE* stream,
    const Diagnostics& diagnostics,
    const Source_Map& sources,
    bool colors
);

} // namespace slopcc

#endif
