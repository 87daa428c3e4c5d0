#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <memory_resource>
#include <string>
#include <string_view>
#include <system_error>

#include "slopcc/util/ansi.hpp"
#include "slopcc/util/assert.hpp"
#include "slopcc/util/io.hpp"
#include "slopcc/util/result.hpp"
#include "slopcc/util/severity.hpp"
#include "slopcc/util/strings.hpp"
#include "slopcc/util/to_chars.hpp"

#include "slopcc/diagnostic.hpp"
#include "slopcc/print.hpp"
#include "slopcc/source.hpp"
#include "slopcc/span.hpp"

namespace slopcc {
namespace {

[[nodiscard]]
std::u8string_view diagnostic_highlight_ansi_sequence(Diagnostic_Highlight type)
{
    switch (type) {
        using enum Diagnostic_Highlight;

    case text:
    case code_citation:
    case punctuation: return ansi::reset;

    case code_position:
    case id: return ansi::h_black;

    case error: return ansi::h_red;

    case warning:
    case line_number: return ansi::h_yellow;

    case note: return ansi::h_white;

    case position_indicator: return ansi::h_green;
    }
    SLOPCC_ASSERT_UNREACHABLE(u8"Unknown diagnostic highlight.");
}

[[nodiscard]]
Diagnostic_Highlight severity_highlight(Severity severity)
{
    switch (severity) {
    case Severity::note: return Diagnostic_Highlight::note;
    case Severity::warning: return Diagnostic_Highlight::warning;
    case Severity::error: return Diagnostic_Highlight::error;
    case Severity::none: break;
    }
    SLOPCC_ASSERT_UNREACHABLE(u8"Diagnostics cannot have severity none.");
}

[[nodiscard]]
std::u8string_view io_error_description(IO_Error_Code error)
{
    switch (error) {
    case IO_Error_Code::cannot_open: return u8"The file could not be opened.";
    case IO_Error_Code::read_error: return u8"An I/O error occurred while reading the file.";
    case IO_Error_Code::write_error: return u8"An I/O error occurred while writing the file.";
    }
    SLOPCC_ASSERT_UNREACHABLE(u8"Invalid I/O error code.");
}

} // namespace

void append_highlighted(
    std::pmr::u8string& out,
    std::u8string_view text,
    Diagnostic_Highlight highlight,
    bool colors
)
{
    if (!colors || text.empty()) {
        out += text;
        return;
    }
    out += diagnostic_highlight_ansi_sequence(highlight);
    out += text;
    out += ansi::reset;
}

void print_file_position(
    std::pmr::u8string& out,
    const Resolved_Span& position,
    bool colors,
    bool colon_suffix
)
{
    std::pmr::u8string text { out.get_allocator() };
    text += position.name;
    text += u8':';
    text += to_characters8(position.line);
    text += u8':';
    text += to_characters8(position.column);
    if (colon_suffix) {
        text += u8':';
    }
    append_highlighted(out, text, Diagnostic_Highlight::code_position, colors);
}

void print_affected_line(
    std::pmr::u8string& out,
    const Source_File& file,
    const Span& span,
    bool colors
)
{
    const Line_Column position = file.line_column(span.start);
    const std::u8string_view cited_code = file.line_text(position.line - 1);
    const std::size_t column = position.column - 1;

    const Characters8 line_chars = to_characters8(position.line);
    constexpr std::size_t pad_max = 6;
    const std::size_t pad_length
        = pad_max - std::min(line_chars.length, std::size_t { pad_max - 1 });
    out.append(pad_length, u8' ');
    append_highlighted(out, line_chars, Diagnostic_Highlight::line_number, colors);
    out += u8' ';
    append_highlighted(out, u8"|", Diagnostic_Highlight::punctuation, colors);
    out += u8' ';
    append_highlighted(out, cited_code, Diagnostic_Highlight::code_citation, colors);
    out += u8'\n';

    const std::size_t align_length = std::max(pad_max, line_chars.length + 1);
    out.append(align_length, u8' ');
    out += u8' ';
    append_highlighted(out, u8"|", Diagnostic_Highlight::punctuation, colors);
    out += u8' ';
    out.append(column, u8' ');

    // Spans past the end of the line (e.g. at the end of the file) still get one indicator.
    const std::size_t remaining = column < cited_code.length() ? cited_code.length() - column : 1;
    const std::size_t indicator_length
        = std::max(std::min(std::size_t(span.length()), remaining), std::size_t { 1 });
    std::pmr::u8string indicator { out.get_allocator() };
    indicator += u8'^';
    indicator.append(indicator_length - 1, u8'~');
    append_highlighted(out, indicator, Diagnostic_Highlight::position_indicator, colors);
    out += u8'\n';
}

void print_diagnostic(
    std::pmr::u8string& out,
    const Diagnostic& diagnostic,
    const Source_Map& sources,
    bool colors
)
{
    std::pmr::u8string tag { severity_tag(diagnostic.severity), out.get_allocator() };
    tag += u8':';
    append_highlighted(out, tag, severity_highlight(diagnostic.severity), colors);
    out += u8' ';

    if (diagnostic.location) {
        print_file_position(out, sources.resolve_span(*diagnostic.location), colors);
        out += u8' ';
    }
    append_highlighted(out, diagnostic.message, Diagnostic_Highlight::text, colors);
    out += u8' ';

    std::pmr::u8string id { out.get_allocator() };
    id += u8'[';
    id += diagnostic.id;
    id += u8']';
    append_highlighted(out, id, Diagnostic_Highlight::id, colors);
    out += u8'\n';

    if (diagnostic.location) {
        const Source_File& file = sources.file(diagnostic.location->file);
        print_affected_line(out, file, *diagnostic.location, colors);
    }
}

void print_io_error(
    std::pmr::u8string& out,
    std::u8string_view file,
    IO_Error_Code error,
    bool colors,
    std::error_code system_error
)
{
    append_highlighted(out, u8"ERROR:", Diagnostic_Highlight::error, colors);
    out += u8' ';
    std::pmr::u8string location { file, out.get_allocator() };
    location += u8':';
    append_highlighted(out, location, Diagnostic_Highlight::code_position, colors);
    out += u8' ';
    std::pmr::u8string description { io_error_description(error), out.get_allocator() };
    if (system_error) {
        const std::string reason = system_error.message();
        description += u8" (";
        description += as_u8string_view(reason);
        description += u8')';
    }
    append_highlighted(out, description, Diagnostic_Highlight::text, colors);
    out += u8' ';
    std::pmr::u8string id { out.get_allocator() };
    id += u8'[';
    id += diagnostic::file_io;
    id += u8']';
    append_highlighted(out, id, Diagnostic_Highlight::id, colors);
    out += u8'\n';
}

Result<void, IO_Error_Code> print_diagnostics(
    std::FILE* stream,
    const Diagnostics& diagnostics,
    const Source_Map& sources,
    bool colors
)
{
    std::pmr::u8string out;
    for (const Diagnostic& diagnostic : diagnostics) {
        print_diagnostic(out, diagnostic, sources, colors);
    }
    return bytes_to_stream(out.data(), out.size(), stream);
}

} // namespace slopcc
