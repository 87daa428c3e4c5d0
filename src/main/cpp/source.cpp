#include <algorithm>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory_resource>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "slopcc/util/assert.hpp"
#include "slopcc/util/io.hpp"
#include "slopcc/util/result.hpp"
#include "slopcc/util/strings.hpp"
#include "slopcc/util/to_chars.hpp"

#include "slopcc/fwd.hpp"
#include "slopcc/settings.hpp"
#include "slopcc/source.hpp"
#include "slopcc/span.hpp"

namespace slopcc {

void compute_line_starts(std::pmr::vector<Byte_Pos>& out, std::u8string_view text)
{
    out.push_back(0);
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == u8'\n' && i + 1 < text.size()) {
            out.push_back(Byte_Pos(i + 1));
        }
    }
}

Source_File::Source_File(
    File_Id id,
    std::optional<std::filesystem::path> path,
    std::u8string_view text,
    std::pmr::memory_resource* memory
)
    : m_id { id }
    , m_path { std::move(path) }
    , m_name { memory }
    , m_text { text, memory }
    , m_line_starts { memory }
{
    if (m_path) {
        const std::u8string generic = m_path->generic_u8string();
        m_name.assign(generic.begin(), generic.end());
    }
    else {
        m_name = u8"stdin";
    }
    compute_line_starts(m_line_starts, m_text);
}

Line_Column Source_File::line_column(Byte_Pos offset) const
{
    if (m_text.empty()) {
        return { .line = 1, .column = 1 };
    }
    offset = std::min(offset, Byte_Pos(m_text.size()));

    // The first line start is zero, so the upper bound is never the first element.
    const auto next_line = std::ranges::upper_bound(m_line_starts, offset);
    SLOPCC_DEBUG_ASSERT(next_line != m_line_starts.begin());
    const auto line_index = std::size_t(next_line - m_line_starts.begin()) - 1;

    return { .line = std::uint32_t(line_index + 1),
             .column = offset - m_line_starts[line_index] + 1 };
}

std::u8string_view Source_File::line_text(std::size_t line_index) const
{
    SLOPCC_ASSERT(line_index < m_line_starts.size());
    const std::size_t begin = m_line_starts[line_index];
    const std::size_t end
        = line_index + 1 < m_line_starts.size() ? m_line_starts[line_index + 1] : m_text.size();

    std::u8string_view result = std::u8string_view { m_text }.substr(begin, end - begin);
    if (result.ends_with(u8'\n')) {
        result.remove_suffix(1);
    }
    return result;
}

File_Id Source_Map::add(std::optional<std::filesystem::path> path, std::u8string_view text)
{
    if (text.size() > max_source_size) {
        std::pmr::u8string message { u8"source file of ", m_files.get_allocator().resource() };
        message += to_characters8(text.size());
        message += u8" bytes exceeds the limit of ";
        message += to_characters8(max_source_size);
        message += u8" bytes";
        contract_violation(message);
    }
    const auto id = File_Id(m_files.size());
    m_files.emplace_back(id, std::move(path), text, m_files.get_allocator().resource());
    return id;
}

File_Id Source_Map::add_file(std::filesystem::path path, std::u8string_view text)
{
    return add(std::move(path), text);
}

File_Id Source_Map::add_stdin(std::u8string_view text)
{
    return add(std::nullopt, text);
}

Result<File_Id, Source_Error> Source_Map::add_file_from_path(const std::filesystem::path& path)
{
    std::pmr::vector<char8_t> bytes { m_files.get_allocator().resource() };
    std::error_code system_error;
    const Result<void, IO_Error_Code> result = file_to_bytes(bytes, path, &system_error);
    if (!result) {
        return Source_Error { .path = path,
                              .code = result.error(),
                              .system_error = system_error };
    }
    return add_file(path, as_u8string_view(bytes));
}

Result<File_Id, Source_Error> Source_Map::add_stdin_from_stream(std::FILE* stream)
{
    std::pmr::vector<char8_t> bytes { m_files.get_allocator().resource() };
    std::error_code system_error;
    const Result<void, IO_Error_Code> result = stream_to_bytes(bytes, stream, &system_error);
    if (!result) {
        return Source_Error { .path = {},
                              .code = result.error(),
                              .system_error = system_error };
    }
    return add_stdin(as_u8string_view(bytes));
}

const Source_File& Source_Map::file(File_Id id) const
{
    const auto index = std::size_t(id);
    if (index >= m_files.size()) {
        std::pmr::u8string message { u8"invalid file id ", m_files.get_allocator().resource() };
        message += to_characters8(index);
        message += u8" (";
        message += to_characters8(m_files.size());
        message += u8" files registered)";
        contract_violation(message);
    }
    return m_files[index];
}

Resolved_Span Source_Map::resolve_span(const Span& span) const
{
    const Source_File& source = file(span.file);
    const Line_Column position = source.line_column(span.start);
    return { .name = source.name(),
             .line = position.line,
             .column = position.column,
             .length = span.end >= span.start ? span.end - span.start : 0 };
}

} // namespace slopcc
