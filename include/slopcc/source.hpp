#ifndef SLOPCC_SOURCE_HPP
#define SLOPCC_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <deque>
#include <filesystem>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "slopcc/util/io.hpp"
#include "slopcc/util/result.hpp"

#include "slopcc/fwd.hpp"
#include "slopcc/span.hpp"

namespace slopcc {

/// @brief A 1-based line and column pair.
/// Columns count bytes, not characters.
struct Line_Column {
    std::uint32_t line;
    std::uint32_t column;

    [[nodiscard]]
    friend constexpr bool operator==(const Line_Column&, const Line_Column&)
        = default;
};

/// @brief A `Span` resolved to a human-readable location.
struct Resolved_Span {
    /// @brief The path of the file, or `"stdin"`.
    std::u8string_view name;
    std::uint32_t line;
    std::uint32_t column;
    std::uint32_t length;

    [[nodiscard]]
    friend constexpr bool operator==(const Resolved_Span&, const Resolved_Span&)
        = default;
};

/// @brief The error produced when a source file cannot be loaded.
struct Source_Error {
    /// @brief The path of the file, or an empty path when reading standard input.
    std::filesystem::path path;
    IO_Error_Code code;
    /// @brief The reason reported by the operating system, such as `no_such_file_or_directory`.
    std::error_code system_error;
};

/// @brief The immutable contents of one registered input, together with a table of line starts.
struct Source_File {
private:
    File_Id m_id;
    std::optional<std::filesystem::path> m_path;
    std::pmr::u8string m_name;
    std::pmr::u8string m_text;
    std::pmr::vector<Byte_Pos> m_line_starts;

public:
    /// @brief Constructs a file from its text.
    /// @param path the path of the file, or `std::nullopt` for standard input
    [[nodiscard]]
    Source_File(
        File_Id id,
        std::optional<std::filesystem::path> path,
        std::u8string_view text,
        std::pmr::memory_resource* memory
    );

    [[nodiscard]]
    File_Id id() const noexcept
    {
        return m_id;
    }

    [[nodiscard]]
    const std::optional<std::filesystem::path>& path() const noexcept
    {
        return m_path;
    }

    /// @brief Returns the display name of this file:
    /// the generic path if there is one, otherwise `"stdin"`.
    [[nodiscard]]
    std::u8string_view name() const noexcept
    {
        return m_name;
    }

    [[nodiscard]]
    std::u8string_view text() const noexcept
    {
        return m_text;
    }

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_text.size();
    }

    /// @brief Returns the ascending byte offsets at which each line begins.
    /// The first element is always zero.
    /// A trailing new-line does not begin another line.
    [[nodiscard]]
    std::span<const Byte_Pos> line_starts() const noexcept
    {
        return m_line_starts;
    }

    [[nodiscard]]
    std::size_t line_count() const noexcept
    {
        return m_line_starts.size();
    }

    /// @brief Returns the 1-based line and column of `offset`.
    /// Offsets past the end of the file are clamped to the end of the file.
    [[nodiscard]]
    Line_Column line_column(Byte_Pos offset) const;

    /// @brief Returns the text of the line with the zero-based index `line_index`,
    /// without its terminating new-line character.
    [[nodiscard]]
    std::u8string_view line_text(std::size_t line_index) const;
};

/// @brief Computes the table of line start offsets as described by `Source_File::line_starts`.
void compute_line_starts(std::pmr::vector<Byte_Pos>& out, std::u8string_view text);

/// @brief Owns every source file of a compilation and hands out `File_Id`s.
/// Ids are indices into the registration order and are never reused.
/// References to registered files remain valid for the lifetime of the map.
struct Source_Map {
private:
    std::pmr::deque<Source_File> m_files;

public:
    [[nodiscard]]
    explicit Source_Map(std::pmr::memory_resource* memory = std::pmr::get_default_resource())
        : m_files { memory }
    {
    }

    Source_Map(const Source_Map&) = delete;
    Source_Map& operator=(const Source_Map&) = delete;

    /// @brief Registers a file whose contents have already been read.
    [[nodiscard]]
    File_Id add_file(std::filesystem::path path, std::u8string_view text);

    /// @brief Registers the given text as the contents of standard input.
    [[nodiscard]]
    File_Id add_stdin(std::u8string_view text);

    /// @brief Reads the file at `path` and registers it.
    [[nodiscard]]
    Result<File_Id, Source_Error> add_file_from_path(const std::filesystem::path& path);

    /// @brief Reads `stream` (by default, standard input) to its end
    /// and registers the result as standard input.
    [[nodiscard]]
    Result<File_Id, Source_Error> add_stdin_from_stream(std::FILE* stream = stdin);

    /// @brief Returns the file identified by `id`.
    /// An `id` not issued by this map is a contract violation.
    [[nodiscard]]
    const Source_File& file(File_Id id) const;

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_files.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_files.empty();
    }

    /// @brief Resolves `span` to a file name, 1-based line and column, and length.
    /// Offsets past the end of the file are clamped.
    [[nodiscard]]
    Resolved_Span resolve_span(const Span& span) const;

private:
    [[nodiscard]]
    File_Id add(std::optional<std::filesystem::path> path, std::u8string_view text);
};

} // namespace slopcc

#endif
