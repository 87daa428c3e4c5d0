#include <cstdio>
#include <filesystem>
#include <memory_resource>
#include <string_view>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

#include "slopcc/util/io.hpp"
#include "slopcc/util/result.hpp"

#include "slopcc/fwd.hpp"
#include "slopcc/source.hpp"
#include "slopcc/span.hpp"

namespace slopcc {
namespace {

[[nodiscard]]
std::pmr::vector<Byte_Pos> line_starts_of(std::u8string_view text)
{
    std::pmr::vector<Byte_Pos> result;
    compute_line_starts(result, text);
    return result;
}

TEST(Line_Starts, basic)
{
    EXPECT_EQ(line_starts_of(u8""), (std::pmr::vector<Byte_Pos> { 0 }));
    EXPECT_EQ(line_starts_of(u8"abc"), (std::pmr::vector<Byte_Pos> { 0 }));
    EXPECT_EQ(line_starts_of(u8"a\nb\nc"), (std::pmr::vector<Byte_Pos> { 0, 2, 4 }));
    EXPECT_EQ(line_starts_of(u8"\n\n"), (std::pmr::vector<Byte_Pos> { 0, 1 }));
}

TEST(Line_Starts, trailing_newline_adds_no_line)
{
    EXPECT_EQ(line_starts_of(u8"a\n"), (std::pmr::vector<Byte_Pos> { 0 }));
    EXPECT_EQ(line_starts_of(u8"a\nb\n"), (std::pmr::vector<Byte_Pos> { 0, 2 }));
}

TEST(Source_File, line_column)
{
    Source_Map sources;
    const File_Id id = sources.add_file("a.c", u8"int x;\nint y;\n");
    const Source_File& file = sources.file(id);

    EXPECT_EQ(file.line_count(), 2);
    EXPECT_EQ(file.line_column(0), (Line_Column { 1, 1 }));
    EXPECT_EQ(file.line_column(4), (Line_Column { 1, 5 }));
    EXPECT_EQ(file.line_column(6), (Line_Column { 1, 7 }));
    EXPECT_EQ(file.line_column(7), (Line_Column { 2, 1 }));
    EXPECT_EQ(file.line_column(11), (Line_Column { 2, 5 }));
    // The end of the file and anything past it are on the last line.
    EXPECT_EQ(file.line_column(14), (Line_Column { 2, 8 }));
    EXPECT_EQ(file.line_column(1000), (Line_Column { 2, 8 }));
}

TEST(Source_File, line_column_of_empty_file)
{
    Source_Map sources;
    const Source_File& file = sources.file(sources.add_stdin(u8""));
    EXPECT_EQ(file.line_count(), 1);
    EXPECT_EQ(file.line_column(0), (Line_Column { 1, 1 }));
    EXPECT_EQ(file.line_column(3), (Line_Column { 1, 1 }));
}

TEST(Source_File, line_text)
{
    Source_Map sources;
    const Source_File& file = sources.file(sources.add_file("a.c", u8"first\nsecond\nthird\n"));
    ASSERT_EQ(file.line_count(), 3);
    EXPECT_EQ(file.line_text(0), u8"first");
    EXPECT_EQ(file.line_text(1), u8"second");
    EXPECT_EQ(file.line_text(2), u8"third");
}

TEST(Source_File, names)
{
    Source_Map sources;
    const Source_File& named = sources.file(sources.add_file("dir/a.c", u8""));
    EXPECT_EQ(named.name(), u8"dir/a.c");
    ASSERT_TRUE(named.path());
    EXPECT_EQ(*named.path(), std::filesystem::path("dir/a.c"));

    const Source_File& input = sources.file(sources.add_stdin(u8"x"));
    EXPECT_EQ(input.name(), u8"stdin");
    EXPECT_FALSE(input.path());
    EXPECT_EQ(input.text(), u8"x");
    EXPECT_EQ(input.size(), 1);
}

TEST(Source_Map, ids_are_sequential)
{
    Source_Map sources;
    EXPECT_TRUE(sources.empty());
    const File_Id a = sources.add_file("a.c", u8"a");
    const File_Id b = sources.add_stdin(u8"b");
    const File_Id c = sources.add_file("c.c", u8"c");
    EXPECT_EQ(a, File_Id(0));
    EXPECT_EQ(b, File_Id(1));
    EXPECT_EQ(c, File_Id(2));
    EXPECT_EQ(sources.size(), 3);

    EXPECT_EQ(sources.file(a).id(), a);
    EXPECT_EQ(sources.file(c).text(), u8"c");
}

TEST(Source_Map, references_remain_valid)
{
    Source_Map sources;
    const Source_File& first = sources.file(sources.add_file("0.c", u8"zero"));
    for (int i = 0; i < 1000; ++i) {
        static_cast<void>(sources.add_stdin(u8"more"));
    }
    EXPECT_EQ(first.text(), u8"zero");
    EXPECT_EQ(&first, &sources.file(File_Id(0)));
}

TEST(Source_Map, resolve_span)
{
    Source_Map sources;
    const File_Id id = sources.add_file("main.c", u8"int main() {\n    return 0;\n}\n");
    const Resolved_Span resolved = sources.resolve_span(Span { id, 17, 23 });
    EXPECT_EQ(resolved.name, u8"main.c");
    EXPECT_EQ(resolved.line, 2);
    EXPECT_EQ(resolved.column, 5);
    EXPECT_EQ(resolved.length, 6);

    const Resolved_Span end = sources.resolve_span(Span::at(id, 29));
    EXPECT_EQ(end, (Resolved_Span { u8"main.c", 3, 3, 0 }));
}

TEST(Source_Map, add_file_from_path)
{
    Source_Map sources;
    const Result<File_Id, Source_Error> result = sources.add_file_from_path("test/source/lines.txt");
    ASSERT_TRUE(result);
    const Source_File& file = sources.file(*result);

    EXPECT_EQ(file.name(), u8"test/source/lines.txt");
    EXPECT_EQ(file.text(), u8"first line\nsecond\r\nthird");
    ASSERT_EQ(file.line_count(), 3);
    EXPECT_EQ(file.line_starts()[1], 11);
    EXPECT_EQ(file.line_starts()[2], 19);
    EXPECT_EQ(file.line_text(1), u8"second\r");
    EXPECT_EQ(file.line_column(19), (Line_Column { 3, 1 }));
}

TEST(Source_Map, add_file_from_missing_path)
{
    Source_Map sources;
    const Result<File_Id, Source_Error> result
        = sources.add_file_from_path("test/source/does-not-exist.c");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, IO_Error_Code::cannot_open);
    EXPECT_EQ(io_error_code_name(result.error().code), u8"cannot_open");
    EXPECT_EQ(result.error().system_error, std::errc::no_such_file_or_directory);
    EXPECT_EQ(result.error().path, std::filesystem::path("test/source/does-not-exist.c"));
    EXPECT_TRUE(sources.empty());
}

TEST(Source_Map, add_file_from_directory)
{
    Source_Map sources;
    const Result<File_Id, Source_Error> result = sources.add_file_from_path("test/source");
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, IO_Error_Code::cannot_open);
    EXPECT_EQ(result.error().system_error, std::errc::is_a_directory);
}

TEST(Source_Map, add_stdin_from_stream)
{
    std::FILE* const stream = std::tmpfile();
    ASSERT_NE(stream, nullptr);
    const Unique_File owner { stream };

    constexpr std::u8string_view text = u8"x = 1;\n";
    ASSERT_EQ(std::fwrite(text.data(), 1, text.size(), stream), text.size());
    std::rewind(stream);

    Source_Map sources;
    const Result<File_Id, Source_Error> result = sources.add_stdin_from_stream(stream);
    ASSERT_TRUE(result);
    EXPECT_EQ(sources.file(*result).name(), u8"stdin");
    EXPECT_EQ(sources.file(*result).text(), text);
}

TEST(Source_Map_Death, invalid_file_id)
{
    EXPECT_DEATH(
        {
            Source_Map sources;
            static_cast<void>(sources.add_stdin(u8""));
            static_cast<void>(sources.file(File_Id(5)));
        },
        "invalid file id 5 \\(1 files registered\\)"
    );
}

} // namespace
} // namespace slopcc
