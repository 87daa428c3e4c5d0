#include <initializer_list>
#include <span>
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "slopcc/util/result.hpp"
#include "slopcc/util/severity.hpp"

#include "slopcc/cli.hpp"

namespace slopcc {
namespace {

[[nodiscard]]
Result<Cli_Options, Cli_Error> parse(std::initializer_list<const char*> args)
{
    const std::vector<const char*> argv { args };
    return parse_command_line(argv);
}

TEST(Cli, normalize_gcc_arguments)
{
    const std::vector<const char*> args { "slopcc", "-std=c11", "-std", "c99", "-O", "-O2", "x.c" };
    const std::vector<std::string> expected {
        "slopcc", "--std=c11", "--std", "c99", "-O1", "-O2", "x.c",
    };
    EXPECT_EQ(normalize_gcc_arguments(args), expected);
}

TEST(Cli, single_input)
{
    const auto result = parse({ "slopcc", "main.c" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->inputs, std::vector<std::string> { "main.c" });
    EXPECT_EQ(result->mode, Compile_Mode::link);
    EXPECT_TRUE(result->output.empty());
    EXPECT_FALSE(result->dump_tokens);
    EXPECT_FALSE(result->dry_run);
    EXPECT_EQ(result->min_severity, Severity::min);
}

TEST(Cli, gcc_style_options)
{
    const auto result = parse({ "slopcc", "-E", "-o", "out.i", "-Iinclude", "-I", "other",
                                "-DNDEBUG", "-DX=1", "-UY", "-std=c11", "-O2", "-v", "a.c", "b.c" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->mode, Compile_Mode::preprocess_only);
    EXPECT_EQ(result->output, "out.i");
    EXPECT_EQ(result->include_dirs, (std::vector<std::string> { "include", "other" }));
    EXPECT_EQ(result->defines, (std::vector<std::string> { "NDEBUG", "X=1" }));
    EXPECT_EQ(result->undefs, std::vector<std::string> { "Y" });
    EXPECT_EQ(result->std, "c11");
    EXPECT_EQ(result->opt, "2");
    EXPECT_TRUE(result->verbose);
    EXPECT_EQ(result->inputs, (std::vector<std::string> { "a.c", "b.c" }));
}

TEST(Cli, modes)
{
    EXPECT_EQ(parse({ "slopcc", "-S", "a.c" })->mode, Compile_Mode::compile_only);
    EXPECT_EQ(parse({ "slopcc", "-c", "a.c" })->mode, Compile_Mode::assemble_only);
    EXPECT_EQ(parse({ "slopcc", "-E", "a.c" })->mode, Compile_Mode::preprocess_only);
}

TEST(Cli, bare_optimization_flag)
{
    const auto result = parse({ "slopcc", "-O", "a.c" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->opt, "1");
}

TEST(Cli, stdin_input)
{
    const auto result = parse({ "slopcc", "--dump-tokens", "-" });
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->dump_tokens);
    EXPECT_EQ(result->inputs, std::vector<std::string> { "-" });
}

TEST(Cli, dry_run)
{
    const auto result = parse({ "slopcc", "-###", "a.c" });
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->dry_run);
}

TEST(Cli, severity)
{
    const auto result = parse({ "slopcc", "--severity", "error", "a.c" });
    ASSERT_TRUE(result);
    EXPECT_EQ(result->min_severity, Severity::error);

    EXPECT_FALSE(parse({ "slopcc", "--severity", "loud", "a.c" }));
}

TEST(Cli, no_input_files)
{
    const auto result = parse({ "slopcc" });
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().message, "no input files");
}

TEST(Cli, version_without_inputs)
{
    const auto result = parse({ "slopcc", "--version" });
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->show_version);
}

TEST(Cli, help)
{
    const auto result = parse({ "slopcc", "--help" });
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->show_help);
    EXPECT_NE(result->help_text.find("dump-tokens"), std::string::npos);
}

TEST(Cli, unknown_option)
{
    EXPECT_FALSE(parse({ "slopcc", "--frobnicate", "a.c" }));
}

} // namespace
} // namespace slopcc
