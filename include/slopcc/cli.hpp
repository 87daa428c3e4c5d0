#ifndef SLOPCC_CLI_HPP
#define SLOPCC_CLI_HPP

#include <span>
#include <string>
#include <vector>

#include "slopcc/util/result.hpp"
#include "slopcc/util/severity.hpp"

#include "slopcc/fwd.hpp"

namespace slopcc {

/// @brief The last translation phase which the driver should perform.
enum struct Compile_Mode : Default_Underlying {
    /// @brief `-E`
    preprocess_only,
    /// @brief `-S`
    compile_only,
    /// @brief `-c`
    assemble_only,
    link,
};

struct Cli_Options {
    /// @brief The input files, where `"-"` denotes standard input.
    std::vector<std::string> inputs;
    /// @brief The `-o` output file, or empty to write to standard output.
    std::string output;
    Compile_Mode mode = Compile_Mode::link;
    std::vector<std::string> include_dirs;
    std::vector<std::string> defines;
    std::vector<std::string> undefs;
    /// @brief The language standard given by `-std=`, or empty.
    std::string std;
    /// @brief The optimization level given by `-O`, or empty.
    std::string opt;
    Severity min_severity = Severity::min;
    bool verbose = false;
    bool dry_run = false;
    bool dump_tokens = false;
    bool show_version = false;
    bool show_help = false;
    /// @brief The usage text, only filled when `show_help` is `true`.
    std::string help_text;
};

struct Cli_Error {
    std::string message;
};

/// @brief Rewrites GCC-style spellings which the argument parser does not understand
/// (`-std=c11` becomes `--std=c11`, a bare `-O` becomes `-O1`).
[[nodiscard]]
std::vector<std::string> normalize_gcc_arguments(std::span<const char* const> args);

/// @brief Parses the command line, including the program name in `args[0]`.
/// Missing input files are an error unless `--version` or `--help` is given.
[[nodiscard]]
Result<Cli_Options, Cli_Error> parse_command_line(std::span<const char* const> args);

} // namespace slopcc

#endif
