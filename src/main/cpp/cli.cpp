#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#define ARGS_NOEXCEPT
#include "args.hxx"

#include "slopcc/util/result.hpp"
#include "slopcc/util/severity.hpp"

#include "slopcc/cli.hpp"

namespace slopcc {

std::vector<std::string> normalize_gcc_arguments(std::span<const char* const> args)
{
    std::vector<std::string> result;
    result.reserve(args.size());
    for (const char* const arg : args) {
        const std::string_view s = arg;
        if (s.starts_with("-std=")) {
            result.push_back("--std=" + std::string(s.substr(5)));
        }
        else if (s == "-std") {
            result.emplace_back("--std");
        }
        else if (s == "-O") {
            result.emplace_back("-O1");
        }
        else {
            result.emplace_back(s);
        }
    }
    return result;
}

Result<Cli_Options, Cli_Error> parse_command_line(std::span<const char* const> args)
{
    static const std::unordered_map<std::string, Severity> severity_arg_map {
        { "note", Severity::note },
        { "warning", Severity::warning },
        { "error", Severity::error },
        { "none", Severity::none },
    };

    args::ArgumentParser parser { "Tokenizes C source files." };
    parser.Prog("slopcc");
    parser.helpParams.width = 100;
    parser.helpParams.addChoices = true;

    args::PositionalList<std::string> inputs_arg {
        parser,
        "input",
        "Input C files (- for standard input)",
    };
    args::Flag preprocess_arg { parser, "preprocess", "Stop after preprocessing", { 'E' } };
    args::Flag compile_arg { parser, "compile", "Stop after compilation to assembly", { 'S' } };
    args::Flag assemble_arg { parser, "assemble", "Stop after assembling", { 'c' } };
    args::ValueFlag<std::string> output_arg { parser, "file", "Output file", { 'o' } };
    args::ValueFlagList<std::string> include_arg {
        parser,
        "dir",
        "Add an include search directory",
        { 'I' },
    };
    args::ValueFlagList<std::string> define_arg { parser, "macro", "Define a macro", { 'D' } };
    args::ValueFlagList<std::string> undef_arg { parser, "macro", "Undefine a macro", { 'U' } };
    args::ValueFlag<std::string> std_arg { parser, "std", "Language standard", { "std" } };
    args::ValueFlag<std::string> opt_arg { parser, "level", "Optimization level", { 'O' } };
    args::Flag verbose_arg { parser, "verbose", "Print what the driver does", { 'v' } };
    args::CounterFlag dry_run_arg {
        parser,
        "dry-run",
        "Print what would be compiled without compiling (-###)",
        { '#' },
    };
    args::Flag dump_tokens_arg {
        parser,
        "dump-tokens",
        "Print the preprocessing tokens of every input",
        { "dump-tokens" },
    };
    args::MapFlag<std::string, Severity> severity_arg {
        parser,
        "severity",
        "Minimum (>=) severity for diagnostics",
        { "severity" },
        severity_arg_map,
        Severity::min,
    };
    args::Flag version_arg { parser, "version", "Print the version", { "version" } };
    args::HelpFlag help_arg {
        parser, "help", "Display this help menu", { 'h', "help" }, args::Options::Global
    };

    const std::vector<std::string> normalized = normalize_gcc_arguments(args);
    if (normalized.empty()) {
        return Cli_Error { "no program name" };
    }
    parser.ParseArgs(normalized.begin() + 1, normalized.end());

    Cli_Options result;
    if (parser.GetError() == args::Error::Help || help_arg.Matched()) {
        std::ostringstream help;
        parser.Help(help);
        result.show_help = true;
        result.help_text = std::move(help).str();
        return result;
    }
    if (parser.GetError() != args::Error::None) {
        return Cli_Error { parser.GetErrorMsg() };
    }

    result.inputs = args::get(inputs_arg);
    result.output = args::get(output_arg);
    result.mode = preprocess_arg ? Compile_Mode::preprocess_only
        : compile_arg            ? Compile_Mode::compile_only
        : assemble_arg           ? Compile_Mode::assemble_only
                                 : Compile_Mode::link;
    result.include_dirs = args::get(include_arg);
    result.defines = args::get(define_arg);
    result.undefs = args::get(undef_arg);
    result.std = args::get(std_arg);
    result.opt = args::get(opt_arg);
    result.min_severity = args::get(severity_arg);
    result.verbose = verbose_arg.Matched();
    result.dry_run = args::get(dry_run_arg) > 0;
    result.dump_tokens = dump_tokens_arg.Matched();
    result.show_version = version_arg.Matched();

    if (!result.show_version && result.inputs.empty()) {
        return Cli_Error { "no input files" };
    }
    return result;
}

} // namespace slopcc
