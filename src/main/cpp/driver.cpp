#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <memory_resource>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "slopcc/util/io.hpp"
#include "slopcc/util/result.hpp"
#include "slopcc/util/strings.hpp"
#include "slopcc/util/to_chars.hpp"

#include "slopcc/cli.hpp"
#include "slopcc/diagnostic.hpp"
#include "slopcc/driver.hpp"
#include "slopcc/fwd.hpp"
#include "slopcc/lex.hpp"
#include "slopcc/memory_resources.hpp"
#include "slopcc/print.hpp"
#include "slopcc/settings.hpp"
#include "slopcc/source.hpp"
#include "slopcc/token.hpp"

namespace slopcc {
namespace {

[[nodiscard]]
bool write(std::FILE* stream, std::u8string_view text)
{
    return bytes_to_stream(text.data(), text.size(), stream).has_value();
}

void append_list(
    std::pmr::u8string& out,
    std::u8string_view label,
    std::span<const std::string> items
)
{
    for (const std::string& item : items) {
        out += label;
        out += as_u8string_view(item);
        out += u8'\n';
    }
}

void print_verbose_header(std::pmr::u8string& out, const Cli_Options& options)
{
    out += u8"slopcc version ";
    out += version;
    out += u8'\n';
    if (!options.std.empty()) {
        out += u8"standard: ";
        out += as_u8string_view(options.std);
        out += u8'\n';
    }
    if (!options.opt.empty()) {
        out += u8"optimization level: ";
        out += as_u8string_view(options.opt);
        out += u8'\n';
    }
    append_list(out, u8"include directory: ", options.include_dirs);
    append_list(out, u8"define: ", options.defines);
    append_list(out, u8"undefine: ", options.undefs);
}

void dump_tokens(
    std::pmr::u8string& out,
    std::span<const Token> tokens,
    const Source_File& file
)
{
    for (const Token& token : tokens) {
        const Line_Column position = file.line_column(token.span.start);
        out += file.name();
        out += u8':';
        out += to_characters8(position.line);
        out += u8':';
        out += to_characters8(position.column);
        out += u8' ';
        out += token_kind_name(token.kind);
        out += u8" \"";
        append_escaped(out, token.text(file.text()));
        out += u8"\"\n";
    }
}

/// @brief Appends the text of `tokens`, with every comment replaced by a single space.
void append_preprocessed(
    std::pmr::u8string& out,
    std::span<const Token> tokens,
    std::u8string_view source
)
{
    for (const Token& token : tokens) {
        if (token.kind == Token_Kind::comment) {
            out += u8' ';
        }
        else {
            out += token.text(source);
        }
    }
}

} // namespace

void append_escaped(std::pmr::u8string& out, std::u8string_view text)
{
    constexpr std::u8string_view hex_digits = u8"0123456789abcdef";
    for (const char8_t c : text) {
        switch (c) {
        case u8'\n': out += u8"\\n"; break;
        case u8'\r': out += u8"\\r"; break;
        case u8'\t': out += u8"\\t"; break;
        case u8'\v': out += u8"\\v"; break;
        case u8'\f': out += u8"\\f"; break;
        case u8'\\': out += u8"\\\\"; break;
        case u8'"': out += u8"\\\""; break;
        default: {
            if (c < 0x20 || c == 0x7f) {
                out += u8"\\x";
                out += hex_digits[c >> 4];
                out += hex_digits[c & 0xf];
            }
            else {
                out += c;
            }
        }
        }
    }
}

Exit_Code run(const Cli_Options& options, std::FILE* out, std::FILE* err, bool colors)
{
    Global_Memory_Resource global_memory;
    std::pmr::unsynchronized_pool_resource memory { &global_memory };

    if (options.show_help) {
        return write(out, as_u8string_view(options.help_text)) ? Exit_Code::success
                                                               : Exit_Code::failure;
    }
    if (options.show_version) {
        std::pmr::u8string text { u8"slopcc ", &memory };
        text += version;
        text += u8'\n';
        return write(out, text) ? Exit_Code::success : Exit_Code::failure;
    }

    std::pmr::u8string err_text { &memory };
    if (options.verbose) {
        print_verbose_header(err_text, options);
    }

    Source_Map sources { &memory };
    std::pmr::vector<File_Id> files { &memory };
    for (const std::string& input : options.inputs) {
        const Result<File_Id, Source_Error> result = input == "-"
            ? sources.add_stdin_from_stream(stdin)
            : sources.add_file_from_path(std::filesystem::path { input });
        if (!result) {
            print_io_error(
                err_text, as_u8string_view(input), result.error().code, colors,
                result.error().system_error
            );
            // The run fails either way, so a failure to report the error changes nothing.
            (void)write(err, err_text);
            return Exit_Code::failure;
        }
        files.push_back(*result);
    }

    if (options.dry_run) {
        std::pmr::u8string text { &memory };
        for (const std::string& input : options.inputs) {
            text += u8"would compile: ";
            text += as_u8string_view(input);
            text += u8'\n';
        }
        if (!err_text.empty() && !write(err, err_text)) {
            return Exit_Code::failure;
        }
        return write(out, text) ? Exit_Code::success : Exit_Code::failure;
    }

    Diagnostics diagnostics { &memory, options.min_severity };
    std::pmr::u8string out_text { &memory };
    std::pmr::vector<Token> tokens { &memory };

    for (const File_Id id : files) {
        const Source_File& file = sources.file(id);
        if (options.verbose) {
            err_text += u8"tokenizing ";
            err_text += file.name();
            err_text += u8'\n';
        }
        tokens.clear();
        tokenize(tokens, file.text(), id);
        diagnose_tokens(tokens, file.text(), diagnostics);

        if (options.dump_tokens) {
            dump_tokens(out_text, tokens, file);
        }
        else if (options.mode == Compile_Mode::preprocess_only) {
            append_preprocessed(out_text, tokens, file.text());
        }
    }

    for (const Diagnostic& diagnostic : diagnostics) {
        print_diagnostic(err_text, diagnostic, sources, colors);
    }

    const bool tokenizing_only
        = options.dump_tokens || options.mode == Compile_Mode::preprocess_only;
    if (!tokenizing_only && !diagnostics.has_errors()) {
        append_highlighted(err_text, u8"ERROR:", Diagnostic_Highlight::error, colors);
        err_text += u8" Compilation past preprocessing tokenization is not implemented. ";
        std::pmr::u8string id { u8"[", &memory };
        id += diagnostic::not_implemented;
        id += u8']';
        append_highlighted(err_text, id, Diagnostic_Highlight::id, colors);
        err_text += u8'\n';
    }

    if (!err_text.empty() && !write(err, err_text)) {
        return Exit_Code::failure;
    }

    if (tokenizing_only) {
        if (options.output.empty()) {
            if (!write(out, out_text)) {
                return Exit_Code::failure;
            }
        }
        else {
            const std::filesystem::path output_path { options.output };
            const Result<void, IO_Error_Code> written
                = bytes_to_file(out_text.data(), out_text.size(), output_path);
            if (!written) {
                std::pmr::u8string error_text { &memory };
                print_io_error(error_text, as_u8string_view(options.output), written.error(), colors);
                // As above, the run fails whether or not this message can be written.
                (void)write(err, error_text);
                return Exit_Code::failure;
            }
        }
    }

    return tokenizing_only && !diagnostics.has_errors() ? Exit_Code::success : Exit_Code::failure;
}

} // namespace slopcc
