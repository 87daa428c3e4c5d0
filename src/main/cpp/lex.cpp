#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

#include "slopcc/util/assert.hpp"
#include "slopcc/util/chars.hpp"
#include "slopcc/util/severity.hpp"

#include "slopcc/cursor.hpp"
#include "slopcc/diagnostic.hpp"
#include "slopcc/fwd.hpp"
#include "slopcc/lex.hpp"
#include "slopcc/settings.hpp"
#include "slopcc/span.hpp"
#include "slopcc/token.hpp"

namespace slopcc {

Lexer::Lexer(std::u8string_view source, File_Id file)
    : m_cursor { source }
    , m_source { source }
    , m_file { file }
{
    SLOPCC_ASSERT(source.size() <= max_source_size);
}

Token Lexer::make_token(std::size_t start, Token_Kind kind) const
{
    const std::size_t end = m_cursor.position();
    SLOPCC_ASSERT(start <= end);
    SLOPCC_ASSERT(end <= m_source.size());
    if constexpr (is_debug_build) {
        if (const std::u8string_view spelling = token_kind_spelling(kind); !spelling.empty()) {
            SLOPCC_ASSERT(m_source.substr(start, end - start) == spelling);
        }
    }
    return { .kind = kind,
             .span = { .file = m_file, .start = Byte_Pos(start), .end = Byte_Pos(end) } };
}

Token Lexer::next_token()
{
    const std::optional<char8_t> c = m_cursor.peek();
    if (!c) {
        return { .kind = Token_Kind::eof, .span = Span::at(m_file, position()) };
    }
    if (is_c_whitespace_no_newline(*c)) {
        return whitespace();
    }
    if (*c == u8'\n') {
        const std::size_t start = m_cursor.position();
        m_cursor.advance();
        return make_token(start, Token_Kind::newline);
    }
    if (*c == u8'/') {
        const std::optional<char8_t> next = m_cursor.peek_next();
        if (next == u8'/') {
            return line_comment();
        }
        if (next == u8'*') {
            return block_comment();
        }
    }
    if (is_ascii_digit(*c)) {
        return pp_number();
    }
    if (*c == u8'.') {
        if (const std::optional<char8_t> next = m_cursor.peek_next(); next && is_ascii_digit(*next)) {
            return pp_number();
        }
    }
    if (*c == u8'L' || *c == u8'u' || *c == u8'U') {
        return identifier_or_prefixed_literal();
    }
    if (is_c_identifier_start(*c)) {
        return identifier();
    }
    if (*c == u8'"') {
        m_cursor.advance();
        return quoted_literal(0, u8'"', Token_Kind::string_literal);
    }
    if (*c == u8'\'') {
        m_cursor.advance();
        return quoted_literal(0, u8'\'', Token_Kind::char_const);
    }
    return punctuator();
}

Token Lexer::lex_header_name()
{
    const std::size_t start = m_cursor.position();
    const std::optional<char8_t> opening = m_cursor.advance();
    if (!opening) {
        return { .kind = Token_Kind::eof, .span = Span::at(m_file, position()) };
    }
    if (*opening != u8'<' && *opening != u8'"') {
        return make_token(start, Token_Kind::unknown);
    }
    const char8_t closing = *opening == u8'<' ? u8'>' : u8'"';
    m_cursor.eat_while([closing](char8_t c) { return c != closing && c != u8'\n'; });
    if (m_cursor.eat(closing)) {
        return make_token(start, Token_Kind::header_name);
    }
    return make_token(start, Token_Kind::unknown);
}

Token Lexer::whitespace()
{
    const std::size_t start = m_cursor.position();
    m_cursor.eat_while(is_c_whitespace_no_newline);
    return make_token(start, Token_Kind::whitespace);
}

Token Lexer::line_comment()
{
    const std::size_t start = m_cursor.position();
    m_cursor.advance();
    m_cursor.advance();
    m_cursor.eat_while([](char8_t c) { return c != u8'\n'; });
    return make_token(start, Token_Kind::comment);
}

Token Lexer::block_comment()
{
    const std::size_t start = m_cursor.position();
    m_cursor.advance();
    m_cursor.advance();
    // An unterminated block comment extends to the end of the file.
    while (const std::optional<char8_t> c = m_cursor.advance()) {
        if (*c == u8'*' && m_cursor.eat(u8'/')) {
            break;
        }
    }
    return make_token(start, Token_Kind::comment);
}

Token Lexer::identifier_or_prefixed_literal()
{
    const std::size_t start = m_cursor.position();
    const std::optional<char8_t> first = m_cursor.advance();
    SLOPCC_DEBUG_ASSERT(first);

    if (*first == u8'u' && m_cursor.eat(u8'8')) {
        if (m_cursor.eat(u8'"')) {
            return quoted_literal(2, u8'"', Token_Kind::string_literal);
        }
        m_cursor.eat_while(is_c_identifier_continue);
        return make_token(start, Token_Kind::identifier);
    }
    if (m_cursor.eat(u8'"')) {
        return quoted_literal(1, u8'"', Token_Kind::string_literal);
    }
    if (m_cursor.eat(u8'\'')) {
        return quoted_literal(1, u8'\'', Token_Kind::char_const);
    }
    m_cursor.eat_while(is_c_identifier_continue);
    return make_token(start, Token_Kind::identifier);
}

Token Lexer::identifier()
{
    const std::size_t start = m_cursor.position();
    m_cursor.advance();
    m_cursor.eat_while(is_c_identifier_continue);
    return make_token(start, Token_Kind::identifier);
}

Token Lexer::pp_number()
{
    const std::size_t start = m_cursor.position();
    m_cursor.advance();
    while (const std::optional<char8_t> c = m_cursor.peek()) {
        const std::optional<char8_t> next = m_cursor.peek_next();
        if (is_c_exponent_marker(*c) && (next == u8'+' || next == u8'-')) {
            m_cursor.advance();
            m_cursor.advance();
        }
        else if (is_c_pp_number_continue(*c)) {
            m_cursor.advance();
        }
        else {
            break;
        }
    }
    return make_token(start, Token_Kind::pp_number);
}

Token Lexer::quoted_literal(std::size_t prefix_length, char8_t quote, Token_Kind kind)
{
    // The prefix and the opening quote have already been consumed.
    SLOPCC_ASSERT(m_cursor.position() >= prefix_length + 1);
    const std::size_t start = m_cursor.position() - prefix_length - 1;

    while (const std::optional<char8_t> c = m_cursor.peek()) {
        if (*c == u8'\n') {
            return make_token(start, Token_Kind::unknown);
        }
        m_cursor.advance();
        if (*c == u8'\\') {
            m_cursor.advance();
        }
        else if (*c == quote) {
            return make_token(start, kind);
        }
    }
    return make_token(start, Token_Kind::unknown);
}

Token Lexer::punctuator()
{
    const std::size_t start = m_cursor.position();
    const std::optional<char8_t> first = m_cursor.advance();
    SLOPCC_DEBUG_ASSERT(first);

    const auto one_or_two = [&](char8_t second, Token_Kind two, Token_Kind one) {
        return m_cursor.eat(second) ? two : one;
    };

    const Token_Kind kind = [&] -> Token_Kind {
        using enum Token_Kind;
        switch (*first) {
        case u8'#': return one_or_two(u8'#', hash_hash, hash);
        case u8'(': return left_paren;
        case u8')': return right_paren;
        case u8'[': return left_bracket;
        case u8']': return right_bracket;
        case u8'{': return left_brace;
        case u8'}': return right_brace;
        case u8',': return comma;
        case u8';': return semicolon;
        case u8':': return colon;
        case u8'?': return question;
        case u8'~': return tilde;
        case u8'.': {
            // ".." without a third dot is a single dot followed by another token.
            if (m_cursor.peek() == u8'.' && m_cursor.peek_next() == u8'.') {
                m_cursor.advance();
                m_cursor.advance();
                return ellipsis;
            }
            return dot;
        }
        case u8'+': {
            if (m_cursor.eat(u8'+')) {
                return plus_plus;
            }
            return one_or_two(u8'=', plus_equal, plus);
        }
        case u8'-': {
            if (m_cursor.eat(u8'-')) {
                return minus_minus;
            }
            if (m_cursor.eat(u8'>')) {
                return arrow;
            }
            return one_or_two(u8'=', minus_equal, minus);
        }
        case u8'*': return one_or_two(u8'=', star_equal, star);
        case u8'/': return one_or_two(u8'=', slash_equal, slash);
        case u8'%': return one_or_two(u8'=', percent_equal, percent);
        case u8'=': return one_or_two(u8'=', equal_equal, equal);
        case u8'!': return one_or_two(u8'=', exclamation_equal, exclamation);
        case u8'^': return one_or_two(u8'=', caret_equal, caret);
        case u8'<': {
            if (m_cursor.eat(u8'<')) {
                return one_or_two(u8'=', left_shift_equal, left_shift);
            }
            return one_or_two(u8'=', less_equal, less);
        }
        case u8'>': {
            if (m_cursor.eat(u8'>')) {
                return one_or_two(u8'=', right_shift_equal, right_shift);
            }
            return one_or_two(u8'=', greater_equal, greater);
        }
        case u8'&': {
            if (m_cursor.eat(u8'&')) {
                return amp_amp;
            }
            return one_or_two(u8'=', amp_equal, amp);
        }
        case u8'|': {
            if (m_cursor.eat(u8'|')) {
                return pipe_pipe;
            }
            return one_or_two(u8'=', pipe_equal, pipe);
        }
        default: return unknown;
        }
    }();

    return make_token(start, kind);
}

void tokenize(std::pmr::vector<Token>& out, std::u8string_view source, File_Id file)
{
    Lexer lexer { source, file };
    while (true) {
        const Token token = lexer.next_token();
        out.push_back(token);
        if (token.kind == Token_Kind::eof) {
            break;
        }
    }
}

namespace {

[[nodiscard]]
std::u8string_view strip_encoding_prefix(std::u8string_view text)
{
    if (text.starts_with(u8"u8")) {
        return text.substr(2);
    }
    if (text.starts_with(u8'L') || text.starts_with(u8'u') || text.starts_with(u8'U')) {
        return text.substr(1);
    }
    return text;
}

[[nodiscard]]
bool is_unterminated_block_comment(std::u8string_view text)
{
    return text.starts_with(u8"/*") && (text.length() < 4 || !text.ends_with(u8"*/"));
}

void diagnose_unknown(const Token& token, std::u8string_view text, Logger& logger)
{
    const std::u8string_view unprefixed = strip_encoding_prefix(text);
    if (unprefixed.starts_with(u8'"')) {
        logger.log(
            Severity::error, diagnostic::string_unterminated, token.span,
            u8"Missing terminating '\"' character in string literal."
        );
        return;
    }
    if (unprefixed.starts_with(u8'\'')) {
        logger.log(
            Severity::error, diagnostic::char_unterminated, token.span,
            u8"Missing terminating ' character in character constant."
        );
        return;
    }
    if (text.starts_with(u8'<')) {
        logger.log(
            Severity::error, diagnostic::header_name_malformed, token.span,
            u8"Missing terminating '>' character in header name."
        );
        return;
    }

    SLOPCC_ASSERT(!text.empty());
    const char8_t c = text[0];
    std::u8string message = u8"Stray ";
    if (is_ascii(c) && c >= u8' ' && c != 0x7f) {
        message += u8"'";
        message += c;
        message += u8"'";
    }
    else {
        constexpr std::u8string_view hex_digits = u8"0123456789ABCDEF";
        message += u8"byte 0x";
        message += hex_digits[c >> 4];
        message += hex_digits[c & 0xf];
    }
    message += u8" in program.";
    logger.log(Severity::error, diagnostic::stray_character, token.span, message);
}

} // namespace

void diagnose_tokens(std::span<const Token> tokens, std::u8string_view source, Logger& logger)
{
    for (const Token& token : tokens) {
        if (token.kind == Token_Kind::unknown) {
            diagnose_unknown(token, token.text(source), logger);
        }
        else if (token.kind == Token_Kind::comment
                 && is_unterminated_block_comment(token.text(source))) {
            logger.log(
                Severity::warning, diagnostic::comment_unterminated, token.span,
                u8"Unterminated block comment extends to the end of the file."
            );
        }
    }
}

} // namespace slopcc
