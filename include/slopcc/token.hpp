#ifndef SLOPCC_TOKEN_HPP
#define SLOPCC_TOKEN_HPP

#include <span>
#include <string_view>

#include "slopcc/fwd.hpp"
#include "slopcc/span.hpp"

namespace slopcc {

// clang-format off
#define SLOPCC_TOKEN_KIND_ENUM_DATA(F)                                                             \
    F(pp_number, "PP-NUMBER", "")                                                                  \
    F(char_const, "CHAR-CONST", "")                                                                \
    F(string_literal, "STRING-LITERAL", "")                                                        \
    F(identifier, "IDENTIFIER", "")                                                                \
    F(header_name, "HEADER-NAME", "")                                                              \
    F(hash, "HASH", "#")                                                                           \
    F(hash_hash, "HASH-HASH", "##")                                                                \
    F(left_paren, "LEFT-PAREN", "(")                                                               \
    F(right_paren, "RIGHT-PAREN", ")")                                                             \
    F(left_bracket, "LEFT-BRACKET", "[")                                                           \
    F(right_bracket, "RIGHT-BRACKET", "]")                                                         \
    F(left_brace, "LEFT-BRACE", "{")                                                               \
    F(right_brace, "RIGHT-BRACE", "}")                                                             \
    F(comma, "COMMA", ",")                                                                         \
    F(semicolon, "SEMICOLON", ";")                                                                 \
    F(colon, "COLON", ":")                                                                         \
    F(ellipsis, "ELLIPSIS", "...")                                                                 \
    F(dot, "DOT", ".")                                                                             \
    F(arrow, "ARROW", "->")                                                                        \
    F(plus, "PLUS", "+")                                                                           \
    F(minus, "MINUS", "-")                                                                         \
    F(star, "STAR", "*")                                                                           \
    F(slash, "SLASH", "/")                                                                         \
    F(percent, "PERCENT", "%")                                                                     \
    F(plus_plus, "PLUS-PLUS", "++")                                                                \
    F(minus_minus, "MINUS-MINUS", "--")                                                            \
    F(equal_equal, "EQUAL-EQUAL", "==")                                                            \
    F(exclamation_equal, "EXCLAMATION-EQUAL", "!=")                                                \
    F(less, "LESS", "<")                                                                           \
    F(greater, "GREATER", ">")                                                                     \
    F(less_equal, "LESS-EQUAL", "<=")                                                              \
    F(greater_equal, "GREATER-EQUAL", ">=")                                                        \
    F(amp_amp, "AMP-AMP", "&&")                                                                    \
    F(pipe_pipe, "PIPE-PIPE", "||")                                                                \
    F(exclamation, "EXCLAMATION", "!")                                                             \
    F(amp, "AMP", "&")                                                                             \
    F(pipe, "PIPE", "|")                                                                           \
    F(caret, "CARET", "^")                                                                         \
    F(tilde, "TILDE", "~")                                                                         \
    F(left_shift, "LEFT-SHIFT", "<<")                                                              \
    F(right_shift, "RIGHT-SHIFT", ">>")                                                            \
    F(equal, "EQUAL", "=")                                                                         \
    F(plus_equal, "PLUS-EQUAL", "+=")                                                              \
    F(minus_equal, "MINUS-EQUAL", "-=")                                                            \
    F(star_equal, "STAR-EQUAL", "*=")                                                              \
    F(slash_equal, "SLASH-EQUAL", "/=")                                                            \
    F(percent_equal, "PERCENT-EQUAL", "%=")                                                        \
    F(amp_equal, "AMP-EQUAL", "&=")                                                                \
    F(pipe_equal, "PIPE-EQUAL", "|=")                                                              \
    F(caret_equal, "CARET-EQUAL", "^=")                                                            \
    F(left_shift_equal, "LEFT-SHIFT-EQUAL", "<<=")                                                 \
    F(right_shift_equal, "RIGHT-SHIFT-EQUAL", ">>=")                                               \
    F(question, "QUESTION", "?")                                                                   \
    F(whitespace, "WHITESPACE", "")                                                                \
    F(newline, "NEWLINE", "")                                                                      \
    F(comment, "COMMENT", "")                                                                      \
    F(eof, "EOF", "")                                                                              \
    F(unknown, "UNKNOWN", "")
// clang-format on

#define SLOPCC_TOKEN_KIND_ENUMERATOR(id, name, spelling) id,

/// @brief The category of a preprocessing token.
enum struct Token_Kind : Default_Underlying {
    SLOPCC_TOKEN_KIND_ENUM_DATA(SLOPCC_TOKEN_KIND_ENUMERATOR)
};

#define SLOPCC_TOKEN_KIND_NAME(id, name, spelling)                                                 \
    case Token_Kind::id: return u8##name;

/// @brief Returns the upper-case name of `kind`, such as `"PP-NUMBER"`.
[[nodiscard]]
constexpr std::u8string_view token_kind_name(Token_Kind kind)
{
    switch (kind) {
        SLOPCC_TOKEN_KIND_ENUM_DATA(SLOPCC_TOKEN_KIND_NAME)
    }
    return u8"???";
}

#define SLOPCC_TOKEN_KIND_SPELLING(id, name, spelling)                                             \
    case Token_Kind::id: return u8##spelling;

/// @brief Returns the fixed text of tokens of the given `kind`,
/// or an empty string if the text varies (identifiers, literals, whitespace, etc.).
[[nodiscard]]
constexpr std::u8string_view token_kind_spelling(Token_Kind kind)
{
    switch (kind) {
        SLOPCC_TOKEN_KIND_ENUM_DATA(SLOPCC_TOKEN_KIND_SPELLING) // NOLINT(bugprone-branch-clone)
    }
    return u8"";
}

/// @brief Returns `true` iff `kind` is whitespace, a new-line, or a comment.
[[nodiscard]]
constexpr bool is_whitespace_like(Token_Kind kind) noexcept
{
    return kind == Token_Kind::whitespace || kind == Token_Kind::newline
        || kind == Token_Kind::comment;
}

/// @brief A preprocessing token.
/// The token's text is not stored, but recovered from the source using `span`.
struct Token {
    Token_Kind kind;
    Span span;

    [[nodiscard]]
    friend constexpr bool operator==(const Token&, const Token&)
        = default;

    /// @brief Returns the text of this token within `source`.
    [[nodiscard]]
    constexpr std::u8string_view text(std::u8string_view source) const
    {
        return span.as_string(source);
    }
};

} // namespace slopcc

#endif
