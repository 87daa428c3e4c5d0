#ifndef SLOPCC_LEX_HPP
#define SLOPCC_LEX_HPP

#include <memory_resource>
#include <span>
#include <string_view>
#include <vector>

#include "slopcc/cursor.hpp"
#include "slopcc/fwd.hpp"
#include "slopcc/token.hpp"

namespace slopcc {

/// @brief Splits the text of one source file into preprocessing tokens.
/// Tokens tile the input: each token begins where the previous one ended,
/// the first begins at zero, and the sequence is terminated by an `eof` token.
/// Malformed input never stops lexing; it is represented by `unknown` tokens.
struct [[nodiscard]] Lexer {
private:
    Cursor m_cursor;
    std::u8string_view m_source;
    File_Id m_file;

public:
    /// @brief Constructs a lexer over `source`, which is the text of `file`.
    [[nodiscard]]
    Lexer(std::u8string_view source, File_Id file);

    /// @brief Returns the next token.
    /// Once the end of the input is reached, every call returns a zero-width `eof` token.
    [[nodiscard]]
    Token next_token();

    /// @brief Lexes a header name of the form `<...>` or `"..."`.
    /// This is only meaningful in an `#include` directive,
    /// so it is never done by `next_token`.
    /// @returns a `header_name` token, an `unknown` token if the header name is malformed,
    /// or an `eof` token at the end of the input
    [[nodiscard]]
    Token lex_header_name();

    [[nodiscard]]
    Byte_Pos position() const noexcept
    {
        return Byte_Pos(m_cursor.position());
    }

    [[nodiscard]]
    bool at_end() const noexcept
    {
        return m_cursor.eof();
    }

private:
    [[nodiscard]]
    Token make_token(std::size_t start, Token_Kind kind) const;

    [[nodiscard]]
    Token whitespace();
    [[nodiscard]]
    Token line_comment();
    [[nodiscard]]
    Token block_comment();
    [[nodiscard]]
    Token identifier_or_prefixed_literal();
    [[nodiscard]]
    Token identifier();
    [[nodiscard]]
    Token pp_number();
    [[nodiscard]]
    Token quoted_literal(std::size_t prefix_length, char8_t quote, Token_Kind kind);
    [[nodiscard]]
    Token punctuator();
};

/// @brief Lexes `source` completely and appends the tokens to `out`,
/// including the terminating `eof` token.
void tokenize(std::pmr::vector<Token>& out, std::u8string_view source, File_Id file);

/// @brief Reports malformed tokens within `tokens`, which were lexed from `source`.
/// Every `unknown` token results in an error,
/// and every unterminated block comment results in a warning.
void diagnose_tokens(std::span<const Token> tokens, std::u8string_view source, Logger& logger);

} // namespace slopcc

#endif
