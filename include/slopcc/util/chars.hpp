#ifndef SLOPCC_CHARS_HPP
#define SLOPCC_CHARS_HPP

#include "ulight/impl/ascii_chars.hpp"

namespace slopcc {

using ulight::is_ascii;
using ulight::is_ascii_alpha;
using ulight::is_ascii_alphanumeric;
using ulight::is_ascii_digit;

/// @brief Returns `true` if `c` is C whitespace other than the new-line character,
/// i.e. space, horizontal tab, carriage return, vertical tab, or form feed.
/// Carriage returns are ordinary whitespace, so CRLF line endings
/// lex as whitespace followed by a new-line.
[[nodiscard]]
constexpr bool is_c_whitespace_no_newline(char8_t c) noexcept
{
    return c == u8' ' || c == u8'\t' || c == u8'\r' || c == u8'\v' || c == u8'\f';
}

/// @brief Returns `true` if `c` is an ASCII *identifier-nondigit*,
/// i.e. a character which can start an identifier.
[[nodiscard]]
constexpr bool is_c_identifier_start(char8_t c) noexcept
{
    return is_ascii_alpha(c) || c == u8'_';
}

[[nodiscard]]
constexpr bool is_c_identifier_continue(char8_t c) noexcept
{
    return is_ascii_alphanumeric(c) || c == u8'_';
}

/// @brief Returns `true` if `c` can continue a *pp-number* on its own,
/// without a following sign.
/// The greedy rule covers hex digits, suffixes like `ULL`,
/// and exponent markers that are not followed by a sign.
[[nodiscard]]
constexpr bool is_c_pp_number_continue(char8_t c) noexcept
{
    return is_c_identifier_continue(c) || c == u8'.';
}

/// @brief Returns `true` if `c` is an exponent marker which may be followed by a sign
/// within a *pp-number* (`e`, `E`, `p`, `P`).
[[nodiscard]]
constexpr bool is_c_exponent_marker(char8_t c) noexcept
{
    return c == u8'e' || c == u8'E' || c == u8'p' || c == u8'P';
}

} // namespace slopcc

#endif
