#ifndef SLOPCC_TO_CHARS_HPP
#define SLOPCC_TO_CHARS_HPP

#include <array>
#include <charconv>
#include <concepts>
#include <cstddef>
#include <limits>
#include <string_view>
#include <system_error>

#include "slopcc/util/assert.hpp"

namespace slopcc {

inline constexpr std::size_t max_integer_characters
    = std::numeric_limits<unsigned long long>::digits10 + 3;

/// @brief A fixed-capacity buffer holding the decimal representation of an integer.
struct Characters8 {
    std::array<char8_t, max_integer_characters> buffer {};
    std::size_t length = 0;

    [[nodiscard]]
    constexpr std::u8string_view as_string() const noexcept
    {
        return { buffer.data(), length };
    }

    [[nodiscard]]
    constexpr operator std::u8string_view() const noexcept
    {
        return as_string();
    }
};

template <std::integral T>
[[nodiscard]]
constexpr Characters8 to_characters8(T x)
{
    std::array<char, max_integer_characters> chars {};
    const std::to_chars_result result = std::to_chars(chars.data(), chars.data() + chars.size(), x);
    SLOPCC_ASSERT(result.ec == std::errc {});

    Characters8 out;
    out.length = std::size_t(result.ptr - chars.data());
    for (std::size_t i = 0; i < out.length; ++i) {
        out.buffer[i] = char8_t(chars[i]);
    }
    return out;
}

} // namespace slopcc

#endif
