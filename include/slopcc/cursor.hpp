#ifndef SLOPCC_CURSOR_HPP
#define SLOPCC_CURSOR_HPP

#include <cstddef>
#include <optional>
#include <string_view>

#include "slopcc/util/assert.hpp"

#include "slopcc/fwd.hpp"

namespace slopcc {

/// @brief A forward-only position within a byte string,
/// with at most two bytes of look-ahead.
struct Cursor {
private:
    std::u8string_view m_source;
    std::size_t m_pos = 0;

public:
    [[nodiscard]]
    constexpr explicit Cursor(std::u8string_view source) noexcept
        : m_source { source }
    {
    }

    [[nodiscard]]
    constexpr std::size_t position() const noexcept
    {
        return m_pos;
    }

    [[nodiscard]]
    constexpr bool eof() const noexcept
    {
        return m_pos >= m_source.size();
    }

    [[nodiscard]]
    constexpr std::optional<char8_t> peek() const noexcept
    {
        if (m_pos < m_source.size()) {
            return m_source[m_pos];
        }
        return {};
    }

    [[nodiscard]]
    constexpr std::optional<char8_t> peek_next() const noexcept
    {
        if (m_pos + 1 < m_source.size()) {
            return m_source[m_pos + 1];
        }
        return {};
    }

    /// @brief Consumes and returns the next byte, if any.
    constexpr std::optional<char8_t> advance() noexcept
    {
        if (m_pos < m_source.size()) {
            return m_source[m_pos++];
        }
        return {};
    }

    /// @brief Consumes the next byte if it equals `c`.
    /// @returns `true` iff a byte was consumed.
    constexpr bool eat(char8_t c) noexcept
    {
        if (m_pos < m_source.size() && m_source[m_pos] == c) {
            ++m_pos;
            return true;
        }
        return false;
    }

    /// @brief Consumes the longest run of bytes satisfying `predicate`.
    /// @returns the number of bytes consumed
    template <typename Predicate>
    constexpr std::size_t eat_while(Predicate predicate)
    {
        const std::size_t start = m_pos;
        while (m_pos < m_source.size() && predicate(m_source[m_pos])) {
            ++m_pos;
        }
        SLOPCC_DEBUG_ASSERT(m_pos <= m_source.size());
        return m_pos - start;
    }
};

} // namespace slopcc

#endif
