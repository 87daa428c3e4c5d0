#ifndef SLOPCC_SPAN_HPP
#define SLOPCC_SPAN_HPP

#include <algorithm>
#include <compare>
#include <cstddef>
#include <functional>
#include <string_view>

#include "slopcc/util/assert.hpp"

#include "slopcc/fwd.hpp"

namespace slopcc {

/// @brief A half-open byte range `[start, end)` within one registered source file.
/// A span with `start == end` denotes a point location, such as the end of a file.
struct Span {
    File_Id file;
    Byte_Pos start;
    Byte_Pos end;

    /// @brief Returns the zero-width span at `pos` in `file`.
    [[nodiscard]]
    static constexpr Span at(File_Id file, Byte_Pos pos) noexcept
    {
        return { .file = file, .start = pos, .end = pos };
    }

    [[nodiscard]]
    friend constexpr auto operator<=>(const Span&, const Span&)
        = default;

    [[nodiscard]]
    constexpr Byte_Pos length() const
    {
        SLOPCC_DEBUG_ASSERT(start <= end);
        return end - start;
    }

    [[nodiscard]]
    constexpr bool empty() const noexcept
    {
        return start == end;
    }

    [[nodiscard]]
    constexpr bool contains(Byte_Pos pos) const noexcept
    {
        return pos >= start && pos < end;
    }

    /// @brief Returns the smallest span covering both `*this` and `other`.
    /// Spans in different files are not comparable,
    /// and merging them is a contract violation.
    [[nodiscard]]
    constexpr Span merge(const Span& other) const
    {
        if (file != other.file) {
            contract_violation(u8"cannot merge spans from different files");
        }
        return { .file = file,
                 .start = std::min(start, other.start),
                 .end = std::max(end, other.end) };
    }

    /// @brief Returns the text covered by this span within `source`,
    /// which is the text of the file identified by `file`.
    [[nodiscard]]
    constexpr std::u8string_view as_string(std::u8string_view source) const
    {
        SLOPCC_ASSERT(start <= end);
        SLOPCC_ASSERT(end <= source.size());
        return source.substr(start, end - start);
    }
};

} // namespace slopcc

template <>
struct std::hash<slopcc::Span> {
    [[nodiscard]]
    std::size_t operator()(const slopcc::Span& span) const noexcept
    {
        std::size_t result = std::size_t(span.file);
        result = result * 31 + span.start;
        result = result * 31 + span.end;
        return result;
    }
};

#endif
