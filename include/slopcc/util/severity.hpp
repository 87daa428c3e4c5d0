#ifndef SLOPCC_SEVERITY_HPP
#define SLOPCC_SEVERITY_HPP

#include <compare>
#include <string_view>

#include "slopcc/fwd.hpp"

namespace slopcc {

enum struct Severity : Default_Underlying {
    note,
    warning,
    error,
    /// @brief Not a severity of any diagnostic,
    /// but a logger threshold which suppresses everything.
    none,

    min = note,
    max = error,
};

[[nodiscard]]
constexpr std::strong_ordering operator<=>(Severity x, Severity y) noexcept
{
    return Default_Underlying(x) <=> Default_Underlying(y);
}

[[nodiscard]]
constexpr bool severity_is_emittable(Severity x) noexcept
{
    return x >= Severity::min && x <= Severity::max;
}

[[nodiscard]]
constexpr std::u8string_view severity_tag(Severity severity)
{
    using enum Severity;
    switch (severity) {
    case note: return u8"NOTE";
    case warning: return u8"WARNING";
    case error: return u8"ERROR";
    case none: break;
    }
    return u8"???";
}

} // namespace slopcc

#endif
