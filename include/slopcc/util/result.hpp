#ifndef SLOPCC_RESULT_HPP
#define SLOPCC_RESULT_HPP

#include <expected>
#include <type_traits>
#include <utility>

#include "slopcc/util/assert.hpp"

#include "slopcc/fwd.hpp"

namespace slopcc {

/// @brief Either a value of type `T` or an error of type `E`.
/// Unlike `std::expected`, a `Result` is implicitly constructible from an `E`,
/// so that functions can simply `return IO_Error_Code::cannot_open;`.
template <typename T, typename E>
struct [[nodiscard]] Result {
private:
    std::expected<T, E> m_data;

public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]]
    constexpr Result()
        requires std::is_default_constructible_v<std::expected<T, E>>
    = default;

    template <typename U = std::remove_cv_t<T>>
        requires(!std::is_void_v<T>)
                && (!std::is_same_v<std::remove_cvref_t<U>, Result>)
                && (!std::is_same_v<std::remove_cvref_t<U>, E>)
                && std::is_constructible_v<T, U &&>
    [[nodiscard]]
    constexpr Result(U&& value)
        : m_data { std::in_place, std::forward<U>(value) }
    {
    }

    [[nodiscard]]
    constexpr Result(E error)
        : m_data { std::unexpect, std::move(error) }
    {
    }

    [[nodiscard]]
    constexpr bool has_value() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr explicit operator bool() const noexcept
    {
        return m_data.has_value();
    }

    [[nodiscard]]
    constexpr decltype(auto) operator*() &
    {
        SLOPCC_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr decltype(auto) operator*() const&
    {
        SLOPCC_ASSERT(has_value());
        return *m_data;
    }

    [[nodiscard]]
    constexpr decltype(auto) operator*() &&
    {
        SLOPCC_ASSERT(has_value());
        return *std::move(m_data);
    }

    [[nodiscard]]
    constexpr auto* operator->()
    {
        SLOPCC_ASSERT(has_value());
        return m_data.operator->();
    }

    [[nodiscard]]
    constexpr const auto* operator->() const
    {
        SLOPCC_ASSERT(has_value());
        return m_data.operator->();
    }

    [[nodiscard]]
    constexpr const E& error() const&
    {
        SLOPCC_ASSERT(!has_value());
        return m_data.error();
    }

    [[nodiscard]]
    constexpr E&& error() &&
    {
        SLOPCC_ASSERT(!has_value());
        return std::move(m_data).error();
    }
};

} // namespace slopcc

#endif
