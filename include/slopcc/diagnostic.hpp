#ifndef SLOPCC_DIAGNOSTIC_HPP
#define SLOPCC_DIAGNOSTIC_HPP

#include <algorithm>
#include <cstddef>
#include <memory_resource>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "slopcc/util/assert.hpp"
#include "slopcc/util/severity.hpp"

#include "slopcc/fwd.hpp"
#include "slopcc/span.hpp"

namespace slopcc {

struct Diagnostic {
    /// @brief The severity of the diagnostic.
    /// `severity_is_emittable(severity)` shall be `true`.
    Severity severity;
    /// @brief The id of the diagnostic,
    /// which is a non-empty string containing a
    /// dot-separated sequence of identifiers for this diagnostic.
    /// The ids in namespace `diagnostic` are the only ones used.
    std::u8string_view id;
    /// @brief The span of code that is responsible for this diagnostic,
    /// if any.
    std::optional<Span> location;
    /// @brief The diagnostic message.
    std::pmr::u8string message;
};

namespace diagnostic {

// LEXICAL DIAGNOSTICS =============================================================================

/// @brief A string literal is not terminated before the end of the line or file.
inline constexpr std::u8string_view string_unterminated = u8"lex.string.unterminated";

/// @brief A character constant is not terminated before the end of the line or file.
inline constexpr std::u8string_view char_unterminated = u8"lex.char.unterminated";

/// @brief A block comment is not terminated before the end of the file.
inline constexpr std::u8string_view comment_unterminated = u8"lex.comment.unterminated";

/// @brief A header name in an `#include` directive is malformed.
inline constexpr std::u8string_view header_name_malformed = u8"lex.header-name.malformed";

/// @brief A byte was encountered that does not begin any preprocessing token.
inline constexpr std::u8string_view stray_character = u8"lex.stray";

// DRIVER DIAGNOSTICS ==============================================================================

/// @brief A source file could not be read.
inline constexpr std::u8string_view file_io = u8"file.io";

/// @brief A translation phase was requested which is not implemented.
inline constexpr std::u8string_view not_implemented = u8"driver.not-implemented";

} // namespace diagnostic

/// @brief An abstract sink for diagnostics which drops everything below a minimum severity.
struct Logger {
private:
    Severity m_min_severity;

public:
    [[nodiscard]]
    constexpr explicit Logger(Severity min_severity)
    {
        set_min_severity(min_severity);
    }

    Logger(const Logger&) = default;
    Logger& operator=(const Logger&) = default;

    constexpr virtual ~Logger() = default;

    [[nodiscard]]
    constexpr Severity get_min_severity() const
    {
        return m_min_severity;
    }

    constexpr void set_min_severity(Severity severity)
    {
        SLOPCC_ASSERT(severity <= Severity::none);
        m_min_severity = severity;
    }

    [[nodiscard]]
    constexpr bool can_log(Severity severity) const
    {
        return severity >= m_min_severity;
    }

    /// @brief Emits a diagnostic if its severity reaches the minimum severity.
    void log(
        Severity severity,
        std::u8string_view id,
        std::optional<Span> location,
        std::u8string_view message
    )
    {
        SLOPCC_ASSERT(severity_is_emittable(severity));
        if (can_log(severity)) {
            (*this)({ .severity = severity,
                      .id = id,
                      .location = location,
                      .message = std::pmr::u8string { message } });
        }
    }

    constexpr virtual void operator()(Diagnostic diagnostic) = 0;
};

struct Ignorant_Logger final : Logger {
    using Logger::Logger;

    void operator()(Diagnostic) final { }
};

/// @brief An insertion-ordered collection of diagnostics,
/// which is itself a `Logger` that records what it is given.
struct Diagnostics final : Logger {
private:
    std::pmr::vector<Diagnostic> m_diagnostics;
    std::size_t m_error_count = 0;

public:
    using const_iterator = std::pmr::vector<Diagnostic>::const_iterator;

    [[nodiscard]]
    explicit Diagnostics(
        std::pmr::memory_resource* memory = std::pmr::get_default_resource(),
        Severity min_severity = Severity::min
    )
        : Logger { min_severity }
        , m_diagnostics { memory }
    {
    }

    void operator()(Diagnostic diagnostic) final
    {
        push(std::move(diagnostic));
    }

    /// @brief Appends `diagnostic` unless its severity is below the minimum severity.
    void push(Diagnostic diagnostic);

    [[nodiscard]]
    std::size_t size() const noexcept
    {
        return m_diagnostics.size();
    }

    [[nodiscard]]
    bool empty() const noexcept
    {
        return m_diagnostics.empty();
    }

    /// @brief Returns `true` iff at least one diagnostic with `Severity::error` was recorded.
    [[nodiscard]]
    bool has_errors() const noexcept
    {
        return m_error_count != 0;
    }

    [[nodiscard]]
    std::size_t error_count() const noexcept
    {
        return m_error_count;
    }

    [[nodiscard]]
    bool was_logged(std::u8string_view id) const
    {
        return std::ranges::find(m_diagnostics, id, &Diagnostic::id) != m_diagnostics.end();
    }

    [[nodiscard]]
    std::span<const Diagnostic> all() const noexcept
    {
        return m_diagnostics;
    }

    [[nodiscard]]
    const_iterator begin() const noexcept
    {
        return m_diagnostics.begin();
    }

    [[nodiscard]]
    const_iterator end() const noexcept
    {
        return m_diagnostics.end();
    }

    [[nodiscard]]
    const Diagnostic& operator[](std::size_t i) const
    {
        SLOPCC_ASSERT(i < m_diagnostics.size());
        return m_diagnostics[i];
    }
};

} // namespace slopcc

#endif
