#ifndef SLOPCC_ASSERT_HPP
#define SLOPCC_ASSERT_HPP

#include <string_view>

#include "ulight/impl/assert.hpp"

#include "slopcc/settings.hpp"

namespace slopcc {

using ulight::Assertion_Error;
using ulight::Assertion_Error_Type;

#define SLOPCC_ASSERT(...) ULIGHT_ASSERT(__VA_ARGS__)
#define SLOPCC_DEBUG_ASSERT(...) ULIGHT_DEBUG_ASSERT(__VA_ARGS__)

#define SLOPCC_ASSERT_UNREACHABLE(...) ULIGHT_ASSERT_UNREACHABLE(__VA_ARGS__)
#define SLOPCC_DEBUG_ASSERT_UNREACHABLE(...) ULIGHT_DEBUG_ASSERT_UNREACHABLE(__VA_ARGS__)

/// @brief Reports that a caller has violated the contract of some core component
/// (e.g. an oversized arena allocation or a `File_Id` from a different `Source_Map`)
/// and terminates the program.
/// Unlike malformed input, such violations are bugs and are never recovered from.
/// @param message the description, printed to `stderr` as `slopcc: fatal: <message>`
[[noreturn]] SLOPCC_COLD
void contract_violation(std::u8string_view message) noexcept;

/// @brief Like `contract_violation`, but for memory exhaustion.
[[noreturn]] SLOPCC_COLD
void allocation_failure() noexcept;

} // namespace slopcc

#endif
