#ifndef SLOPCC_SETTINGS_HPP
#define SLOPCC_SETTINGS_HPP

#include <cstddef>
#include <cstdint>
#include <string_view>

#include "ulight/impl/platform.h"

#ifndef NDEBUG // debug builds
#define SLOPCC_DEBUG 1
#define SLOPCC_IF_DEBUG(...) __VA_ARGS__
#define SLOPCC_IF_NOT_DEBUG(...)
#else // release builds
#define SLOPCC_IF_DEBUG(...)
#define SLOPCC_IF_NOT_DEBUG(...) __VA_ARGS__
#endif

#define SLOPCC_COLD ULIGHT_COLD

namespace slopcc {

/// @brief If `true`, the current build is a debug build (not a release build).
inline constexpr bool is_debug_build = SLOPCC_IF_DEBUG(true) SLOPCC_IF_NOT_DEBUG(false);

/// @brief The capacity of each `Arena` chunk unless another size is requested.
inline constexpr std::size_t default_arena_chunk_size = 8 * 1024;

/// @brief The largest source file (in bytes) which can be registered in a `Source_Map`.
/// Byte positions are 32-bit, so files are limited to 4 GiB.
inline constexpr std::size_t max_source_size = std::uint32_t(-1);

/// @brief The version string printed by `slopcc --version`.
inline constexpr std::u8string_view version = u8"0.1.0";

} // namespace slopcc

#endif
