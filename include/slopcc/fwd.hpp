#ifndef SLOPCC_FWD_HPP
#define SLOPCC_FWD_HPP

#include <cstdint>

#include "slopcc/settings.hpp"

namespace slopcc {

/// @brief The default underlying type for scoped enumerations.
using Default_Underlying = unsigned char;

#define SLOPCC_ENUM_STRING_CASE8(...)                                                              \
    case __VA_ARGS__: return u8## #__VA_ARGS__

/// @brief A byte offset into the text of a single source file.
using Byte_Pos = std::uint32_t;

/// @brief A numeric source file identifier,
/// valid only for the `Source_Map` which has issued it.
enum struct File_Id : std::uint32_t { }; // NOLINT(performance-enum-size)

struct Arena;
template <typename>
struct Arena_Box;
struct Cursor;
struct Diagnostic;
struct Diagnostics;
enum struct IO_Error_Code : Default_Underlying;
struct Ignorant_Logger;
struct Lexer;
struct Line_Column;
struct Logger;
struct Resolved_Span;
template <typename, typename>
struct Result;
enum struct Severity : Default_Underlying;
struct Source_Error;
struct Source_File;
struct Source_Map;
struct Span;
struct Token;
enum struct Token_Kind : Default_Underlying;

} // namespace slopcc

#endif
