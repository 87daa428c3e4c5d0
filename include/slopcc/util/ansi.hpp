#ifndef SLOPCC_ANSI_HPP
#define SLOPCC_ANSI_HPP

#include <string_view>

namespace slopcc::ansi {


inline constexpr std::u8string_view h_black = u8"\x1B[0;90m";
inline constexpr std::u8string_view h_red = u8"\x1B[0;91m";
inline constexpr std::u8string_view h_green = u8"\x1B[0;92m";
inline constexpr std::u8string_view h_yellow = u8"\x1B[0;93m";
inline constexpr std::u8string_view h_white = u8"\x1B[0;97m";

inline constexpr std::u8string_view reset = u8"\033[0m";

} // namespace slopcc::ansi

#endif
