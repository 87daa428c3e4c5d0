#ifndef SLOPCC_TTY_HPP
#define SLOPCC_TTY_HPP

#include <cstdio>

#include "slopcc/fwd.hpp"

namespace slopcc {

// https://pubs.opengroup.org/onlinepubs/009695399/functions/isatty.html
[[nodiscard]]
bool is_tty(std::FILE*) noexcept;

/// @brief True if `is_tty(stderr)` is `true`.
extern const bool is_stderr_tty;

} // namespace slopcc

#endif
