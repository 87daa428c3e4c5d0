#include <cstdio>
#include <cstdlib>
#include <string_view>

#include "slopcc/util/assert.hpp"

namespace slopcc {

void contract_violation(std::u8string_view message) noexcept
{
    std::fputs("slopcc: fatal: ", stderr);
    std::fwrite(message.data(), 1, message.size(), stderr);
    std::fputc('\n', stderr);
    std::fflush(stderr);
    std::abort();
}

void allocation_failure() noexcept
{
    contract_violation(u8"memory exhausted");
}

} // namespace slopcc
