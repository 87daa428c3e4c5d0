#include <cstddef>
#include <cstdio>
#include <span>

#include "slopcc/util/result.hpp"
#include "slopcc/util/tty.hpp"

#include "slopcc/cli.hpp"
#include "slopcc/driver.hpp"

int main(int argc, const char* const* const argv)
{
    using namespace slopcc;

    const Result<Cli_Options, Cli_Error> options
        = parse_command_line(std::span<const char* const>(argv, std::size_t(argc)));
    if (!options) {
        std::fprintf(stderr, "slopcc: %s\n", options.error().message.c_str());
        return int(Exit_Code::usage);
    }
    return int(run(*options, stdout, stderr, is_stderr_tty));
}
