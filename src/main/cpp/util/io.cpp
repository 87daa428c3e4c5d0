#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <filesystem>
#include <span>
#include <system_error>

#include "slopcc/util/function_ref.hpp"
#include "slopcc/util/io.hpp"
#include "slopcc/util/result.hpp"

#include "slopcc/fwd.hpp"

namespace slopcc {
namespace {

void store_errno(std::error_code* system_error)
{
    if (system_error) {
        *system_error = std::error_code { errno, std::generic_category() };
    }
}

} // namespace

Result<void, IO_Error_Code> stream_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::FILE* stream
)
{
    constexpr std::size_t block_size = BUFSIZ;
    char buffer[block_size] {};

    std::size_t read_size;
    do {
        read_size = std::fread(buffer, 1, block_size, stream);
        if (std::ferror(stream)) {
            store_errno(system_error);
            return IO_Error_Code::read_error;
        }
        const std::span<std::byte> chunk { reinterpret_cast<std::byte*>(buffer), read_size };
        consume_chunk(chunk);
    } while (read_size == block_size);

    return {};
}

Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    const std::filesystem::path& path,
    std::error_code* system_error
)
{
    std::error_code error;
    if (std::filesystem::is_directory(path, error)) {
        if (system_error) {
            *system_error = std::make_error_code(std::errc::is_a_directory);
        }
        return IO_Error_Code::cannot_open;
    }

    errno = 0;
    const Unique_File stream = fopen_unique(path.c_str(), "rb");
    if (!stream) {
        store_errno(system_error);
        return IO_Error_Code::cannot_open;
    }
    return stream_to_bytes_chunked(consume_chunk, stream.get(), system_error);
}

Result<void, IO_Error_Code> bytes_to_stream(const void* data, std::size_t amount, std::FILE* stream)
{
    const std::size_t bytes_written = std::fwrite(data, 1, amount, stream);
    if (bytes_written != amount) {
        return IO_Error_Code::write_error;
    }
    if (std::fflush(stream) != 0) {
        return IO_Error_Code::write_error;
    }
    return {};
}

Result<void, IO_Error_Code>
bytes_to_file(const void* data, std::size_t amount, const std::filesystem::path& path)
{
    const Unique_File file = fopen_unique(path.c_str(), "wb");
    if (!file) {
        return IO_Error_Code::cannot_open;
    }
    return bytes_to_stream(data, amount, file.get());
}

} // namespace slopcc
