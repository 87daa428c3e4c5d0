#ifndef SLOPCC_IO_HPP
#define SLOPCC_IO_HPP

#include <cstddef>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <span>
#include <string_view>
#include <system_error>
#include <utility>
#include <vector>

#include "slopcc/util/function_ref.hpp"
#include "slopcc/util/result.hpp"

#include "slopcc/fwd.hpp"

namespace slopcc {

enum struct IO_Error_Code : Default_Underlying {
    /// @brief The file couldn't be opened.
    /// This may be due to disk errors, security issues, bad file paths, or other issues.
    cannot_open,
    /// @brief An error occurred while reading a file.
    read_error,
    /// @brief An error occurred while writing a file.
    write_error,
};

[[nodiscard]]
constexpr std::u8string_view io_error_code_name(IO_Error_Code e)
{
    using enum IO_Error_Code;
    switch (e) {
        SLOPCC_ENUM_STRING_CASE8(cannot_open);
        SLOPCC_ENUM_STRING_CASE8(read_error);
        SLOPCC_ENUM_STRING_CASE8(write_error);
    }
    return u8"???";
}

struct [[nodiscard]] Unique_File {
private:
    std::FILE* m_file = nullptr;

public:
    constexpr Unique_File() = default;

    constexpr Unique_File(std::FILE* f)
        : m_file { f }
    {
    }

    constexpr Unique_File(Unique_File&& other) noexcept
        : m_file { std::exchange(other.m_file, nullptr) }
    {
    }

    Unique_File(const Unique_File&) = delete;
    Unique_File& operator=(const Unique_File&) = delete;

    constexpr Unique_File& operator=(Unique_File&& other) noexcept
    {
        swap(*this, other);
        other.close();
        return *this;
    }

    constexpr friend void swap(Unique_File& x, Unique_File& y) noexcept
    {
        std::swap(x.m_file, y.m_file);
    }

    void close() noexcept
    {
        if (m_file) {
            std::fclose(std::exchange(m_file, nullptr));
        }
    }

    [[nodiscard]]
    constexpr std::FILE* get() const noexcept
    {
        return m_file;
    }

    [[nodiscard]]
    constexpr operator bool() const noexcept
    {
        return m_file != nullptr;
    }

    ~Unique_File()
    {
        close();
    }
};

/// @brief Forwards the arguments to `std::fopen` and wraps the result in `Unique_File`.
[[nodiscard]]
inline Unique_File fopen_unique(const char* path, const char* mode) noexcept
{
    return std::fopen(path, mode);
}

/// @brief Reads all bytes from an open stream and calls a given consumer with them,
/// chunk by chunk.
/// @param consume_chunk Invoked repeatedly with temporary chunks of bytes.
/// The chunks may be located within the same underlying buffer,
/// so they should not be used after `consume_chunk` has been invoked.
/// @param stream the stream, such as `stdin`
/// @param system_error if not null, receives the operating system's reason on failure
[[nodiscard]]
Result<void, IO_Error_Code> stream_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    std::FILE* stream,
    std::error_code* system_error = nullptr
);

/// @brief Like `stream_to_bytes_chunked`, but opens the file at `path` first.
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes_chunked(
    Function_Ref<void(std::span<const std::byte>)> consume_chunk,
    const std::filesystem::path& path,
    std::error_code* system_error = nullptr
);

namespace detail {

template <typename Byte, typename Alloc>
void append_chunk(std::vector<Byte, Alloc>& out, std::span<const std::byte> chunk)
{
    static_assert(sizeof(Byte) == 1);
    if (chunk.empty()) {
        return;
    }
    const std::size_t old_size = out.size();
    out.resize(out.size() + chunk.size());
    std::memcpy(out.data() + old_size, chunk.data(), chunk.size());
}

} // namespace detail

/// @brief Reads all bytes from a file and appends them to a given vector.
/// @param path the file path
template <typename Byte, typename Alloc>
[[nodiscard]]
Result<void, IO_Error_Code> file_to_bytes(
    std::vector<Byte, Alloc>& out,
    const std::filesystem::path& path,
    std::error_code* system_error = nullptr
)
{
    return file_to_bytes_chunked(
        [&out](std::span<const std::byte> chunk) -> void { detail::append_chunk(out, chunk); },
        path, system_error
    );
}

/// @brief Reads all bytes from an open stream and appends them to a given vector.
template <typename Byte, typename Alloc>
[[nodiscard]]
Result<void, IO_Error_Code> stream_to_bytes(
    std::vector<Byte, Alloc>& out,
    std::FILE* stream,
    std::error_code* system_error = nullptr
)
{
    return stream_to_bytes_chunked(
        [&out](std::span<const std::byte> chunk) -> void { detail::append_chunk(out, chunk); },
        stream, system_error
    );
}

/// @brief Writes `amount` bytes to `stream` and flushes it.
[[nodiscard]]
Result<void, IO_Error_Code> bytes_to_stream(const void* data, std::size_t amount, std::FILE* stream);

/// @brief Writes `amount` bytes to the file at `path`, replacing its contents.
[[nodiscard]]
Result<void, IO_Error_Code>
bytes_to_file(const void* data, std::size_t amount, const std::filesystem::path& path);

} // namespace slopcc

#endif
