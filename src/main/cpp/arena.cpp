#include <algorithm>
#include <bit>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <mutex>
#include <new>
#include <string>
#include <string_view>

#include "slopcc/util/assert.hpp"
#include "slopcc/util/to_chars.hpp"

#include "slopcc/arena.hpp"

namespace slopcc {
namespace {

/// @brief Returns the offset within a chunk at which an allocation of `size` bytes
/// aligned to `alignment` would begin, or `-1` if it does not fit.
/// Alignment is applied to the absolute address, not to the offset.
[[nodiscard]]
std::size_t fit_in_chunk(
    const std::byte* data,
    std::size_t used,
    std::size_t capacity,
    std::size_t size,
    std::size_t alignment
)
{
    const auto base = reinterpret_cast<std::uintptr_t>(data);
    const std::uintptr_t cursor = base + used;
    const std::uintptr_t mask = alignment - 1;
    if (cursor > std::uintptr_t(-1) - mask) {
        return std::size_t(-1);
    }
    const std::uintptr_t aligned = (cursor + mask) & ~mask;
    const std::size_t offset = aligned - base;
    if (offset > capacity || size > capacity - offset) {
        return std::size_t(-1);
    }
    return offset;
}

[[noreturn]]
void oversized_allocation(std::size_t size, std::size_t chunk_size)
{
    std::u8string message = u8"allocation of ";
    message += to_characters8(size);
    message += u8" bytes exceeds chunk size of ";
    message += to_characters8(chunk_size);
    message += u8" bytes";
    contract_violation(message);
}

} // namespace

Arena::Arena(std::size_t chunk_size, std::pmr::memory_resource* upstream)
    : m_upstream { upstream }
    , m_chunk_size { chunk_size }
    , m_chunks { upstream }
    , m_finalizers { upstream }
{
    SLOPCC_ASSERT(upstream);
    if (chunk_size == 0) {
        contract_violation(u8"arena chunk size must be greater than zero");
    }
}

Arena::~Arena()
{
    for (auto it = m_finalizers.rbegin(); it != m_finalizers.rend(); ++it) {
        it->destroy(it->object);
    }
    for (const Chunk& chunk : m_chunks) {
        m_upstream->deallocate(chunk.data, m_chunk_size, chunk.alignment);
    }
}

std::size_t Arena::chunk_count() const
{
    const std::scoped_lock lock { m_mutex };
    return m_chunks.size();
}

std::size_t Arena::bytes_allocated() const
{
    const std::scoped_lock lock { m_mutex };
    return m_bytes_allocated;
}

void* Arena::allocate_bytes(std::size_t size, std::size_t alignment)
{
    SLOPCC_ASSERT(std::has_single_bit(alignment));
    if (size > m_chunk_size) {
        oversized_allocation(size, m_chunk_size);
    }

    const std::scoped_lock lock { m_mutex };

    if (!m_chunks.empty()) {
        Chunk& last = m_chunks.back();
        const std::size_t offset = fit_in_chunk(last.data, last.used, m_chunk_size, size, alignment);
        if (offset != std::size_t(-1)) {
            last.used = offset + size;
            m_bytes_allocated += size;
            return last.data + offset;
        }
    }

    // A fresh chunk is aligned to at least the requested alignment,
    // so any allocation no larger than the chunk size fits at its start.
    const std::size_t chunk_alignment = std::max(alignment, alignof(std::max_align_t));
    try {
        m_chunks.reserve(m_chunks.size() + 1);
        void* const data = m_upstream->allocate(m_chunk_size, chunk_alignment);
        m_chunks.push_back({ .data = static_cast<std::byte*>(data),
                             .alignment = chunk_alignment,
                             .used = size });
    } catch (const std::bad_alloc&) {
        allocation_failure();
    }
    m_bytes_allocated += size;
    return m_chunks.back().data;
}

std::u8string_view Arena::alloc_str(std::u8string_view str)
{
    if (str.empty()) {
        return u8"";
    }
    auto* const memory = static_cast<char8_t*>(allocate_bytes(str.size(), alignof(char8_t)));
    std::ranges::copy(str, memory);
    return { memory, str.size() };
}

void Arena::add_finalizer(void* object, void (*destroy)(void*) noexcept)
{
    const std::scoped_lock lock { m_mutex };
    try {
        m_finalizers.push_back({ .object = object, .destroy = destroy });
    } catch (const std::bad_alloc&) {
        allocation_failure();
    }
}

} // namespace slopcc
