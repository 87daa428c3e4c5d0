#ifndef SLOPCC_ARENA_HPP
#define SLOPCC_ARENA_HPP

#include <compare>
#include <cstddef>
#include <cstring>
#include <functional>
#include <memory>
#include <memory_resource>
#include <mutex>
#include <new>
#include <span>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "slopcc/util/assert.hpp"

#include "slopcc/fwd.hpp"
#include "slopcc/memory_resources.hpp"
#include "slopcc/settings.hpp"

namespace slopcc {

/// @brief A copyable handle to a value owned by an `Arena`.
/// Boxes compare and hash by the value they refer to;
/// use `identical` to compare by identity.
/// A box is valid only as long as the arena that produced it.
template <typename T>
struct Arena_Box {
private:
    T* m_pointer;

public:
    [[nodiscard]]
    constexpr explicit Arena_Box(T& value) noexcept
        : m_pointer { std::addressof(value) }
    {
    }

    [[nodiscard]]
    constexpr T& get() const noexcept
    {
        return *m_pointer;
    }

    [[nodiscard]]
    constexpr T& operator*() const noexcept
    {
        return *m_pointer;
    }

    [[nodiscard]]
    constexpr T* operator->() const noexcept
    {
        return m_pointer;
    }

    /// @brief Returns `true` iff `*this` and `other` refer to the same object.
    [[nodiscard]]
    constexpr bool identical(const Arena_Box& other) const noexcept
    {
        return m_pointer == other.m_pointer;
    }

    [[nodiscard]]
    friend constexpr bool operator==(const Arena_Box& x, const Arena_Box& y)
    {
        return *x.m_pointer == *y.m_pointer;
    }

    [[nodiscard]]
    friend constexpr auto operator<=>(const Arena_Box& x, const Arena_Box& y)
        requires std::three_way_comparable<T>
    {
        return *x.m_pointer <=> *y.m_pointer;
    }
};

/// @brief A thread-safe bump allocator.
/// Memory is obtained from an upstream resource in chunks of a fixed size
/// and only released when the arena is destroyed.
/// No single allocation may be larger than the chunk size.
///
/// Values with non-trivial destructors are owned by the arena
/// and destroyed in reverse order of allocation when the arena is destroyed.
struct Arena {
private:
    struct Chunk {
        std::byte* data;
        std::size_t alignment;
        std::size_t used;
    };

    struct Finalizer {
        void* object;
        void (*destroy)(void*) noexcept;
    };

    template <typename T>
    static void destroy_object(void* object) noexcept
    {
        std::destroy_at(static_cast<T*>(object));
    }

    std::pmr::memory_resource* m_upstream;
    std::size_t m_chunk_size;
    mutable std::mutex m_mutex;
    std::pmr::vector<Chunk> m_chunks;
    std::pmr::vector<Finalizer> m_finalizers;
    std::size_t m_bytes_allocated = 0;

public:
    /// @brief Constructs an arena with no chunks.
    /// @param chunk_size the capacity of each chunk, which shall be greater than zero
    /// @param upstream the resource from which chunks are obtained
    [[nodiscard]]
    explicit Arena(
        std::size_t chunk_size = default_arena_chunk_size,
        std::pmr::memory_resource* upstream = Global_Memory_Resource::get()
    );

    Arena(const Arena&) = delete;
    Arena& operator=(const Arena&) = delete;

    ~Arena();

    [[nodiscard]]
    std::size_t chunk_size() const noexcept
    {
        return m_chunk_size;
    }

    [[nodiscard]]
    std::size_t chunk_count() const;

    /// @brief Returns the total number of bytes requested so far, excluding padding.
    [[nodiscard]]
    std::size_t bytes_allocated() const;

    /// @brief Allocates `size` bytes aligned to `alignment`.
    /// `alignment` shall be a power of two.
    /// A `size` greater than the chunk size is a contract violation.
    [[nodiscard]]
    void* allocate_bytes(std::size_t size, std::size_t alignment);

    /// @brief Moves `value` into the arena and returns a reference to the stored object,
    /// valid for the remaining lifetime of the arena.
    /// Stateless types are not stored at all;
    /// the result refers to a shared placeholder instead.
    template <typename T>
    [[nodiscard]]
    T& alloc(T value)
    {
        static_assert(!std::is_reference_v<T> && !std::is_const_v<T>);
        if constexpr (std::is_empty_v<T> && std::is_trivially_destructible_v<T>) {
            static T placeholder { std::move(value) };
            return placeholder;
        }
        else {
            void* const memory = allocate_bytes(sizeof(T), alignof(T));
            T* const result = ::new (memory) T(std::move(value));
            if constexpr (!std::is_trivially_destructible_v<T>) {
                add_finalizer(result, &destroy_object<T>);
            }
            return *result;
        }
    }

    /// @brief Like `alloc`, but wraps the result in an `Arena_Box`.
    template <typename T>
    [[nodiscard]]
    Arena_Box<T> alloc_box(T value)
    {
        return Arena_Box<T> { alloc(std::move(value)) };
    }

    /// @brief Copies `str` into the arena.
    /// Empty strings are not copied; the result refers to a shared empty string.
    [[nodiscard]]
    std::u8string_view alloc_str(std::u8string_view str);

    /// @brief Copies `items` into contiguous storage within the arena.
    /// Empty input is not copied; the result is a shared empty span.
    template <typename T>
        requires std::is_trivially_copyable_v<T>
    [[nodiscard]]
    std::span<T> alloc_slice(std::span<const T> items)
    {
        if (items.empty()) {
            return {};
        }
        if (items.size() > std::size_t(-1) / sizeof(T)) {
            contract_violation(u8"arena slice size overflows");
        }
        void* const memory = allocate_bytes(items.size_bytes(), alignof(T));
        std::memcpy(memory, items.data(), items.size_bytes());
        return { std::launder(static_cast<T*>(memory)), items.size() };
    }

private:
    void add_finalizer(void* object, void (*destroy)(void*) noexcept);
};

} // namespace slopcc

template <typename T>
struct std::hash<slopcc::Arena_Box<T>> {
    [[nodiscard]]
    std::size_t operator()(const slopcc::Arena_Box<T>& box) const
    {
        return std::hash<std::remove_cv_t<T>> {}(*box);
    }
};

#endif
