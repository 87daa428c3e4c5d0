#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <memory_resource>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#include <gtest/gtest.h>

#include "slopcc/arena.hpp"
#include "slopcc/fwd.hpp"

namespace slopcc {
namespace {

[[nodiscard]]
bool is_aligned(const void* p, std::size_t alignment)
{
    return reinterpret_cast<std::uintptr_t>(p) % alignment == 0;
}

TEST(Arena, values_persist_across_chunks)
{
    Arena arena { 64 };
    std::vector<std::uint64_t*> values;
    for (std::uint64_t i = 0; i < 100; ++i) {
        values.push_back(&arena.alloc(i));
    }
    for (std::uint64_t i = 0; i < 100; ++i) {
        EXPECT_EQ(*values[i], i);
        EXPECT_TRUE(is_aligned(values[i], alignof(std::uint64_t)));
    }
    // Eight values fit into each chunk of 64 bytes.
    EXPECT_EQ(arena.chunk_count(), 13);
    EXPECT_EQ(arena.bytes_allocated(), 800);

    const std::set<std::uint64_t*> distinct { values.begin(), values.end() };
    EXPECT_EQ(distinct.size(), values.size());
}

TEST(Arena, no_chunk_before_first_allocation)
{
    Arena arena;
    EXPECT_EQ(arena.chunk_size(), default_arena_chunk_size);
    EXPECT_EQ(arena.chunk_count(), 0);
    EXPECT_EQ(arena.bytes_allocated(), 0);
}

TEST(Arena, allocation_of_exactly_chunk_size)
{
    Arena arena { 64 };
    void* const first = arena.allocate_bytes(64, 1);
    EXPECT_NE(first, nullptr);
    EXPECT_EQ(arena.chunk_count(), 1);

    void* const second = arena.allocate_bytes(1, 1);
    EXPECT_NE(first, second);
    EXPECT_EQ(arena.chunk_count(), 2);
}

TEST(Arena, alignment_is_honored)
{
    Arena arena { 256 };
    static_cast<void>(arena.allocate_bytes(1, 1));
    for (const std::size_t alignment : { 2uz, 4uz, 8uz, 16uz, 32uz, 64uz }) {
        void* const p = arena.allocate_bytes(3, alignment);
        EXPECT_TRUE(is_aligned(p, alignment)) << "alignment " << alignment;
    }
    // Over-aligned requests also work in a fresh chunk.
    Arena fresh { 128 };
    EXPECT_TRUE(is_aligned(fresh.allocate_bytes(128, 128), 128));
}

TEST(Arena, bytes_allocated_excludes_padding)
{
    Arena arena { 64 };
    static_cast<void>(arena.allocate_bytes(1, 1));
    static_cast<void>(arena.allocate_bytes(8, 8));
    EXPECT_EQ(arena.bytes_allocated(), 9);
}

TEST(Arena_Death, oversized_allocation)
{
    EXPECT_DEATH(
        {
            Arena arena { 64 };
            static_cast<void>(arena.allocate_bytes(128, 1));
        },
        "allocation of 128 bytes exceeds chunk size of 64 bytes"
    );
}

TEST(Arena_Death, oversized_value)
{
    EXPECT_DEATH(
        {
            Arena arena { 64 };
            static_cast<void>(arena.alloc(std::array<std::byte, 128> {}));
        },
        "allocation of 128 bytes exceeds chunk size of 64 bytes"
    );
}

TEST(Arena, value_of_exactly_chunk_size)
{
    Arena arena { 64 };
    std::array<std::byte, 64> value {};
    value[63] = std::byte { 7 };
    const std::array<std::byte, 64>& stored = arena.alloc(value);
    EXPECT_EQ(stored[63], std::byte { 7 });
    EXPECT_EQ(arena.chunk_count(), 1);
}

TEST(Arena_Death, zero_chunk_size)
{
    EXPECT_DEATH({ Arena arena { 0 }; }, "arena chunk size must be greater than zero");
}

TEST(Arena, alloc_str)
{
    Arena arena { 64 };
    std::u8string original = u8"hello";
    const std::u8string_view copy = arena.alloc_str(original);
    original[0] = u8'j';
    EXPECT_EQ(copy, u8"hello");
    EXPECT_NE(copy.data(), original.data());
}

TEST(Arena, alloc_str_empty)
{
    Arena arena { 64 };
    const std::u8string_view result = arena.alloc_str(u8"");
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(arena.chunk_count(), 0);
}

TEST(Arena, alloc_slice)
{
    Arena arena { 64 };
    const int values[] { 1, 2, 3, 4 };
    const std::span<int> copy = arena.alloc_slice(std::span<const int> { values });
    ASSERT_EQ(copy.size(), 4);
    EXPECT_TRUE(std::ranges::equal(copy, values));
    EXPECT_NE(copy.data(), values);
    EXPECT_TRUE(is_aligned(copy.data(), alignof(int)));

    copy[0] = 10;
    EXPECT_EQ(values[0], 1);
}

TEST(Arena, alloc_slice_empty)
{
    Arena arena { 64 };
    const std::span<int> result = arena.alloc_slice(std::span<const int> {});
    EXPECT_TRUE(result.empty());
    EXPECT_EQ(arena.chunk_count(), 0);
}

struct Empty { };

TEST(Arena, empty_types_are_not_stored)
{
    Arena arena { 64 };
    Empty& a = arena.alloc(Empty {});
    Empty& b = arena.alloc(Empty {});
    EXPECT_EQ(&a, &b);
    EXPECT_EQ(arena.chunk_count(), 0);
}

struct Destruction_Recorder {
    std::vector<int>* log;
    int id;

    ~Destruction_Recorder()
    {
        log->push_back(id);
    }
};

TEST(Arena, destructors_run_in_reverse_order)
{
    std::vector<int> log;
    {
        Arena arena { 256 };
        static_cast<void>(arena.alloc(Destruction_Recorder { &log, 1 }));
        static_cast<void>(arena.alloc(Destruction_Recorder { &log, 2 }));
        static_cast<void>(arena.alloc(Destruction_Recorder { &log, 3 }));
        // The temporaries passed into alloc have been destroyed already.
        log.clear();
    }
    const std::vector<int> expected { 3, 2, 1 };
    EXPECT_EQ(log, expected);
}

TEST(Arena, owns_strings)
{
    Arena arena { 256 };
    std::pmr::u8string& s = arena.alloc(std::pmr::u8string { u8"a string that is too long for SSO" });
    s += u8"!";
    EXPECT_TRUE(s.ends_with(u8"SSO!"));
}

TEST(Arena, concurrent_allocation)
{
    constexpr std::size_t thread_count = 8;
    constexpr std::size_t per_thread = 1000;

    Arena arena { 1024 };
    std::vector<std::vector<std::uint64_t*>> results(thread_count);
    {
        std::vector<std::jthread> threads;
        for (std::size_t t = 0; t < thread_count; ++t) {
            threads.emplace_back([&arena, &out = results[t], t] {
                for (std::size_t i = 0; i < per_thread; ++i) {
                    out.push_back(&arena.alloc(std::uint64_t(t * per_thread + i)));
                }
            });
        }
    }

    std::unordered_set<std::uint64_t*> addresses;
    for (std::size_t t = 0; t < thread_count; ++t) {
        ASSERT_EQ(results[t].size(), per_thread);
        for (std::size_t i = 0; i < per_thread; ++i) {
            EXPECT_EQ(*results[t][i], t * per_thread + i);
            addresses.insert(results[t][i]);
        }
    }
    EXPECT_EQ(addresses.size(), thread_count * per_thread);
    EXPECT_EQ(arena.bytes_allocated(), thread_count * per_thread * sizeof(std::uint64_t));
}

TEST(Arena_Box, compares_by_value)
{
    Arena arena { 64 };
    const Arena_Box<int> a = arena.alloc_box(5);
    const Arena_Box<int> b = arena.alloc_box(5);
    const Arena_Box<int> c = arena.alloc_box(7);

    EXPECT_EQ(a, b);
    EXPECT_NE(a, c);
    EXPECT_LT(a, c);
    EXPECT_FALSE(a.identical(b));
    EXPECT_TRUE(a.identical(a));
    EXPECT_EQ(std::hash<Arena_Box<int>> {}(a), std::hash<Arena_Box<int>> {}(b));
}

TEST(Arena_Box, refers_to_arena_storage)
{
    Arena arena { 64 };
    const Arena_Box<int> box = arena.alloc_box(1);
    *box = 2;
    EXPECT_EQ(box.get(), 2);
    const Arena_Box<int> copy = box;
    EXPECT_TRUE(copy.identical(box));
    EXPECT_EQ(*copy, 2);
}

} // namespace
} // namespace slopcc
