#ifndef SLOPCC_MEMORY_RESOURCES_HPP
#define SLOPCC_MEMORY_RESOURCES_HPP

#include <cstddef>
#include <memory_resource>
#include <new>

#include "slopcc/util/assert.hpp"

namespace slopcc {

/// @brief A `pmr::memory_resource` which obtains memory from the global
/// (aligned) `operator new` and treats exhaustion as fatal
/// rather than throwing `std::bad_alloc`.
struct Global_Memory_Resource final : std::pmr::memory_resource {

    /// @brief Returns a pointer to an object of type `Global_Memory_Resource`
    /// with static duration.
    /// Note that all objects of this type are interchangeable,
    /// so `get()` is typically better than creating a new instance.
    [[nodiscard]]
    static Global_Memory_Resource* get() noexcept
    {
        static constinit Global_Memory_Resource instance;
        return &instance;
    }

    [[nodiscard]]
    void* do_allocate(std::size_t bytes, std::size_t alignment) final
    {
        void* const result = ::operator new(bytes, std::align_val_t(alignment), std::nothrow);
        if (!result) {
            allocation_failure();
        }
        return result;
    }

    void do_deallocate(void* p, std::size_t bytes, std::size_t alignment) noexcept final
    {
        ::operator delete(p, bytes, std::align_val_t(alignment));
    }

    [[nodiscard]]
    bool do_is_equal(const std::pmr::memory_resource& other) const noexcept final
    {
        return dynamic_cast<const Global_Memory_Resource*>(&other) != nullptr;
    }
};

} // namespace slopcc

#endif
