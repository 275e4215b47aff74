#ifndef INCLUDE_CLOAK_SECURITY_WIPINGALLOCATOR_HPP
#define INCLUDE_CLOAK_SECURITY_WIPINGALLOCATOR_HPP

#include "cloak/security/MemoryWiper.hpp"
#include <cstddef>
#include <limits>
#include <new>
#include <span>
#include <type_traits>

namespace cloak::security
{
// Allocator that zeroes every block before handing it back, so a growing
// password buffer never leaves stale copies behind after reallocation.
template <class T> struct WipingAllocator
{
    static_assert(std::is_trivially_copyable_v<T>, "WipingAllocator only holds plain bytes/characters");

    using value_type = T;
    using is_always_equal = std::true_type;
    using propagate_on_container_move_assignment = std::true_type;
    using propagate_on_container_swap = std::true_type;

    WipingAllocator() noexcept = default;

    template <class U> constexpr explicit WipingAllocator([[maybe_unused]] const WipingAllocator<U>& other) noexcept
    {
    }

    [[nodiscard]] T* allocate(std::size_t count)
    {
        if (count == 0U)
        {
            return nullptr;
        }
        if (count > (std::numeric_limits<std::size_t>::max() / sizeof(T)))
        {
            throw std::bad_array_new_length{};
        }
        return static_cast<T*>(::operator new(count * sizeof(T)));
    }

    void deallocate(T* block, std::size_t count) noexcept
    {
        if (block == nullptr)
        {
            return;
        }
        secureWipe(std::span<T>{ block, count });
        ::operator delete(block);
    }
};

template <class T, class U>
constexpr bool operator==([[maybe_unused]] const WipingAllocator<T>& lhs,
                          [[maybe_unused]] const WipingAllocator<U>& rhs) noexcept
{
    return true;
}

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_WIPINGALLOCATOR_HPP
