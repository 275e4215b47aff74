#ifndef INCLUDE_CLOAK_SECURITY_MEMORYWIPER_HPP
#define INCLUDE_CLOAK_SECURITY_MEMORYWIPER_HPP

#include <cstddef>
#include <span>
#include <type_traits>

namespace cloak::security
{
// Zeroes memory in a way the optimizer is not allowed to elide.
void secureWipe(std::span<std::byte> bytes) noexcept;

template <typename T>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(std::span<T> buffer) noexcept
{
    secureWipe(std::as_writable_bytes(buffer));
}

template <typename T, std::size_t N>
    requires(!std::is_const_v<T> && std::is_trivially_copyable_v<T>)
void secureWipe(T (&buffer)[N]) noexcept
{
    secureWipe(std::as_writable_bytes(std::span<T>{ buffer }));
}
} // namespace cloak::security
#endif // INCLUDE_CLOAK_SECURITY_MEMORYWIPER_HPP
