#ifndef INCLUDE_CLOAK_SECURITY_SECUREBUFFER_HPP
#define INCLUDE_CLOAK_SECURITY_SECUREBUFFER_HPP

#include "cloak/security/WipingAllocator.hpp"
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace cloak::security
{
// Raw terminal bytes that may contain keystrokes.
using SecureBuffer = std::vector<std::uint8_t, WipingAllocator<std::uint8_t>>;

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureBuffer& b) noexcept
{
    return std::as_writable_bytes(std::span{ b });
}

// Drops the first count bytes, wiping the tail left behind by the shift.
inline void secureErasePrefix(SecureBuffer& b, std::size_t count) noexcept
{
    if (count == 0U)
    {
        return;
    }
    if (count >= b.size())
    {
        secureWipe(asWritableBytes(b));
        b.clear();
        return;
    }
    const std::size_t remaining{ b.size() - count };
    for (std::size_t i{ 0U }; i < remaining; ++i)
    {
        b[i] = b[i + count];
    }
    secureWipe(asWritableBytes(b).subspan(remaining));
    b.resize(remaining);
}

inline void secureClear(SecureBuffer& b) noexcept
{
    secureWipe(asWritableBytes(b));
    b.clear();
}

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_SECUREBUFFER_HPP
