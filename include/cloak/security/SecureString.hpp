#ifndef INCLUDE_CLOAK_SECURITY_SECURESTRING_HPP
#define INCLUDE_CLOAK_SECURITY_SECURESTRING_HPP

#include "cloak/security/MemoryWiper.hpp"
#include "cloak/security/WipingAllocator.hpp"
#include <cstddef>
#include <span>
#include <string_view>
#include <vector>

namespace cloak::security
{
// UTF-8 text whose storage is wiped on every release.
using SecureString = std::vector<char, WipingAllocator<char>>;

[[nodiscard]] inline SecureString secureStringFrom(std::string_view s)
{
    // NOLINTNEXTLINE(modernize-return-braced-init-list)
    return SecureString(s.begin(), s.end());
}

[[nodiscard]] inline std::string_view asStringView(const SecureString& s) noexcept
{
    if (s.empty())
    {
        return {};
    }
    return std::string_view{ s.data(), s.size() };
}

[[nodiscard]] inline std::span<std::byte> asWritableBytes(SecureString& s) noexcept
{
    return std::as_writable_bytes(std::span{ s });
}

// Appends one Unicode scalar value encoded as UTF-8.
// Surrogates and values above U+10FFFF are stored as U+FFFD.
void appendCodePoint(SecureString& s, char32_t codePoint);

// Number of UTF-8 encoded characters held in s.
[[nodiscard]] std::size_t codePointCount(const SecureString& s) noexcept;

// Removes the last UTF-8 encoded character and wipes its bytes.
// Returns false when s was already empty.
bool popCodePoint(SecureString& s) noexcept;

inline void secureRelease(SecureString& s) noexcept
{
    secureWipe(asWritableBytes(s));
    SecureString empty{};
    s.swap(empty);
}

} // namespace cloak::security

#endif // INCLUDE_CLOAK_SECURITY_SECURESTRING_HPP
