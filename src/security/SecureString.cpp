#include "cloak/security/SecureString.hpp"

#include <cstdint>

namespace cloak::security
{
namespace
{

constexpr char32_t g_replacementCharacter{ 0xFFFDU };
constexpr char32_t g_maxCodePoint{ 0x10FFFFU };
constexpr char32_t g_surrogateFirst{ 0xD800U };
constexpr char32_t g_surrogateLast{ 0xDFFFU };

[[nodiscard]] bool isContinuationByte(char c) noexcept
{
    constexpr std::uint8_t kMask{ 0xC0U };
    constexpr std::uint8_t kTag{ 0x80U };
    return (static_cast<std::uint8_t>(c) & kMask) == kTag;
}

void pushByte(SecureString& s, std::uint32_t value)
{
    s.push_back(static_cast<char>(static_cast<std::uint8_t>(value)));
}

} // namespace

void appendCodePoint(SecureString& s, char32_t codePoint)
{
    if (codePoint > g_maxCodePoint || (codePoint >= g_surrogateFirst && codePoint <= g_surrogateLast))
    {
        codePoint = g_replacementCharacter;
    }

    const auto cp{ static_cast<std::uint32_t>(codePoint) };
    if (cp < 0x80U)
    {
        pushByte(s, cp);
    }
    else if (cp < 0x800U)
    {
        pushByte(s, 0xC0U | (cp >> 6U));
        pushByte(s, 0x80U | (cp & 0x3FU));
    }
    else if (cp < 0x10000U)
    {
        pushByte(s, 0xE0U | (cp >> 12U));
        pushByte(s, 0x80U | ((cp >> 6U) & 0x3FU));
        pushByte(s, 0x80U | (cp & 0x3FU));
    }
    else
    {
        pushByte(s, 0xF0U | (cp >> 18U));
        pushByte(s, 0x80U | ((cp >> 12U) & 0x3FU));
        pushByte(s, 0x80U | ((cp >> 6U) & 0x3FU));
        pushByte(s, 0x80U | (cp & 0x3FU));
    }
}

std::size_t codePointCount(const SecureString& s) noexcept
{
    std::size_t count{ 0U };
    for (const char c : s)
    {
        if (!isContinuationByte(c))
        {
            ++count;
        }
    }
    return count;
}

bool popCodePoint(SecureString& s) noexcept
{
    if (s.empty())
    {
        return false;
    }

    std::size_t start{ s.size() - 1U };
    while (start > 0U && isContinuationByte(s[start]))
    {
        --start;
    }

    secureWipe(asWritableBytes(s).subspan(start));
    s.resize(start);
    return true;
}

} // namespace cloak::security
