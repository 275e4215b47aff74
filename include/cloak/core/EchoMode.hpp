#ifndef INCLUDE_CLOAK_CORE_ECHOMODE_HPP
#define INCLUDE_CLOAK_CORE_ECHOMODE_HPP

#include <cstdint>
#include <optional>

namespace cloak::core
{

constexpr char32_t g_defaultMaskCharacter{ U'*' };

// What is drawn for each typed character during one read.
class EchoMode final
{
public:
    [[nodiscard]] static constexpr EchoMode mask(char32_t maskCharacter = g_defaultMaskCharacter) noexcept
    {
        return EchoMode{ Kind::Mask, maskCharacter };
    }

    // Draws the typed character itself.
    [[nodiscard]] static constexpr EchoMode plain() noexcept
    {
        return EchoMode{ Kind::Plain, U'\0' };
    }

    [[nodiscard]] static constexpr EchoMode suppressed() noexcept
    {
        return EchoMode{ Kind::Suppressed, U'\0' };
    }

    [[nodiscard]] constexpr std::optional<char32_t> glyphFor(char32_t typed) const noexcept
    {
        switch (m_kind)
        {
        case Kind::Mask:
            return m_mask;
        case Kind::Plain:
            return typed;
        case Kind::Suppressed:
            break;
        }
        return std::nullopt;
    }

private:
    enum class Kind : std::uint8_t
    {
        Mask,
        Plain,
        Suppressed,
    };

    constexpr EchoMode(Kind echoKind, char32_t glyph) noexcept : m_kind{ echoKind }, m_mask{ glyph }
    {
    }

    Kind m_kind;
    char32_t m_mask;
};

} // namespace cloak::core

#endif // INCLUDE_CLOAK_CORE_ECHOMODE_HPP
