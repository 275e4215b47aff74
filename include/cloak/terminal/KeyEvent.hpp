#ifndef INCLUDE_CLOAK_TERMINAL_KEYEVENT_HPP
#define INCLUDE_CLOAK_TERMINAL_KEYEVENT_HPP

#include <cstdint>

namespace cloak::terminal
{

enum class KeyCode : std::uint8_t
{
    Char,
    Enter,
    Backspace,
    Tab,
    Escape,
    // Cursor keys, function keys and any sequence the decoder does not name.
    Other,
};

enum class KeyModifiers : std::uint8_t
{
    None = 0U,
    Shift = 1U << 0U,
    Control = 1U << 1U,
    Alt = 1U << 2U,
};

[[nodiscard]] constexpr KeyModifiers operator|(KeyModifiers lhs, KeyModifiers rhs) noexcept
{
    return static_cast<KeyModifiers>(static_cast<std::uint8_t>(lhs) | static_cast<std::uint8_t>(rhs));
}

struct KeyEvent final
{
    KeyCode code{ KeyCode::Other };
    // Unicode scalar value; meaningful only for KeyCode::Char.
    char32_t ch{ U'\0' };
    KeyModifiers modifiers{ KeyModifiers::None };

    [[nodiscard]] static constexpr KeyEvent character(char32_t c, KeyModifiers mods = KeyModifiers::None) noexcept
    {
        return KeyEvent{ KeyCode::Char, c, mods };
    }

    [[nodiscard]] static constexpr KeyEvent key(KeyCode keyCode, KeyModifiers mods = KeyModifiers::None) noexcept
    {
        return KeyEvent{ keyCode, U'\0', mods };
    }

    friend constexpr bool operator==(const KeyEvent&, const KeyEvent&) = default;
};

} // namespace cloak::terminal

#endif // INCLUDE_CLOAK_TERMINAL_KEYEVENT_HPP
