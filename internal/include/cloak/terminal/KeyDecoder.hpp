#ifndef INCLUDE_CLOAK_TERMINAL_KEYDECODER_HPP
#define INCLUDE_CLOAK_TERMINAL_KEYDECODER_HPP

#include "cloak/terminal/KeyEvent.hpp"
#include <cstdint>
#include <optional>

namespace cloak::terminal
{

// Turns the byte stream of a raw-mode terminal into key events.
//
// Plain bytes map to characters, CR/LF to Enter, DEL/BS to Backspace and
// 0x01..0x1A to Control + letter. ESC-prefixed sequences (CSI, SS3) are swallowed
// whole and reported as KeyCode::Other; ESC + printable is Alt + key. Multi-byte
// UTF-8 is assembled into one character event.
class KeyDecoder final
{
public:
    // Returns an event once `byte` completes one.
    [[nodiscard]] std::optional<KeyEvent> feed(std::uint8_t byte) noexcept;

    // Resolves a sequence whose continuation never arrived (a lone ESC press).
    [[nodiscard]] std::optional<KeyEvent> flush() noexcept;

    // True while in the middle of a multi-byte sequence.
    [[nodiscard]] bool pending() const noexcept
    {
        return m_state != State::Ground;
    }

    void reset() noexcept;

private:
    enum class State : std::uint8_t
    {
        Ground,
        Escape,
        Csi,
        Ss3,
        Utf8,
    };

    [[nodiscard]] std::optional<KeyEvent> feedGround(std::uint8_t byte) noexcept;
    [[nodiscard]] std::optional<KeyEvent> feedEscape(std::uint8_t byte) noexcept;
    [[nodiscard]] std::optional<KeyEvent> feedCsi(std::uint8_t byte) noexcept;
    [[nodiscard]] std::optional<KeyEvent> feedUtf8(std::uint8_t byte) noexcept;

    void beginUtf8(std::uint8_t lead, std::uint8_t continuations, char32_t minimum) noexcept;

    State m_state{ State::Ground };
    char32_t m_codePoint{ 0U };
    char32_t m_minimum{ 0U };
    std::uint8_t m_remaining{ 0U };
};

} // namespace cloak::terminal

#endif // INCLUDE_CLOAK_TERMINAL_KEYDECODER_HPP
