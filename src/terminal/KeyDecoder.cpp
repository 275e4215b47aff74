#include "cloak/terminal/KeyDecoder.hpp"

namespace cloak::terminal
{
namespace
{

constexpr std::uint8_t g_esc{ 0x1BU };
constexpr std::uint8_t g_del{ 0x7FU };
constexpr std::uint8_t g_bs{ 0x08U };
constexpr std::uint8_t g_tab{ 0x09U };
constexpr std::uint8_t g_lf{ 0x0AU };
constexpr std::uint8_t g_cr{ 0x0DU };
constexpr std::uint8_t g_ctrlA{ 0x01U };
constexpr std::uint8_t g_ctrlZ{ 0x1AU };
constexpr std::uint8_t g_ctrlBackslash{ 0x1CU };
constexpr std::uint8_t g_ctrlUnderscore{ 0x1FU };
constexpr std::uint8_t g_firstPrintable{ 0x20U };
constexpr std::uint8_t g_lastPrintable{ 0x7EU };

constexpr char32_t g_maxCodePoint{ 0x10FFFFU };
constexpr char32_t g_surrogateFirst{ 0xD800U };
constexpr char32_t g_surrogateLast{ 0xDFFFU };

[[nodiscard]] constexpr bool isPrintable(std::uint8_t byte) noexcept
{
    return byte >= g_firstPrintable && byte <= g_lastPrintable;
}

// C0 controls are executed even in the middle of an escape sequence.
[[nodiscard]] constexpr bool isC0Control(std::uint8_t byte) noexcept
{
    return byte < g_firstPrintable;
}

[[nodiscard]] constexpr KeyEvent other() noexcept
{
    return KeyEvent::key(KeyCode::Other);
}

} // namespace

std::optional<KeyEvent> KeyDecoder::feed(std::uint8_t byte) noexcept
{
    switch (m_state)
    {
    case State::Ground:
        return feedGround(byte);
    case State::Escape:
        return feedEscape(byte);
    case State::Csi:
        return feedCsi(byte);
    case State::Ss3:
        m_state = State::Ground;
        if (isC0Control(byte))
        {
            return feedGround(byte);
        }
        return other();
    case State::Utf8:
        return feedUtf8(byte);
    }
    return std::nullopt;
}

std::optional<KeyEvent> KeyDecoder::flush() noexcept
{
    const State was{ m_state };
    reset();

    switch (was)
    {
    case State::Ground:
        return std::nullopt;
    case State::Escape:
        return KeyEvent::key(KeyCode::Escape);
    case State::Csi:
    case State::Ss3:
    case State::Utf8:
        break;
    }
    return other();
}

void KeyDecoder::reset() noexcept
{
    m_state = State::Ground;
    m_codePoint = 0U;
    m_minimum = 0U;
    m_remaining = 0U;
}

std::optional<KeyEvent> KeyDecoder::feedGround(std::uint8_t byte) noexcept
{
    if (isPrintable(byte))
    {
        return KeyEvent::character(static_cast<char32_t>(byte));
    }

    switch (byte)
    {
    case g_esc:
        m_state = State::Escape;
        return std::nullopt;
    case g_cr:
    case g_lf:
        return KeyEvent::key(KeyCode::Enter);
    case g_del:
    case g_bs:
        return KeyEvent::key(KeyCode::Backspace);
    case g_tab:
        return KeyEvent::key(KeyCode::Tab);
    case 0x00U:
        return KeyEvent::character(U' ', KeyModifiers::Control);
    default:
        break;
    }

    if (byte >= g_ctrlA && byte <= g_ctrlZ)
    {
        return KeyEvent::character(static_cast<char32_t>(U'a' + (byte - g_ctrlA)), KeyModifiers::Control);
    }
    if (byte >= g_ctrlBackslash && byte <= g_ctrlUnderscore)
    {
        return KeyEvent::character(static_cast<char32_t>(U'4' + (byte - g_ctrlBackslash)), KeyModifiers::Control);
    }

    // UTF-8 lead bytes; C0, C1 and F5..FF can never start a valid sequence.
    if (byte >= 0xC2U && byte <= 0xDFU)
    {
        beginUtf8(byte & 0x1FU, 1U, 0x80U);
        return std::nullopt;
    }
    if (byte >= 0xE0U && byte <= 0xEFU)
    {
        beginUtf8(byte & 0x0FU, 2U, 0x800U);
        return std::nullopt;
    }
    if (byte >= 0xF0U && byte <= 0xF4U)
    {
        beginUtf8(byte & 0x07U, 3U, 0x10000U);
        return std::nullopt;
    }
    return other();
}

std::optional<KeyEvent> KeyDecoder::feedEscape(std::uint8_t byte) noexcept
{
    m_state = State::Ground;

    switch (byte)
    {
    case '[':
        m_state = State::Csi;
        return std::nullopt;
    case 'O':
        m_state = State::Ss3;
        return std::nullopt;
    case g_esc:
        m_state = State::Escape;
        return KeyEvent::key(KeyCode::Escape);
    case g_cr:
    case g_lf:
        return KeyEvent::key(KeyCode::Enter, KeyModifiers::Alt);
    case g_del:
    case g_bs:
        return KeyEvent::key(KeyCode::Backspace, KeyModifiers::Alt);
    default:
        break;
    }

    if (isPrintable(byte))
    {
        return KeyEvent::character(static_cast<char32_t>(byte), KeyModifiers::Alt);
    }
    return other();
}

std::optional<KeyEvent> KeyDecoder::feedCsi(std::uint8_t byte) noexcept
{
    constexpr std::uint8_t kParamFirst{ 0x20U };
    constexpr std::uint8_t kParamLast{ 0x3FU };

    if (byte >= kParamFirst && byte <= kParamLast)
    {
        return std::nullopt;
    }

    m_state = State::Ground;
    if (isC0Control(byte))
    {
        // The unfinished sequence is abandoned.
        return feedGround(byte);
    }

    // A final byte ends the sequence; anything else means it was malformed. Both are dropped.
    return other();
}

std::optional<KeyEvent> KeyDecoder::feedUtf8(std::uint8_t byte) noexcept
{
    constexpr std::uint8_t kContinuationMask{ 0xC0U };
    constexpr std::uint8_t kContinuationTag{ 0x80U };
    constexpr std::uint8_t kPayloadMask{ 0x3FU };
    constexpr unsigned kPayloadBits{ 6U };

    if ((byte & kContinuationMask) != kContinuationTag)
    {
        reset();
        return other();
    }

    m_codePoint = (m_codePoint << kPayloadBits) | static_cast<char32_t>(byte & kPayloadMask);
    if (--m_remaining != 0U)
    {
        return std::nullopt;
    }

    const char32_t cp{ m_codePoint };
    const char32_t minimum{ m_minimum };
    reset();

    if (cp < minimum || cp > g_maxCodePoint || (cp >= g_surrogateFirst && cp <= g_surrogateLast))
    {
        return other();
    }
    return KeyEvent::character(cp);
}

void KeyDecoder::beginUtf8(std::uint8_t lead, std::uint8_t continuations, char32_t minimum) noexcept
{
    m_state = State::Utf8;
    m_codePoint = static_cast<char32_t>(lead);
    m_remaining = continuations;
    m_minimum = minimum;
}

} // namespace cloak::terminal
