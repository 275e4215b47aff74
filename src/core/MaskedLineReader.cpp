#include "cloak/core/MaskedLineReader.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string_view>
#include <system_error>
#include <utility>

namespace cloak::core
{

using cloak::terminal::Column;
using cloak::terminal::KeyCode;
using cloak::terminal::KeyEvent;
using cloak::terminal::KeyModifiers;
using cloak::terminal::RawModeSession;
using cloak::terminal::TerminalIoError;
using cloak::terminal::TerminalOperation;
using cloak::terminal::TerminalResult;
using cloak::terminal::TerminalStatus;

namespace
{

constexpr std::string_view g_interruptEcho{ "^C" };
constexpr std::string_view g_erase{ " " };

enum class Erase : std::uint8_t
{
    Left,
    Blank,
};

[[nodiscard]] bool failed(const TerminalStatus& status) noexcept
{
    return std::holds_alternative<TerminalIoError>(status);
}

[[nodiscard]] bool isPlainCharacter(const KeyEvent& key) noexcept
{
    return key.code == KeyCode::Char && key.modifiers == KeyModifiers::None;
}

[[nodiscard]] bool isInterrupt(const KeyEvent& key) noexcept
{
    return key.code == KeyCode::Char && key.ch == U'c' && key.modifiers == KeyModifiers::Control;
}

} // namespace

MaskedLineReader::MaskedLineReader(cloak::terminal::ITerminalDriver& terminal, EchoMode echo) noexcept
    : m_terminal(terminal), m_echo(echo)
{
}

ReadOutcome MaskedLineReader::run()
{
    cloak::security::secureRelease(m_buffer);

    auto entered{ RawModeSession::enter(m_terminal) };
    if (auto* err = std::get_if<TerminalIoError>(&entered))
    {
        return *err;
    }
    auto& session{ std::get<RawModeSession>(entered) };

    const auto bound{ m_terminal.cursorColumn() };
    if (const auto* err = std::get_if<TerminalIoError>(&bound))
    {
        return *err;
    }
    m_cursorBound = std::get<Column>(bound);

    for (;;)
    {
        const auto next{ m_terminal.readEvent() };
        if (const auto* err = std::get_if<TerminalIoError>(&next))
        {
            cloak::security::secureRelease(m_buffer);
            return *err;
        }

        const auto step{ dispatch(std::get<KeyEvent>(next)) };
        if (const auto* err = std::get_if<TerminalIoError>(&step))
        {
            cloak::security::secureRelease(m_buffer);
            return *err;
        }

        switch (std::get<Step>(step))
        {
        case Step::Continue:
            break;
        case Step::Finished:
        {
            auto closed{ session.close() };
            if (auto* err = std::get_if<TerminalIoError>(&closed))
            {
                cloak::security::secureRelease(m_buffer);
                return *err;
            }
            return Completed{ std::exchange(m_buffer, {}) };
        }
        case Step::Interrupted:
        {
            cloak::security::secureRelease(m_buffer);
            auto closed{ session.close() };
            if (auto* err = std::get_if<TerminalIoError>(&closed))
            {
                return *err;
            }
            return Interrupted{};
        }
        }
    }
}

TerminalResult<MaskedLineReader::Step> MaskedLineReader::dispatch(const KeyEvent& key)
{
    TerminalStatus status{};
    Step step{ Step::Continue };

    if (isPlainCharacter(key))
    {
        status = onCharacter(key.ch);
    }
    else if (key.code == KeyCode::Enter)
    {
        status = onEnter();
        step = Step::Finished;
    }
    else if (key.code == KeyCode::Backspace)
    {
        status = onBackspace();
    }
    else if (isInterrupt(key))
    {
        status = onInterrupt();
        step = Step::Interrupted;
    }

    if (auto* err = std::get_if<TerminalIoError>(&status))
    {
        return *err;
    }
    return step;
}

TerminalStatus MaskedLineReader::onCharacter(char32_t typed)
{
    cloak::security::appendCodePoint(m_buffer, typed);

    const std::optional<char32_t> glyph{ m_echo.glyphFor(typed) };
    if (!glyph.has_value())
    {
        return std::monostate{};
    }

    // The glyph may be the typed character itself, so it goes through wiped storage too.
    cloak::security::SecureString rendered{};
    cloak::security::appendCodePoint(rendered, *glyph);
    return m_terminal.write(cloak::security::asStringView(rendered));
}

TerminalStatus MaskedLineReader::onEnter()
{
    auto wrote{ m_terminal.write("\n") };
    if (failed(wrote))
    {
        return wrote;
    }
    // Raw mode does not turn '\n' into a carriage return.
    return m_terminal.moveToNextLine(1U);
}

TerminalStatus MaskedLineReader::onBackspace()
{
    const auto column{ m_terminal.cursorColumn() };
    if (const auto* err = std::get_if<TerminalIoError>(&column))
    {
        return *err;
    }

    const Column current{ std::get<Column>(column) };
    if (current > 0U && static_cast<Column>(current - 1U) >= m_cursorBound)
    {
        for (auto step : { Erase::Left, Erase::Blank, Erase::Left })
        {
            auto status{ step == Erase::Left ? m_terminal.moveLeft(1U) : m_terminal.write(g_erase) };
            if (failed(status))
            {
                return status;
            }
        }
    }

    // The buffer shrinks even when nothing was left to erase on screen.
    [[maybe_unused]] const bool popped{ cloak::security::popCodePoint(m_buffer) };
    return std::monostate{};
}

TerminalStatus MaskedLineReader::onInterrupt()
{
    return m_terminal.write(g_interruptEcho);
}

ReadOutcome readMaskedLine(cloak::terminal::ITerminalDriver& terminal, EchoMode echo)
{
    MaskedLineReader reader{ terminal, echo };
    return reader.run();
}

TerminalResult<cloak::security::SecureString> readPassword(cloak::terminal::ITerminalDriver& terminal, EchoMode echo,
                                                           cloak::process::IProcessInterrupter& interrupter)
{
    auto outcome{ readMaskedLine(terminal, echo) };

    if (auto* done = std::get_if<Completed>(&outcome))
    {
        return std::move(done->password);
    }
    if (auto* err = std::get_if<TerminalIoError>(&outcome))
    {
        return *err;
    }

    auto raised{ interrupter.raiseInterrupt() };
    if (auto* err = std::get_if<TerminalIoError>(&raised))
    {
        return *err;
    }
    return TerminalIoError{ TerminalOperation::RaiseInterrupt, std::make_error_code(std::errc::interrupted) };
}

} // namespace cloak::core
