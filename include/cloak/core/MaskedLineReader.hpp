#ifndef INCLUDE_CLOAK_CORE_MASKEDLINEREADER_HPP
#define INCLUDE_CLOAK_CORE_MASKEDLINEREADER_HPP

#include "cloak/core/EchoMode.hpp"
#include "cloak/process/IProcessInterrupter.hpp"
#include "cloak/security/SecureString.hpp"
#include "cloak/terminal/ITerminalDriver.hpp"
#include "cloak/terminal/KeyEvent.hpp"
#include "cloak/terminal/RawModeSession.hpp"
#include "cloak/terminal/TerminalError.hpp"
#include <cstdint>
#include <variant>

namespace cloak::core
{

struct Completed final
{
    cloak::security::SecureString password;
};

// Ctrl+C was pressed; "^C" has been drawn and raw mode is already off.
struct Interrupted final
{
};

using ReadOutcome = std::variant<Completed, Interrupted, cloak::terminal::TerminalIoError>;

// Reads one line from a terminal in raw mode, drawing echo glyphs as the user types.
//
// Input starts at whatever column the cursor is on when run() is called; that column
// is the left bound that backspace never erases past. The terminal is restored to
// normal mode on every exit path.
class MaskedLineReader final
{
public:
    MaskedLineReader(cloak::terminal::ITerminalDriver& terminal, EchoMode echo) noexcept;

    [[nodiscard]] ReadOutcome run();

private:
    enum class Step : std::uint8_t
    {
        Continue,
        Finished,
        Interrupted,
    };

    [[nodiscard]] cloak::terminal::TerminalResult<Step> dispatch(const cloak::terminal::KeyEvent& key);

    [[nodiscard]] cloak::terminal::TerminalStatus onCharacter(char32_t typed);
    [[nodiscard]] cloak::terminal::TerminalStatus onEnter();
    [[nodiscard]] cloak::terminal::TerminalStatus onBackspace();
    [[nodiscard]] cloak::terminal::TerminalStatus onInterrupt();

    cloak::terminal::ITerminalDriver& m_terminal;
    EchoMode m_echo;
    cloak::terminal::Column m_cursorBound{ 0U };
    cloak::security::SecureString m_buffer{};
};

[[nodiscard]] ReadOutcome readMaskedLine(cloak::terminal::ITerminalDriver& terminal, EchoMode echo);

// Reads a password and turns Ctrl+C into the process's native interrupt.
// When the interrupt is handled and control comes back, the read reports
// TerminalOperation::RaiseInterrupt with std::errc::interrupted.
[[nodiscard]] cloak::terminal::TerminalResult<cloak::security::SecureString>
readPassword(cloak::terminal::ITerminalDriver& terminal, EchoMode echo,
             cloak::process::IProcessInterrupter& interrupter);

} // namespace cloak::core

#endif // INCLUDE_CLOAK_CORE_MASKEDLINEREADER_HPP
