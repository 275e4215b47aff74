#ifndef INCLUDE_CLOAK_TERMINAL_RAWMODESESSION_HPP
#define INCLUDE_CLOAK_TERMINAL_RAWMODESESSION_HPP

#include "cloak/terminal/ITerminalDriver.hpp"
#include "cloak/terminal/TerminalError.hpp"

namespace cloak::terminal
{

// Holds a terminal in raw mode for the lifetime of the object.
// close() restores normal mode and reports failure; the destructor restores it
// on any path that did not call close().
class [[nodiscard]] RawModeSession final
{
public:
    RawModeSession(const RawModeSession&) = delete;
    RawModeSession& operator=(const RawModeSession&) = delete;

    RawModeSession(RawModeSession&& other) noexcept;
    RawModeSession& operator=(RawModeSession&& other) noexcept;

    ~RawModeSession() noexcept;

    [[nodiscard]] static TerminalResult<RawModeSession> enter(ITerminalDriver& terminal);

    [[nodiscard]] TerminalStatus close();

    [[nodiscard]] bool active() const noexcept
    {
        return m_terminal != nullptr;
    }

private:
    explicit RawModeSession(ITerminalDriver& terminal) noexcept : m_terminal{ &terminal }
    {
    }

    void restoreQuietly() noexcept;

    ITerminalDriver* m_terminal{ nullptr };
};

} // namespace cloak::terminal

#endif // INCLUDE_CLOAK_TERMINAL_RAWMODESESSION_HPP
