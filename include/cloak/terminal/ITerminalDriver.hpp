#ifndef INCLUDE_CLOAK_TERMINAL_ITERMINALDRIVER_HPP
#define INCLUDE_CLOAK_TERMINAL_ITERMINALDRIVER_HPP

#include "cloak/terminal/KeyEvent.hpp"
#include "cloak/terminal/TerminalError.hpp"
#include <cstdint>
#include <string_view>

namespace cloak::terminal
{

// Cursor columns are zero-based.
using Column = std::uint16_t;

class ITerminalDriver
{
public:
    ITerminalDriver() = default;
    ITerminalDriver(const ITerminalDriver&) = delete;
    ITerminalDriver& operator=(const ITerminalDriver&) = delete;
    ITerminalDriver(ITerminalDriver&&) = delete;
    ITerminalDriver& operator=(ITerminalDriver&&) = delete;
    virtual ~ITerminalDriver() = default;

    // Raw mode delivers keystrokes one by one, without line buffering, echo or signal keys.
    [[nodiscard]] virtual TerminalStatus enableRawMode() = 0;
    [[nodiscard]] virtual TerminalStatus disableRawMode() = 0;

    // Blocks until the next key event is available.
    [[nodiscard]] virtual TerminalResult<KeyEvent> readEvent() = 0;

    [[nodiscard]] virtual TerminalResult<Column> cursorColumn() = 0;

    [[nodiscard]] virtual TerminalStatus moveLeft(Column columns) = 0;

    // Moves to column 0 of the line `lines` below the current one.
    [[nodiscard]] virtual TerminalStatus moveToNextLine(std::uint16_t lines) = 0;

    [[nodiscard]] virtual TerminalStatus write(std::string_view text) = 0;
};

} // namespace cloak::terminal

#endif // INCLUDE_CLOAK_TERMINAL_ITERMINALDRIVER_HPP
