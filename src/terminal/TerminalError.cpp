#include "cloak/terminal/TerminalError.hpp"

#include <cerrno>

namespace cloak::terminal
{

std::string_view operationName(TerminalOperation op) noexcept
{
    switch (op)
    {
    case TerminalOperation::OpenTerminal:
        return "open controlling terminal";
    case TerminalOperation::EnableRawMode:
        return "enable raw mode";
    case TerminalOperation::DisableRawMode:
        return "disable raw mode";
    case TerminalOperation::ReadEvent:
        return "read key event";
    case TerminalOperation::QueryCursor:
        return "query cursor position";
    case TerminalOperation::MoveCursor:
        return "move cursor";
    case TerminalOperation::Write:
        return "write to terminal";
    case TerminalOperation::RaiseInterrupt:
        return "raise interrupt";
    }
    return "terminal operation";
}

std::string TerminalIoError::message() const
{
    std::string out{ "terminal I/O error: " };
    out += operationName(operation);
    out += " failed";
    if (cause)
    {
        out += ": ";
        out += cause.message();
    }
    return out;
}

TerminalIoError lastSystemError(TerminalOperation op) noexcept
{
    const int err{ errno };
    return TerminalIoError{ op, std::error_code{ err != 0 ? err : EIO, std::generic_category() } };
}

} // namespace cloak::terminal
