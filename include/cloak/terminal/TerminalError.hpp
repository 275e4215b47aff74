#ifndef INCLUDE_CLOAK_TERMINAL_TERMINALERROR_HPP
#define INCLUDE_CLOAK_TERMINAL_TERMINALERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <system_error>
#include <variant>

namespace cloak::terminal
{

enum class TerminalOperation : std::uint8_t
{
    OpenTerminal,
    EnableRawMode,
    DisableRawMode,
    ReadEvent,
    QueryCursor,
    MoveCursor,
    Write,
    RaiseInterrupt,
};

[[nodiscard]] std::string_view operationName(TerminalOperation op) noexcept;

struct TerminalIoError final
{
    TerminalOperation operation{ TerminalOperation::ReadEvent };
    std::error_code cause{};

    [[nodiscard]] std::string message() const;

    friend bool operator==(const TerminalIoError&, const TerminalIoError&) = default;
};

// Builds an error from the current errno.
[[nodiscard]] TerminalIoError lastSystemError(TerminalOperation op) noexcept;

template <class T> using TerminalResult = std::variant<T, TerminalIoError>;
using TerminalStatus = TerminalResult<std::monostate>;

// Thrown by the convenience prompt layer, which treats any terminal failure as fatal.
class TerminalFailure final : public std::runtime_error
{
public:
    explicit TerminalFailure(const TerminalIoError& error) : std::runtime_error{ error.message() }, m_error{ error }
    {
    }

    [[nodiscard]] const TerminalIoError& error() const noexcept
    {
        return m_error;
    }

private:
    TerminalIoError m_error;
};

} // namespace cloak::terminal

#endif // INCLUDE_CLOAK_TERMINAL_TERMINALERROR_HPP
