#include "cloak/terminal/RawModeSession.hpp"

#include <utility>

namespace cloak::terminal
{

RawModeSession::RawModeSession(RawModeSession&& other) noexcept
    : m_terminal{ std::exchange(other.m_terminal, nullptr) }
{
}

RawModeSession& RawModeSession::operator=(RawModeSession&& other) noexcept
{
    if (this == &other)
    {
        return *this;
    }

    restoreQuietly();
    m_terminal = std::exchange(other.m_terminal, nullptr);
    return *this;
}

RawModeSession::~RawModeSession() noexcept
{
    restoreQuietly();
}

TerminalResult<RawModeSession> RawModeSession::enter(ITerminalDriver& terminal)
{
    auto status{ terminal.enableRawMode() };
    if (auto* err = std::get_if<TerminalIoError>(&status))
    {
        return *err;
    }
    return RawModeSession{ terminal };
}

TerminalStatus RawModeSession::close()
{
    if (m_terminal == nullptr)
    {
        return std::monostate{};
    }
    return std::exchange(m_terminal, nullptr)->disableRawMode();
}

void RawModeSession::restoreQuietly() noexcept
{
    if (m_terminal == nullptr)
    {
        return;
    }

    // Errors cannot be reported from here; close() is the checked path.
    [[maybe_unused]] const auto status{ std::exchange(m_terminal, nullptr)->disableRawMode() };
}

} // namespace cloak::terminal
