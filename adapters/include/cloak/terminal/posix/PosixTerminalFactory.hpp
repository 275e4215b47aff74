#ifndef INCLUDE_CLOAK_TERMINAL_POSIX_POSIXTERMINALFACTORY_HPP
#define INCLUDE_CLOAK_TERMINAL_POSIX_POSIXTERMINALFACTORY_HPP

#include "cloak/terminal/ITerminalDriver.hpp"
#include "cloak/terminal/TerminalError.hpp"
#include <chrono>
#include <memory>
#include <string>

namespace cloak::terminal::posix
{

struct TerminalOptions final
{
    // Raw mode is applied to inputFd; escape sequences and echo go to outputFd.
    int inputFd{ 0 };
    int outputFd{ 1 };

    // How long to wait for the rest of an escape sequence before treating ESC as a key.
    std::chrono::milliseconds escapeTimeout{ 50 };

    // How long to wait for the terminal to answer a cursor position request.
    std::chrono::milliseconds cursorReportTimeout{ 2000 };
};

// termios-based driver that speaks ANSI escape sequences. The file descriptors are
// borrowed; the caller keeps them open for the driver's lifetime.
[[nodiscard]] std::unique_ptr<cloak::terminal::ITerminalDriver> makePosixTerminalDriver(TerminalOptions options = {});

// Driver for the terminal the user is sitting at. options.inputFd and options.outputFd are
// used as given when inputFd is a terminal. Otherwise (input redirected from a pipe or file)
// ttyPath is opened for both input and output, and the driver closes it when destroyed.
[[nodiscard]] cloak::terminal::TerminalResult<std::unique_ptr<cloak::terminal::ITerminalDriver>>
makeControllingTerminalDriver(TerminalOptions options = {}, const std::string& ttyPath = "/dev/tty");

} // namespace cloak::terminal::posix

#endif // INCLUDE_CLOAK_TERMINAL_POSIX_POSIXTERMINALFACTORY_HPP
