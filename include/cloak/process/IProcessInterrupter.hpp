#ifndef INCLUDE_CLOAK_PROCESS_IPROCESSINTERRUPTER_HPP
#define INCLUDE_CLOAK_PROCESS_IPROCESSINTERRUPTER_HPP

#include "cloak/terminal/TerminalError.hpp"

namespace cloak::process
{

// Delivers the platform's native interrupt (what Ctrl+C does in a cooked terminal)
// to the current process.
class IProcessInterrupter
{
public:
    IProcessInterrupter() = default;
    IProcessInterrupter(const IProcessInterrupter&) = delete;
    IProcessInterrupter& operator=(const IProcessInterrupter&) = delete;
    IProcessInterrupter(IProcessInterrupter&&) = delete;
    IProcessInterrupter& operator=(IProcessInterrupter&&) = delete;
    virtual ~IProcessInterrupter() = default;

    // With the default disposition this does not return. It returns when the
    // process handles or ignores the interrupt, or when delivery failed.
    [[nodiscard]] virtual cloak::terminal::TerminalStatus raiseInterrupt() = 0;
};

} // namespace cloak::process

#endif // INCLUDE_CLOAK_PROCESS_IPROCESSINTERRUPTER_HPP
