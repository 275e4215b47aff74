#include "cloak/process/native/NativeProcessInterrupterFactory.hpp"

#include <cstdlib>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__unix__) || defined(__APPLE__)
#include <csignal>
#endif

namespace cloak::process::native
{
namespace
{

class NativeProcessInterrupter final : public cloak::process::IProcessInterrupter
{
public:
    [[nodiscard]] cloak::terminal::TerminalStatus raiseInterrupt() override
    {
#if defined(_WIN32)
        // Process group 0 addresses every process sharing this console, as a real Ctrl+C would.
        if (::GenerateConsoleCtrlEvent(CTRL_C_EVENT, 0) == 0)
        {
            return cloak::terminal::TerminalIoError{
                cloak::terminal::TerminalOperation::RaiseInterrupt,
                std::error_code{ static_cast<int>(::GetLastError()), std::system_category() } };
        }
        return std::monostate{};
#elif defined(__unix__) || defined(__APPLE__)
        if (std::raise(SIGINT) != 0)
        {
            return cloak::terminal::lastSystemError(cloak::terminal::TerminalOperation::RaiseInterrupt);
        }
        return std::monostate{};
#else
        std::exit(g_interruptFallbackExitStatus);
#endif
    }
};

} // namespace

std::unique_ptr<cloak::process::IProcessInterrupter> makeNativeProcessInterrupter()
{
    return std::make_unique<NativeProcessInterrupter>();
}

} // namespace cloak::process::native
