#include <gtest/gtest.h>

#include "FakeTerminal.hpp"
#include "cloak/core/EchoMode.hpp"
#include "cloak/core/MaskedLineReader.hpp"
#include "cloak/process/native/NativeProcessInterrupterFactory.hpp"

#include <csignal>
#include <cstdlib>
#include <variant>

using cloak::core::EchoMode;
using cloak::terminal::TerminalIoError;
using cloak::terminal::TerminalOperation;
using cloak::test_utils::FakeTerminal;

namespace
{

volatile std::sig_atomic_t g_interruptsSeen{ 0 };

void countInterrupt(int /*signal*/)
{
    g_interruptsSeen = g_interruptsSeen + 1;
}

[[nodiscard]] cloak::terminal::TerminalResult<cloak::security::SecureString> readUntilCtrlC()
{
    FakeTerminal term{};
    term.type("pa");
    term.pressCtrlC();
    auto interrupter{ cloak::process::native::makeNativeProcessInterrupter() };
    return cloak::core::readPassword(term, EchoMode::mask(), *interrupter);
}

// Runs in the death test child; a shell may have started us with SIGINT ignored.
[[noreturn]] void readWithDefaultSigint()
{
    static_cast<void>(std::signal(SIGINT, SIG_DFL));
    static_cast<void>(readUntilCtrlC());
    std::exit(0);
}

[[noreturn]] void readWithHandledSigint()
{
    static_cast<void>(std::signal(SIGINT, countInterrupt));
    const auto result{ readUntilCtrlC() };

    const auto* err{ std::get_if<TerminalIoError>(&result) };
    const bool reported{ err != nullptr && err->operation == TerminalOperation::RaiseInterrupt &&
                         err->cause == std::make_error_code(std::errc::interrupted) };
    std::exit(reported && g_interruptsSeen == 1 ? 0 : 1);
}

} // namespace

TEST(NativeProcessInterrupterDeathTest, CtrlCTerminatesTheProcessWithSigint)
{
    EXPECT_EXIT(readWithDefaultSigint(), ::testing::KilledBySignal(SIGINT), "");
}

TEST(NativeProcessInterrupterDeathTest, HandledSigintFailsTheRead)
{
    EXPECT_EXIT(readWithHandledSigint(), ::testing::ExitedWithCode(0), "");
}
