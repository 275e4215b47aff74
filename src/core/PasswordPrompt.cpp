#include "cloak/core/PasswordPrompt.hpp"

#include "cloak/core/MaskedLineReader.hpp"
#include "cloak/process/native/NativeProcessInterrupterFactory.hpp"
#include "cloak/terminal/TerminalError.hpp"
#include "cloak/terminal/posix/PosixTerminalFactory.hpp"
#include <iostream>
#include <memory>
#include <system_error>
#include <utility>
#include <variant>

namespace cloak::core
{

cloak::security::SecureString promptPassword(const PromptContext& ctx, EchoMode echo, std::string_view prompt)
{
    if (!prompt.empty())
    {
        ctx.out << prompt;
    }
    ctx.out << std::flush;
    if (!ctx.out)
    {
        throw cloak::terminal::TerminalFailure{ cloak::terminal::TerminalIoError{
            cloak::terminal::TerminalOperation::Write, std::make_error_code(std::errc::io_error) } };
    }

    auto result{ readPassword(ctx.terminal, echo, ctx.interrupter) };
    if (auto* err = std::get_if<cloak::terminal::TerminalIoError>(&result))
    {
        throw cloak::terminal::TerminalFailure{ *err };
    }
    return std::move(std::get<cloak::security::SecureString>(result));
}

cloak::security::SecureString promptPassword(EchoMode echo, std::string_view prompt)
{
    auto opened{ cloak::terminal::posix::makeControllingTerminalDriver() };
    if (auto* err = std::get_if<cloak::terminal::TerminalIoError>(&opened))
    {
        throw cloak::terminal::TerminalFailure{ *err };
    }
    auto& terminal{ std::get<std::unique_ptr<cloak::terminal::ITerminalDriver>>(opened) };
    auto interrupter{ cloak::process::native::makeNativeProcessInterrupter() };

    const PromptContext ctx{ std::cout, *terminal, *interrupter };
    return promptPassword(ctx, echo, prompt);
}

cloak::security::SecureString promptPassword(std::string_view prompt)
{
    return promptPassword(EchoMode::mask(), prompt);
}

} // namespace cloak::core
