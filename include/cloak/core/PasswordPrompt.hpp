#ifndef INCLUDE_CLOAK_CORE_PASSWORDPROMPT_HPP
#define INCLUDE_CLOAK_CORE_PASSWORDPROMPT_HPP

#include "cloak/core/EchoMode.hpp"
#include "cloak/process/IProcessInterrupter.hpp"
#include "cloak/security/SecureString.hpp"
#include "cloak/terminal/ITerminalDriver.hpp"
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>

namespace cloak::core
{

// Where a prompt is printed and the password is read from.
struct PromptContext final
{
    std::ostream& out;
    cloak::terminal::ITerminalDriver& terminal;
    cloak::process::IProcessInterrupter& interrupter;
};

// Writes `prompt` to ctx.out, flushes it, then reads a password on ctx.terminal.
// Input starts right after the prompt. Any terminal failure throws
// cloak::terminal::TerminalFailure; use readPassword() to handle errors instead.
[[nodiscard]] cloak::security::SecureString promptPassword(const PromptContext& ctx, EchoMode echo,
                                                           std::string_view prompt);

// Console variants: prompt on std::cout, read from the process's standard input terminal.
[[nodiscard]] cloak::security::SecureString promptPassword(EchoMode echo = EchoMode::mask(),
                                                           std::string_view prompt = {});
[[nodiscard]] cloak::security::SecureString promptPassword(std::string_view prompt);

// Concatenates everything streamable into one prompt, e.g.
// formatPrompt("Password for ", user, ": ").
template <class... Parts> [[nodiscard]] std::string formatPrompt(const Parts&... parts)
{
    std::ostringstream os{};
    (os << ... << parts);
    return os.str();
}

} // namespace cloak::core

#endif // INCLUDE_CLOAK_CORE_PASSWORDPROMPT_HPP
