#include "ConsoleUtils.hpp"

#include "cloak/core/EchoMode.hpp"
#include "cloak/core/PasswordPrompt.hpp"
#include "cloak/security/SecureString.hpp"
#include <CLI/CLI.hpp>
#include <exception>
#include <iostream>
#include <optional>
#include <string>

int main(int argc, char** argv)
{
    CLI::App app{ "cloak-prompt: read a password from the terminal without echoing it" };

    std::string prompt{ "Password: " };
    std::string mask{ "*" };
    bool noEcho{ false };
    bool plain{ false };
    bool askUsername{ false };
    bool show{ false };
    bool noMlock{ false };

    auto* promptOpt = app.add_option("-p,--prompt", prompt, "Prompt printed before reading");
    auto* maskOpt = app.add_option("-m,--mask", mask, "Character drawn for every typed character");
    auto* noEchoFlag = app.add_flag("-n,--no-echo", noEcho, "Draw nothing while typing");
    auto* plainFlag = app.add_flag("--plain", plain, "Draw the typed characters themselves");
    noEchoFlag->excludes(plainFlag);
    maskOpt->excludes(noEchoFlag);
    maskOpt->excludes(plainFlag);
    app.add_flag("-u,--username", askUsername, "Ask for a username first and name it in the prompt");
    app.add_flag("-s,--show", show, "Print the captured value afterwards");
    app.add_flag("--no-mlock", noMlock, "Do not lock process memory");

    CLI11_PARSE(app, argc, argv);

    cloak::core::EchoMode echo{ cloak::core::EchoMode::mask() };
    if (noEcho)
    {
        echo = cloak::core::EchoMode::suppressed();
    }
    else if (plain)
    {
        echo = cloak::core::EchoMode::plain();
    }
    else
    {
        const std::optional<char32_t> maskChar{ cloak::ui::cli::parseMaskCharacter(mask) };
        if (!maskChar.has_value())
        {
            std::cerr << "error: --mask takes exactly one printable character\n";
            return 2;
        }
        echo = cloak::core::EchoMode::mask(*maskChar);
    }

    try
    {
        if (!noMlock)
        {
            cloak::ui::cli::lockProcessMemory();
        }

        if (askUsername)
        {
            const std::string username{ cloak::ui::cli::readLine(std::cin, std::cout, "Username: ") };
            if (promptOpt->count() == 0U)
            {
                prompt = cloak::core::formatPrompt("Password for ", username, ": ");
            }
        }

        auto password{ cloak::core::promptPassword(echo, prompt) };
        if (show)
        {
            std::cout << '"' << cloak::security::asStringView(password) << "\" was entered\n";
        }
        cloak::security::secureRelease(password);
        return 0;
    }
    catch (const std::exception& e)
    {
        std::cerr << "fatal: " << e.what() << '\n';
        return 1;
    }
}
