#include "ConsoleUtils.hpp"

#include "cloak/terminal/KeyDecoder.hpp"
#include <cstdint>
#include <istream>
#include <ostream>
#include <stdexcept>

#if defined(_WIN32)
#define WIN32_LEAN_AND_MEAN
#define NOMINMAX
#include <Windows.h>
#elif defined(__linux__)
#include <sys/mman.h>
#include <sys/resource.h>
#elif defined(__APPLE__)
#include <sys/resource.h>
#else
#error "Unsupported platform"
#endif

namespace cloak::ui::cli
{

void lockProcessMemory() noexcept
{
#if defined(_WIN32)
    // TODO: VirtualLock the password buffers once they get a dedicated arena
#elif defined(__linux__)
    mlockall(MCL_CURRENT | MCL_FUTURE);
    struct rlimit lim
    {
        0, 0
    };
    setrlimit(RLIMIT_CORE, &lim);
#elif defined(__APPLE__)
    struct rlimit lim
    {
        0, 0
    };
    setrlimit(RLIMIT_CORE, &lim);
#endif
}

std::string readLine(std::istream& in, std::ostream& out, std::string_view prompt)
{
    out << prompt << std::flush;

    std::string line;
    if (!std::getline(in, line))
    {
        throw std::runtime_error("unexpected end of input");
    }
    if (!line.empty() && line.back() == '\r')
    {
        line.pop_back();
    }
    return line;
}

std::optional<char32_t> parseMaskCharacter(std::string_view text) noexcept
{
    cloak::terminal::KeyDecoder decoder{};
    std::optional<cloak::terminal::KeyEvent> key{};

    for (const char c : text)
    {
        if (key.has_value())
        {
            return std::nullopt;
        }
        key = decoder.feed(static_cast<std::uint8_t>(c));
    }

    if (decoder.pending() || !key.has_value())
    {
        return std::nullopt;
    }
    if (key->code != cloak::terminal::KeyCode::Char || key->modifiers != cloak::terminal::KeyModifiers::None)
    {
        return std::nullopt;
    }
    return key->ch;
}

} // namespace cloak::ui::cli
