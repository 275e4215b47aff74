#ifndef CLOAK_UI_CLI_CONSOLEUTILS_HPP
#define CLOAK_UI_CLI_CONSOLEUTILS_HPP

#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>

namespace cloak::ui::cli
{

// Keeps pages out of swap and disables core dumps, so a typed password never reaches disk.
void lockProcessMemory() noexcept;

// Reads one visible line after printing `prompt`. Throws std::runtime_error at end of input.
[[nodiscard]] std::string readLine(std::istream& in, std::ostream& out, std::string_view prompt);

// Returns the code point when `text` is exactly one printable character.
[[nodiscard]] std::optional<char32_t> parseMaskCharacter(std::string_view text) noexcept;

} // namespace cloak::ui::cli

#endif // CLOAK_UI_CLI_CONSOLEUTILS_HPP
