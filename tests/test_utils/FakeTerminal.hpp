#ifndef CLOAK_TESTS_TEST_UTILS_FAKETERMINAL_HPP
#define CLOAK_TESTS_TEST_UTILS_FAKETERMINAL_HPP

#include "cloak/terminal/ITerminalDriver.hpp"
#include "cloak/terminal/KeyEvent.hpp"
#include "cloak/terminal/TerminalError.hpp"
#include <cstddef>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace cloak::test_utils
{

// Scripted terminal: replays queued key events and tracks the cursor column the way a
// real terminal in raw mode would ('\n' moves down only, escape moves are relative).
// Everything written, cursor moves included, is recorded as ANSI text in transcript().
class FakeTerminal final : public cloak::terminal::ITerminalDriver
{
public:
    explicit FakeTerminal(cloak::terminal::Column startColumn = 0U) : m_column{ startColumn }
    {
    }

    void push(cloak::terminal::KeyEvent key)
    {
        m_events.push_back(key);
    }

    // Queues one plain character event per code unit of an ASCII string.
    void type(std::string_view text)
    {
        for (const char c : text)
        {
            push(cloak::terminal::KeyEvent::character(static_cast<char32_t>(static_cast<unsigned char>(c))));
        }
    }

    void pressEnter()
    {
        push(cloak::terminal::KeyEvent::key(cloak::terminal::KeyCode::Enter));
    }

    void pressBackspace(std::size_t times = 1U)
    {
        for (std::size_t i{ 0U }; i < times; ++i)
        {
            push(cloak::terminal::KeyEvent::key(cloak::terminal::KeyCode::Backspace));
        }
    }

    void pressCtrlC()
    {
        push(cloak::terminal::KeyEvent::character(U'c', cloak::terminal::KeyModifiers::Control));
    }

    // Makes call number `skip` + 1 of `op` fail with `cause`.
    void failOn(cloak::terminal::TerminalOperation op, std::size_t skip = 0U,
                std::errc cause = std::errc::io_error)
    {
        m_failures[op] = Failure{ skip, std::make_error_code(cause) };
    }

    // Runs right after raw mode is switched on.
    void onRawModeEnabled(std::function<void()> hook)
    {
        m_onEnable = std::move(hook);
    }

    [[nodiscard]] const std::string& transcript() const noexcept
    {
        return m_transcript;
    }

    [[nodiscard]] cloak::terminal::Column column() const noexcept
    {
        return m_column;
    }

    [[nodiscard]] bool rawMode() const noexcept
    {
        return m_raw;
    }

    [[nodiscard]] int enableCalls() const noexcept
    {
        return m_enableCalls;
    }

    [[nodiscard]] int disableCalls() const noexcept
    {
        return m_disableCalls;
    }

    [[nodiscard]] std::size_t cursorQueries() const noexcept
    {
        return m_cursorQueries;
    }

    [[nodiscard]] std::size_t eventsLeft() const noexcept
    {
        return m_events.size();
    }

    [[nodiscard]] cloak::terminal::TerminalStatus enableRawMode() override
    {
        ++m_enableCalls;
        if (auto err = injected(cloak::terminal::TerminalOperation::EnableRawMode))
        {
            return *err;
        }
        m_raw = true;
        if (m_onEnable)
        {
            m_onEnable();
        }
        return std::monostate{};
    }

    [[nodiscard]] cloak::terminal::TerminalStatus disableRawMode() override
    {
        ++m_disableCalls;
        if (auto err = injected(cloak::terminal::TerminalOperation::DisableRawMode))
        {
            return *err;
        }
        m_raw = false;
        return std::monostate{};
    }

    [[nodiscard]] cloak::terminal::TerminalResult<cloak::terminal::KeyEvent> readEvent() override
    {
        if (auto err = injected(cloak::terminal::TerminalOperation::ReadEvent))
        {
            return *err;
        }
        if (m_events.empty())
        {
            return cloak::terminal::TerminalIoError{ cloak::terminal::TerminalOperation::ReadEvent,
                                                     std::make_error_code(std::errc::no_message_available) };
        }
        const auto key{ m_events.front() };
        m_events.pop_front();
        return key;
    }

    [[nodiscard]] cloak::terminal::TerminalResult<cloak::terminal::Column> cursorColumn() override
    {
        ++m_cursorQueries;
        if (auto err = injected(cloak::terminal::TerminalOperation::QueryCursor))
        {
            return *err;
        }
        return m_column;
    }

    [[nodiscard]] cloak::terminal::TerminalStatus moveLeft(cloak::terminal::Column columns) override
    {
        if (auto err = injected(cloak::terminal::TerminalOperation::MoveCursor))
        {
            return *err;
        }
        m_column = columns > m_column ? 0U : static_cast<cloak::terminal::Column>(m_column - columns);
        m_transcript += "\x1b[" + std::to_string(columns) + "D";
        return std::monostate{};
    }

    [[nodiscard]] cloak::terminal::TerminalStatus moveToNextLine(std::uint16_t lines) override
    {
        if (auto err = injected(cloak::terminal::TerminalOperation::MoveCursor))
        {
            return *err;
        }
        m_column = 0U;
        m_transcript += "\x1b[" + std::to_string(lines) + "E";
        return std::monostate{};
    }

    [[nodiscard]] cloak::terminal::TerminalStatus write(std::string_view text) override
    {
        if (auto err = injected(cloak::terminal::TerminalOperation::Write))
        {
            return *err;
        }
        for (const char c : text)
        {
            const auto byte{ static_cast<unsigned char>(c) };
            // '\n' moves down without returning; UTF-8 continuation bytes take no column.
            if (c != '\n' && (byte & 0xC0U) != 0x80U)
            {
                ++m_column;
            }
        }
        m_transcript.append(text);
        return std::monostate{};
    }

private:
    struct Failure
    {
        std::size_t skip{ 0U };
        std::error_code cause{};
    };

    [[nodiscard]] std::optional<cloak::terminal::TerminalIoError> injected(cloak::terminal::TerminalOperation op)
    {
        auto it{ m_failures.find(op) };
        if (it == m_failures.end())
        {
            return std::nullopt;
        }
        if (it->second.skip > 0U)
        {
            --it->second.skip;
            return std::nullopt;
        }
        const cloak::terminal::TerminalIoError err{ op, it->second.cause };
        m_failures.erase(it);
        return err;
    }

    std::deque<cloak::terminal::KeyEvent> m_events{};
    std::map<cloak::terminal::TerminalOperation, Failure> m_failures{};
    std::function<void()> m_onEnable{};
    std::string m_transcript{};
    cloak::terminal::Column m_column{ 0U };
    bool m_raw{ false };
    int m_enableCalls{ 0 };
    int m_disableCalls{ 0 };
    std::size_t m_cursorQueries{ 0U };
};

} // namespace cloak::test_utils

#endif // CLOAK_TESTS_TEST_UTILS_FAKETERMINAL_HPP
