#include "cloak/terminal/KeyDecoder.hpp"
#include "cloak/terminal/posix/PosixTerminalFactory.hpp"
#include "cloak/security/SecureBuffer.hpp"

#include <charconv>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

#if defined(__unix__) || defined(__APPLE__)
#include <fcntl.h>
#include <poll.h>
#include <termios.h>
#include <unistd.h>
#else
#error "Unsupported platform"
#endif

namespace cloak::terminal::posix
{
namespace
{

using Clock = std::chrono::steady_clock;

constexpr std::uint8_t g_esc{ 0x1BU };
constexpr std::string_view g_cursorReportRequest{ "\x1b[6n" };

[[nodiscard]] TerminalIoError errorOf(TerminalOperation op, std::errc code) noexcept
{
    return TerminalIoError{ op, std::make_error_code(code) };
}

[[nodiscard]] std::string csi(std::uint16_t count, char final)
{
    std::string seq{ "\x1b[" };
    seq += std::to_string(count);
    seq.push_back(final);
    return seq;
}

// Parses the "row;col" part of ESC [ row ; col R and returns the zero-based column.
[[nodiscard]] std::optional<Column> parseCursorReport(std::string_view body) noexcept
{
    const auto sep{ body.find(';') };
    if (sep == std::string_view::npos)
    {
        return std::nullopt;
    }

    const std::string_view colText{ body.substr(sep + 1U) };
    unsigned long col{ 0U };
    const auto [end, ec]{ std::from_chars(colText.data(), colText.data() + colText.size(), col) };
    if (ec != std::errc{} || end != colText.data() + colText.size())
    {
        return std::nullopt;
    }

    constexpr unsigned long kMaxColumn{ std::numeric_limits<Column>::max() };
    if (col == 0U)
    {
        return Column{ 0U };
    }
    if (col > kMaxColumn)
    {
        col = kMaxColumn;
    }
    return static_cast<Column>(col - 1U);
}

class PosixTerminalDriver final : public cloak::terminal::ITerminalDriver
{
public:
    // ownedFd, when not -1, is closed by the destructor.
    explicit PosixTerminalDriver(TerminalOptions options, int ownedFd = -1) noexcept
        : m_options{ options }, m_ownedFd{ ownedFd }
    {
    }

    PosixTerminalDriver(const PosixTerminalDriver&) = delete;
    PosixTerminalDriver& operator=(const PosixTerminalDriver&) = delete;
    PosixTerminalDriver(PosixTerminalDriver&&) = delete;
    PosixTerminalDriver& operator=(PosixTerminalDriver&&) = delete;

    ~PosixTerminalDriver() override
    {
        if (m_saved.has_value())
        {
            static_cast<void>(::tcsetattr(m_options.inputFd, TCSANOW, &*m_saved));
        }
        cloak::security::secureClear(m_pending);
        if (m_ownedFd >= 0)
        {
            static_cast<void>(::close(m_ownedFd));
        }
    }

    [[nodiscard]] TerminalStatus enableRawMode() override
    {
        if (m_saved.has_value())
        {
            return std::monostate{};
        }

        struct termios original
        {
        };
        if (::tcgetattr(m_options.inputFd, &original) != 0)
        {
            return lastSystemError(TerminalOperation::EnableRawMode);
        }

        struct termios raw{ original };
        // No break, no CR to NL, no parity check, no strip char, no start/stop output control.
        raw.c_iflag &= ~static_cast<tcflag_t>(BRKINT | ICRNL | INPCK | ISTRIP | IXON);
        raw.c_oflag &= ~static_cast<tcflag_t>(OPOST);
        raw.c_cflag |= static_cast<tcflag_t>(CS8);
        // No echo, no canonical line editing, no extended functions, no signal keys (^C, ^Z).
        raw.c_lflag &= ~static_cast<tcflag_t>(ECHO | ICANON | IEXTEN | ISIG);
        raw.c_cc[VMIN] = 1;
        raw.c_cc[VTIME] = 0;

        // TCSANOW keeps keys typed before the switch.
        if (::tcsetattr(m_options.inputFd, TCSANOW, &raw) != 0)
        {
            return lastSystemError(TerminalOperation::EnableRawMode);
        }

        m_saved = original;
        m_decoder.reset();
        return std::monostate{};
    }

    [[nodiscard]] TerminalStatus disableRawMode() override
    {
        if (!m_saved.has_value())
        {
            return std::monostate{};
        }

        if (::tcsetattr(m_options.inputFd, TCSANOW, &*m_saved) != 0)
        {
            return lastSystemError(TerminalOperation::DisableRawMode);
        }

        m_saved.reset();
        m_decoder.reset();
        cloak::security::secureClear(m_pending);
        return std::monostate{};
    }

    [[nodiscard]] TerminalResult<KeyEvent> readEvent() override
    {
        for (;;)
        {
            std::optional<std::chrono::milliseconds> timeout{};
            if (m_decoder.pending())
            {
                timeout = m_options.escapeTimeout;
            }

            auto next{ nextInputByte(TerminalOperation::ReadEvent, timeout) };
            if (auto* err = std::get_if<TerminalIoError>(&next))
            {
                return *err;
            }

            const auto& byte{ std::get<std::optional<std::uint8_t>>(next) };
            std::optional<KeyEvent> key{ byte.has_value() ? m_decoder.feed(*byte) : m_decoder.flush() };
            if (key.has_value())
            {
                return *key;
            }
        }
    }

    [[nodiscard]] TerminalResult<Column> cursorColumn() override
    {
        // Keys already waiting were typed before the request, so none of them is the report
        // even when shaped like one (xterm's Shift+F3 is ESC [ 1 ; 2 R).
        auto drained{ drainTypedAhead() };
        if (auto* err = std::get_if<TerminalIoError>(&drained))
        {
            return *err;
        }

        auto requested{ writeAll(TerminalOperation::QueryCursor, g_cursorReportRequest) };
        if (auto* err = std::get_if<TerminalIoError>(&requested))
        {
            return *err;
        }

        const Clock::time_point deadline{ Clock::now() + m_options.cursorReportTimeout };
        cloak::security::SecureBuffer reply{};

        for (;;)
        {
            const auto left{ std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()) };
            if (left.count() <= 0)
            {
                stash(reply);
                return errorOf(TerminalOperation::QueryCursor, std::errc::timed_out);
            }

            auto next{ readFromTerminal(TerminalOperation::QueryCursor, left) };
            if (auto* err = std::get_if<TerminalIoError>(&next))
            {
                stash(reply);
                return *err;
            }
            const auto& got{ std::get<std::optional<std::uint8_t>>(next) };
            if (!got.has_value())
            {
                continue;
            }

            const std::uint8_t byte{ *got };
            if (reply.empty())
            {
                if (byte == g_esc)
                {
                    reply.push_back(byte);
                }
                else
                {
                    // A key typed ahead of the report; readEvent() delivers it later.
                    m_pending.push_back(byte);
                }
                continue;
            }

            if (byte == g_esc)
            {
                // The bytes so far were a key; the report may start here.
                stash(reply);
                reply.push_back(byte);
                continue;
            }

            if (reply.size() == 1U)
            {
                reply.push_back(byte);
                if (byte != '[')
                {
                    stash(reply);
                }
                continue;
            }

            if ((byte >= '0' && byte <= '9') || byte == ';')
            {
                reply.push_back(byte);
                continue;
            }

            if (byte == 'R')
            {
                const std::string_view body{ reinterpret_cast<const char*>(reply.data()) + 2U, reply.size() - 2U };
                if (const auto column{ parseCursorReport(body) })
                {
                    cloak::security::secureClear(reply);
                    return *column;
                }
            }

            // Some other escape sequence typed by the user.
            reply.push_back(byte);
            stash(reply);
        }
    }

    [[nodiscard]] TerminalStatus moveLeft(Column columns) override
    {
        if (columns == 0U)
        {
            return std::monostate{};
        }
        return writeAll(TerminalOperation::MoveCursor, csi(columns, 'D'));
    }

    [[nodiscard]] TerminalStatus moveToNextLine(std::uint16_t lines) override
    {
        if (lines == 0U)
        {
            return std::monostate{};
        }
        return writeAll(TerminalOperation::MoveCursor, csi(lines, 'E'));
    }

    [[nodiscard]] TerminalStatus write(std::string_view text) override
    {
        return writeAll(TerminalOperation::Write, text);
    }

private:
    [[nodiscard]] TerminalStatus writeAll(TerminalOperation op, std::string_view bytes) const
    {
        while (!bytes.empty())
        {
            const ssize_t n{ ::write(m_options.outputFd, bytes.data(), bytes.size()) };
            if (n < 0)
            {
                if (errno == EINTR)
                {
                    continue;
                }
                return lastSystemError(op);
            }
            bytes.remove_prefix(static_cast<std::size_t>(n));
        }
        return std::monostate{};
    }

    [[nodiscard]] TerminalStatus drainTypedAhead()
    {
        for (;;)
        {
            auto next{ readFromTerminal(TerminalOperation::QueryCursor, std::chrono::milliseconds{ 0 }) };
            if (auto* err = std::get_if<TerminalIoError>(&next))
            {
                return *err;
            }
            const auto& got{ std::get<std::optional<std::uint8_t>>(next) };
            if (!got.has_value())
            {
                return std::monostate{};
            }
            m_pending.push_back(*got);
        }
    }

    // Bytes stashed while waiting for a cursor report come first.
    [[nodiscard]] TerminalResult<std::optional<std::uint8_t>>
    nextInputByte(TerminalOperation op, std::optional<std::chrono::milliseconds> timeout)
    {
        if (!m_pending.empty())
        {
            const std::uint8_t byte{ m_pending.front() };
            cloak::security::secureErasePrefix(m_pending, 1U);
            return std::optional<std::uint8_t>{ byte };
        }
        return readFromTerminal(op, timeout);
    }

    // Returns std::nullopt when the timeout elapsed with nothing to read.
    [[nodiscard]] TerminalResult<std::optional<std::uint8_t>>
    readFromTerminal(TerminalOperation op, std::optional<std::chrono::milliseconds> timeout) const
    {
        if (timeout.has_value())
        {
            struct pollfd pfd
            {
                m_options.inputFd, POLLIN, 0
            };
            for (;;)
            {
                const int ready{ ::poll(&pfd, 1, static_cast<int>(timeout->count())) };
                if (ready < 0)
                {
                    if (errno == EINTR)
                    {
                        continue;
                    }
                    return lastSystemError(op);
                }
                if (ready == 0)
                {
                    return std::optional<std::uint8_t>{};
                }
                break;
            }
        }

        for (;;)
        {
            std::uint8_t byte{ 0U };
            const ssize_t n{ ::read(m_options.inputFd, &byte, 1U) };
            if (n == 1)
            {
                return std::optional<std::uint8_t>{ byte };
            }
            if (n == 0)
            {
                return errorOf(op, std::errc::io_error);
            }
            if (errno != EINTR)
            {
                return lastSystemError(op);
            }
        }
    }

    void stash(cloak::security::SecureBuffer& bytes)
    {
        m_pending.insert(m_pending.end(), bytes.begin(), bytes.end());
        cloak::security::secureClear(bytes);
    }

    TerminalOptions m_options;
    int m_ownedFd{ -1 };
    std::optional<struct termios> m_saved{};
    cloak::terminal::KeyDecoder m_decoder{};
    cloak::security::SecureBuffer m_pending{};
};

} // namespace

std::unique_ptr<cloak::terminal::ITerminalDriver> makePosixTerminalDriver(TerminalOptions options)
{
    return std::make_unique<PosixTerminalDriver>(options);
}

TerminalResult<std::unique_ptr<cloak::terminal::ITerminalDriver>>
makeControllingTerminalDriver(TerminalOptions options, const std::string& ttyPath)
{
    if (::isatty(options.inputFd) == 1)
    {
        return makePosixTerminalDriver(options);
    }

    const int fd{ ::open(ttyPath.c_str(), O_RDWR | O_NOCTTY | O_CLOEXEC) };
    if (fd < 0)
    {
        return lastSystemError(TerminalOperation::OpenTerminal);
    }

    options.inputFd = fd;
    options.outputFd = fd;
    return std::unique_ptr<cloak::terminal::ITerminalDriver>{ std::make_unique<PosixTerminalDriver>(options, fd) };
}

} // namespace cloak::terminal::posix
