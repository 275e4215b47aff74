#include "cloak/terminal/KeyDecoder.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <optional>
#include <string_view>
#include <vector>

using cloak::terminal::KeyCode;
using cloak::terminal::KeyDecoder;
using cloak::terminal::KeyEvent;
using cloak::terminal::KeyModifiers;

namespace
{

std::vector<KeyEvent> decodeAll(std::string_view bytes)
{
    KeyDecoder decoder{};
    std::vector<KeyEvent> out{};
    for (const char c : bytes)
    {
        if (auto key = decoder.feed(static_cast<std::uint8_t>(c)))
        {
            out.push_back(*key);
        }
    }
    if (auto key = decoder.flush())
    {
        out.push_back(*key);
    }
    return out;
}

} // namespace

TEST(KeyDecoderTest, PrintableBytesAreCharacters)
{
    EXPECT_THAT(decodeAll("aZ ~"),
                ::testing::ElementsAre(KeyEvent::character(U'a'), KeyEvent::character(U'Z'),
                                       KeyEvent::character(U' '), KeyEvent::character(U'~')));
}

TEST(KeyDecoderTest, CarriageReturnAndLineFeedAreEnter)
{
    EXPECT_THAT(decodeAll("\r\n"),
                ::testing::ElementsAre(KeyEvent::key(KeyCode::Enter), KeyEvent::key(KeyCode::Enter)));
}

TEST(KeyDecoderTest, DeleteAndBackspaceBytesAreBackspace)
{
    EXPECT_THAT(decodeAll("\x7f\x08"),
                ::testing::ElementsAre(KeyEvent::key(KeyCode::Backspace), KeyEvent::key(KeyCode::Backspace)));
}

TEST(KeyDecoderTest, EtxIsControlC)
{
    EXPECT_THAT(decodeAll("\x03"), ::testing::ElementsAre(KeyEvent::character(U'c', KeyModifiers::Control)));
}

TEST(KeyDecoderTest, ControlLettersMapToLowercase)
{
    EXPECT_THAT(decodeAll("\x01\x1a\x04"),
                ::testing::ElementsAre(KeyEvent::character(U'a', KeyModifiers::Control),
                                       KeyEvent::character(U'z', KeyModifiers::Control),
                                       KeyEvent::character(U'd', KeyModifiers::Control)));
}

TEST(KeyDecoderTest, TabIsNotAControlLetter)
{
    EXPECT_THAT(decodeAll("\t"), ::testing::ElementsAre(KeyEvent::key(KeyCode::Tab)));
}

TEST(KeyDecoderTest, CsiSequencesCollapseToOneEvent)
{
    // Up arrow, Delete, and a modified F5.
    EXPECT_THAT(decodeAll("\x1b[A\x1b[3~\x1b[15;5~x"),
                ::testing::ElementsAre(KeyEvent::key(KeyCode::Other), KeyEvent::key(KeyCode::Other),
                                       KeyEvent::key(KeyCode::Other), KeyEvent::character(U'x')));
}

TEST(KeyDecoderTest, Ss3SequenceCollapsesToOneEvent)
{
    EXPECT_THAT(decodeAll("\x1bOPq"),
                ::testing::ElementsAre(KeyEvent::key(KeyCode::Other), KeyEvent::character(U'q')));
}

TEST(KeyDecoderTest, EscapePrefixIsAlt)
{
    EXPECT_THAT(decodeAll("\x1b" "b\x1b\x7f"),
                ::testing::ElementsAre(KeyEvent::character(U'b', KeyModifiers::Alt),
                                       KeyEvent::key(KeyCode::Backspace, KeyModifiers::Alt)));
}

TEST(KeyDecoderTest, LoneEscapeResolvesOnFlush)
{
    KeyDecoder decoder{};
    EXPECT_FALSE(decoder.feed(0x1BU).has_value());
    EXPECT_TRUE(decoder.pending());

    EXPECT_EQ(decoder.flush(), KeyEvent::key(KeyCode::Escape));
    EXPECT_FALSE(decoder.pending());
    EXPECT_FALSE(decoder.flush().has_value());
}

TEST(KeyDecoderTest, AssemblesMultiByteUtf8)
{
    EXPECT_THAT(decodeAll("\xC3\xA9\xE2\x82\xAC\xF0\x9F\x94\x91"),
                ::testing::ElementsAre(KeyEvent::character(U'é'), KeyEvent::character(U'€'),
                                       KeyEvent::character(U'\U0001F511')));
}

TEST(KeyDecoderTest, RejectsOverlongAndTruncatedUtf8)
{
    // Overlong "/" then a lead byte interrupted by ASCII.
    EXPECT_THAT(decodeAll("\xE0\x80\xAF\xC3" "a"),
                ::testing::ElementsAre(KeyEvent::key(KeyCode::Other), KeyEvent::key(KeyCode::Other)));
}

TEST(KeyDecoderTest, StrayContinuationByteIsOther)
{
    EXPECT_THAT(decodeAll("\x80"), ::testing::ElementsAre(KeyEvent::key(KeyCode::Other)));
}

TEST(KeyDecoderTest, TruncatedSequenceFlushesAsOther)
{
    KeyDecoder decoder{};
    EXPECT_FALSE(decoder.feed(0xE2U).has_value());
    EXPECT_EQ(decoder.flush(), KeyEvent::key(KeyCode::Other));
}

TEST(KeyDecoderTest, ControlByteInsideCsiIsStillDelivered)
{
    EXPECT_THAT(decodeAll("\x1b[\x03"), ::testing::ElementsAre(KeyEvent::character(U'c', KeyModifiers::Control)));
    EXPECT_THAT(decodeAll("\x1b[1;\r"), ::testing::ElementsAre(KeyEvent::key(KeyCode::Enter)));
}

TEST(KeyDecoderTest, ControlByteAfterSs3IsStillDelivered)
{
    EXPECT_THAT(decodeAll("\x1bO\x03x"),
                ::testing::ElementsAre(KeyEvent::character(U'c', KeyModifiers::Control), KeyEvent::character(U'x')));
}

TEST(KeyDecoderTest, EscapeInsideCsiStartsANewSequence)
{
    EXPECT_THAT(decodeAll("\x1b[2\x1b[B"), ::testing::ElementsAre(KeyEvent::key(KeyCode::Other)));
}
