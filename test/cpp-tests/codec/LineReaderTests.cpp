/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/base/PropertiesException.hpp"
#include "ordprops/codec/LineReader.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <sstream>
#include <tuple>

//-------------------------------------------------------------------------

using namespace ordprops;
using namespace ordprops::codec;

using namespace testing;

//-------------------------------------------------------------------------

namespace
{

std::vector<std::u32string> readAllLines(std::u32string text)
{
    LineReader reader{std::move(text)};
    std::vector<std::u32string> lines;
    while (auto line = reader.readLine()) {
        lines.push_back(std::move(*line));
    }
    return lines;
}

}  // namespace

//-------------------------------------------------------------------------

TEST(LineReaderTest, SkipsBlankAndCommentLines)
{
    EXPECT_THAT(
        readAllLines(U"a=1\n\n   \n  # hash comment\n! bang comment\n\tb=2"),
        ElementsAre(U"a=1", U"b=2"));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, StripsLeadingWhitespaceOnly)
{
    EXPECT_THAT(readAllLines(U" \t\fkey = value  \n"), ElementsAre(U"key = value  "));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, JoinsContinuationLines)
{
    EXPECT_THAT(readAllLines(U"a=1\\\n    2\\\n\t3\nb=4\n"), ElementsAre(U"a=123", U"b=4"));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, EvenBackslashesDoNotContinue)
{
    EXPECT_THAT(readAllLines(U"a=1\\\\\nb=2\n"), ElementsAre(U"a=1\\\\", U"b=2"));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, ContinuedLineMayStartWithCommentMarker)
{
    EXPECT_THAT(readAllLines(U"a=1\\\n#b\n"), ElementsAre(U"a=1#b"));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, CommentLinesAreNeverContinued)
{
    EXPECT_THAT(readAllLines(U"# comment \\\na=1\n"), ElementsAre(U"a=1"));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, HandlesAllLineTerminators)
{
    EXPECT_THAT(
        readAllLines(U"a=1\r\nb=2\rc=3\nd=4\\\r\n 5"),
        ElementsAre(U"a=1", U"b=2", U"c=3", U"d=45"));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, DropsTrailingBackslashAtEnd)
{
    EXPECT_THAT(readAllLines(U"a=1\\"), ElementsAre(U"a=1"));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, ReportsLineOfLogicalLineStart)
{
    LineReader reader{U"a=1\n\n# comment\nb=2\\\n  3\nc=4\n"};

    ASSERT_TRUE(reader.readLine().has_value());
    EXPECT_EQ(reader.lineNumber(), 1);
    ASSERT_TRUE(reader.readLine().has_value());
    EXPECT_EQ(reader.lineNumber(), 4);
    ASSERT_TRUE(reader.readLine().has_value());
    EXPECT_EQ(reader.lineNumber(), 6);
    EXPECT_FALSE(reader.readLine().has_value());
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, CountsEveryTerminatorKindOnce)
{
    LineReader reader{U"a=1\r\n\r# c\r\nb=2\\\r\n\n\rc=3"};

    ASSERT_TRUE(reader.readLine().has_value());
    EXPECT_EQ(reader.lineNumber(), 1);
    EXPECT_EQ(reader.readLine(), U"b=2");
    EXPECT_EQ(reader.lineNumber(), 4);
    ASSERT_TRUE(reader.readLine().has_value());
    EXPECT_EQ(reader.lineNumber(), 7);
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, LineNumbersStayExactOnLargeInput)
{
    static constexpr size_t lineCount = 200'000;
    std::u32string text;
    for (size_t i = 0; i < lineCount; ++i) {
        text += U"key=value\n";
    }
    text += U"last=line";
    LineReader reader{std::move(text)};

    size_t readCount = 0;
    while (reader.readLine()) {
        ++readCount;
    }

    EXPECT_EQ(readCount, lineCount + 1);
    EXPECT_EQ(reader.lineNumber(), lineCount + 1);
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, ByteStreamIsReadAsLatin1)
{
    std::istringstream is{"k=\xE9\xFF"};

    auto reader = LineReader::fromStream(is);

    EXPECT_EQ(reader.readLine(), (std::u32string{U'k', U'=', char32_t{0xE9}, char32_t{0xFF}}));
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, WideStreamIsReadAsCodePoints)
{
    std::wistringstream is{L"k=\u4E2D"};

    auto reader = LineReader::fromStream(is);

    EXPECT_EQ(reader.readLine(), U"k=\u4E2D");
}

//-------------------------------------------------------------------------

TEST(LineReaderTest, FailedStreamIsIOError)
{
    std::istringstream is{"a=1"};
    is.setstate(std::ios::failbit);

    EXPECT_THROW(std::ignore = LineReader::fromStream(is), IOError);
}

//-------------------------------------------------------------------------
