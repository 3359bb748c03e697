/*
 * SPDX-FileCopyrightText: 2025 Rayleigh Research <to@rayleigh.re>
 * SPDX-License-Identifier: MIT
 */
#include "ordprops/util/unicode.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

//-------------------------------------------------------------------------

using namespace ordprops::util;

using namespace testing;

//-------------------------------------------------------------------------

TEST(UnicodeTest, DecodesMultiByteSequences)
{
    EXPECT_EQ(utf8ToCodePoints("a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80"), U"a\u00E9\u4E2D\U0001F600");
}

//-------------------------------------------------------------------------

TEST(UnicodeTest, IllFormedInputDecodesToReplacementChar)
{
    EXPECT_EQ(utf8ToCodePoints("\xC3"), std::u32string{kReplacementChar});
    EXPECT_EQ(utf8ToCodePoints("a\xFF" "b"), (std::u32string{U'a', kReplacementChar, U'b'}));
}

//-------------------------------------------------------------------------

TEST(UnicodeTest, EncodesCodePoints)
{
    EXPECT_EQ(codePointsToUtf8(U"a\u00E9\u4E2D\U0001F600"), "a\xC3\xA9\xE4\xB8\xAD\xF0\x9F\x98\x80");
    EXPECT_EQ(codePointsToUtf8(std::u32string{char32_t{0xD800}}), "\xEF\xBF\xBD");
}

//-------------------------------------------------------------------------

TEST(UnicodeTest, CombinesSurrogatePairs)
{
    const std::u32string pair{char32_t{0xD83D}, char32_t{0xDE00}};
    const std::u32string lone{U'x', char32_t{0xDC00}, U'y'};

    EXPECT_TRUE(isHighSurrogate(pair[0]));
    EXPECT_TRUE(isLowSurrogate(pair[1]));
    EXPECT_FALSE(isHighSurrogate(U'a'));
    EXPECT_EQ(combineSurrogates(pair), U"\U0001F600");
    EXPECT_EQ(combineSurrogates(lone), lone);
}

//-------------------------------------------------------------------------
