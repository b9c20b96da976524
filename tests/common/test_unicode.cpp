#include "atlex/unicode.hpp"

#include <string>
#include <string_view>

#include <gtest/gtest.h>

namespace atlex::unicode::test {

TEST(UnicodeTest, AsciiCountsBytes)
{
    auto count = grapheme_count("hello");
    ASSERT_TRUE(count);
    EXPECT_EQ(*count, 5U);

    auto empty = grapheme_count("");
    ASSERT_TRUE(empty);
    EXPECT_EQ(*empty, 0U);
}

TEST(UnicodeTest, CrLfIsOneCluster)
{
    auto count = grapheme_count("a\r\nb");
    ASSERT_TRUE(count);
    EXPECT_EQ(*count, 3U);
}

TEST(UnicodeTest, MultiByteCharactersCountOnce)
{
    // U+00E9 LATIN SMALL LETTER E WITH ACUTE, two bytes each
    std::string text;
    for (int i = 0; i < 4; ++i) {
        text += "\xC3\xA9";
    }
    auto count = grapheme_count(text);
    ASSERT_TRUE(count);
    EXPECT_EQ(*count, 4U);
}

TEST(UnicodeTest, CombiningSequencesAndEmojiAreSingleGraphemes)
{
    // "e" + U+0301 COMBINING ACUTE ACCENT
    auto combining = grapheme_count("e\xCC\x81");
    ASSERT_TRUE(combining);
    EXPECT_EQ(*combining, 1U);

    // U+1F469 U+200D U+1F4BB (woman technologist, ZWJ sequence)
    auto emoji = grapheme_count("\xF0\x9F\x91\xA9\xE2\x80\x8D\xF0\x9F\x92\xBB");
    ASSERT_TRUE(emoji);
    EXPECT_EQ(*emoji, 1U);

    // Regional indicators U+1F1EB U+1F1F7 (flag of France)
    auto flag = grapheme_count("\xF0\x9F\x87\xAB\xF0\x9F\x87\xB7");
    ASSERT_TRUE(flag);
    EXPECT_EQ(*flag, 1U);
}

TEST(UnicodeTest, InvalidUtf8IsAnError)
{
    EXPECT_FALSE(is_valid_utf8("\xC3"));
    EXPECT_FALSE(is_valid_utf8("\xFF\xFE"));
    EXPECT_TRUE(is_valid_utf8("plain \xC3\xA9"));

    auto count = grapheme_count("bad \xC3");
    ASSERT_FALSE(count);
    EXPECT_EQ(count.error().code, "InvalidUtf8");
}

TEST(UnicodeTest, WindowedScanMatchesWholeScan)
{
    // 4-byte sequence starting one byte before the first window cut
    const std::string_view straddling = "a\xF0\x9F\x87\xAB"
                                        "bc\xC3\xA9";
    EXPECT_TRUE(is_valid_utf8(straddling));
    EXPECT_TRUE(detail::is_valid_utf8(straddling, 4));
    EXPECT_TRUE(detail::is_valid_utf8(straddling, 5));

    EXPECT_FALSE(detail::is_valid_utf8("abcdefgh\xFF", 4));
    EXPECT_FALSE(detail::is_valid_utf8("abcdefg\xC3", 4));
    EXPECT_FALSE(detail::is_valid_utf8("\xC3\xA9\xC3\xA9\xC3", 4));

    // Windows below one sequence are widened
    EXPECT_TRUE(detail::is_valid_utf8("\xC3\xA9\xC3\xA9\xC3\xA9", 1));
    EXPECT_TRUE(detail::is_valid_utf8("", 4));
}

}  // namespace atlex::unicode::test
