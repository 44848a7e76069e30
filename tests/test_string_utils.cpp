#include "csvsed/string_utils.hpp"
#include <gtest/gtest.h>
#include <locale>

namespace csvsed {

TEST(StringUtilsTest, DecodesMultiByteSequences)
{
    auto decoded = StringUtils::decode_utf8("a\xCE\xB1\xE2\x82\xAC\xF0\x9F\x98\x80");

    ASSERT_EQ(decoded.size(), 4);
    EXPECT_EQ(decoded[0], U'a');
    EXPECT_EQ(decoded[1], U'α');  // α
    EXPECT_EQ(decoded[2], U'€');  // €
    EXPECT_EQ(decoded[3], U'\U0001F600');
}

TEST(StringUtilsTest, EncodeReversesDecode)
{
    std::string text = "άλφα, βήτα and plain ascii";
    EXPECT_EQ(StringUtils::encode_utf8(StringUtils::decode_utf8(text)), text);
}

TEST(StringUtilsTest, MalformedBytesSurviveRoundTrip)
{
    std::string latin1 = "caf\xE9 \xFF\xC3";
    auto decoded = StringUtils::decode_utf8(latin1);

    EXPECT_EQ(decoded.size(), latin1.size());
    EXPECT_EQ(StringUtils::encode_utf8(decoded), latin1);
}

TEST(StringUtilsTest, OverlongEncodingIsTreatedAsRawBytes)
{
    std::string overlong = "\xC0\xAF";
    auto decoded = StringUtils::decode_utf8(overlong);

    EXPECT_EQ(decoded.size(), 2);
    EXPECT_EQ(StringUtils::encode_utf8(decoded), overlong);
}

TEST(StringUtilsTest, SplitKeepsEmptyParts)
{
    auto parts = StringUtils::split_on(U"s/a//g", U'/');

    ASSERT_EQ(parts.size(), 4);
    EXPECT_EQ(parts[0], U"s");
    EXPECT_EQ(parts[1], U"a");
    EXPECT_EQ(parts[2], U"");
    EXPECT_EQ(parts[3], U"g");

    EXPECT_EQ(StringUtils::split_on(std::string_view("a,,b"), ',').size(), 3);
}

TEST(StringUtilsTest, TrimAndIntegerChecks)
{
    EXPECT_EQ(StringUtils::trim("  name \t"), "name");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_TRUE(StringUtils::is_unsigned_integer("042"));
    EXPECT_FALSE(StringUtils::is_unsigned_integer("-1"));
    EXPECT_FALSE(StringUtils::is_unsigned_integer(""));
    EXPECT_FALSE(StringUtils::is_unsigned_integer("header 1"));
}

TEST(StringUtilsTest, UnicodeLocaleMapsGreekCase)
{
    const auto& locale = StringUtils::unicode_locale();

    EXPECT_EQ(std::toupper(L'α', locale), L'Α');
    EXPECT_EQ(std::tolower(L'Γ', locale), L'γ');
}

} // namespace csvsed
