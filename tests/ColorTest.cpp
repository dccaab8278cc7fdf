#include "Color.h"
#include <gtest/gtest.h>

using namespace Kiseki;

TEST(ColorTest, FromHexParsesRgb) {
    Color c = Color::FromHex("#38bdf8");
    EXPECT_EQ(c.r, 0x38);
    EXPECT_EQ(c.g, 0xbd);
    EXPECT_EQ(c.b, 0xf8);
    EXPECT_EQ(c.a, 255);
}

TEST(ColorTest, FromHexParsesRgba) {
    Color c = Color::FromHex("#11223380");
    EXPECT_EQ(c, Color(0x11, 0x22, 0x33, 0x80));
}

TEST(ColorTest, FromHexFallsBackToBlack) {
    EXPECT_EQ(Color::FromHex("38bdf8"), Color(0, 0, 0, 255));
    EXPECT_EQ(Color::FromHex("#12345"), Color(0, 0, 0, 255));
    EXPECT_EQ(Color::FromHex("#zzzzzz"), Color(0, 0, 0, 255));
}

TEST(ColorTest, ParseHexAcceptsOptionalHashAndWhitespace) {
    auto a = Color::ParseHex("  #FF8000 ");
    ASSERT_TRUE(a.has_value());
    EXPECT_EQ(*a, Color(255, 128, 0, 255));

    auto b = Color::ParseHex("ff800040");
    ASSERT_TRUE(b.has_value());
    EXPECT_EQ(*b, Color(255, 128, 0, 64));
}

TEST(ColorTest, ParseHexRejectsMalformedText) {
    EXPECT_FALSE(Color::ParseHex("").has_value());
    EXPECT_FALSE(Color::ParseHex("#fff").has_value());
    EXPECT_FALSE(Color::ParseHex("#ff80001").has_value());
    EXPECT_FALSE(Color::ParseHex("#gg0000").has_value());
    EXPECT_FALSE(Color::ParseHex("##ff0000").has_value());
}

TEST(ColorTest, ToHexIsLowercase) {
    Color c(0xAB, 0xCD, 0xEF, 0x12);
    EXPECT_EQ(c.ToHex(), "#abcdef12");
    EXPECT_EQ(c.ToHex(false), "#abcdef");
}

TEST(ColorTest, WithAlphaKeepsChannels) {
    Color c = Color(10, 20, 30).WithAlpha(40);
    EXPECT_EQ(c, Color(10, 20, 30, 40));
    EXPECT_FALSE(c.IsOpaque());
    EXPECT_TRUE(Color(1, 2, 3).IsOpaque());
}

TEST(ColorTest, ToU32UsesImGuiLayout) {
    Color c(0x11, 0x22, 0x33, 0x44);
    EXPECT_EQ(c.ToU32(), 0x44332211u);
}
