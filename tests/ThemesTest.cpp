#include "Theme/Themes.h"
#include <gtest/gtest.h>

using namespace Kiseki;

TEST(ThemesTest, BuiltInThemes) {
    auto names = GetAvailableThemes();
    ASSERT_EQ(names.size(), 2u);
    EXPECT_TRUE(IsValidTheme("Dark"));
    EXPECT_TRUE(IsValidTheme("Light"));
    EXPECT_FALSE(IsValidTheme("Neon"));
    EXPECT_EQ(GetDefaultThemeName(), "Dark");
}

TEST(ThemesTest, CheckerColorsPerTheme) {
    Theme dark;
    InitTheme(dark, "Dark");
    CheckerColors darkChecker = GetCheckerColors(dark);
    EXPECT_EQ(darkChecker.even, Color::FromHex("#1e293b"));
    EXPECT_EQ(darkChecker.odd, Color::FromHex("#475569"));
    EXPECT_FALSE(dark.isLight);

    Theme light;
    InitTheme(light, "Light");
    CheckerColors lightChecker = GetCheckerColors(light);
    EXPECT_EQ(lightChecker.even, Color::FromHex("#ffffff"));
    EXPECT_EQ(lightChecker.odd, Color::FromHex("#94a3b8"));
    EXPECT_TRUE(light.isLight);
}

TEST(ThemesTest, UnknownNameFallsBackToDark) {
    Theme theme;
    InitTheme(theme, "Neon");
    EXPECT_EQ(theme.name, "Dark");
}
