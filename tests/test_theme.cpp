#include <gtest/gtest.h>

#include "Theme.hpp"

namespace {

TEST(Color, ParsesSupportedForms) {
    EXPECT_EQ(Color::parse("#FF8000"), (Color{255, 128, 0, 255}));
    EXPECT_EQ(Color::parse("#AA14141E"), (Color{0x14, 0x14, 0x1E, 0xAA}));
    EXPECT_EQ(Color::parse("rgba(20, 20, 30, 170)"), (Color{20, 20, 30, 170}));
    EXPECT_EQ(Color::parse("rgb(1,2,3)"), (Color{1, 2, 3, 255}));
    EXPECT_EQ(Color::parse("White"), (Color{255, 255, 255, 255}));
    EXPECT_EQ(Color::parse("black"), (Color{0, 0, 0, 255}));
}

TEST(Color, RejectsMalformedText) {
    EXPECT_FALSE(Color::parse("").has_value());
    EXPECT_FALSE(Color::parse("#12345").has_value());
    EXPECT_FALSE(Color::parse("#GG0000").has_value());
    EXPECT_FALSE(Color::parse("rgba(1, 2, 3)").has_value());
    EXPECT_FALSE(Color::parse("rgba(1, 2, 3, 4, 5)").has_value());
    EXPECT_FALSE(Color::parse("rgb(300, 0, 0)").has_value());
    EXPECT_FALSE(Color::parse("purple").has_value());
}

TEST(Color, HexOutput) {
    Color c{0x5A, 0x98, 0xD1, 0x80};
    EXPECT_EQ(c.hex_rgb(), "#5a98d1");
    EXPECT_EQ(c.hex_argb(), "#805a98d1");
}

TEST(Color, LighterAndDarkerScaleValue) {
    const Color grey{100, 100, 100, 200};
    EXPECT_EQ(grey.lighter(150), (Color{150, 150, 150, 200}));
    EXPECT_EQ(grey.darker(200), (Color{50, 50, 50, 200}));
    EXPECT_EQ((Color{255, 255, 255, 255}).darker(150), (Color{170, 170, 170, 255}));

    // Past full brightness the colour loses saturation instead
    const Color red{200, 0, 0, 255};
    const Color light = red.lighter(150);
    EXPECT_EQ(light.r, 255);
    EXPECT_GT(light.g, 0);
    EXPECT_EQ(light.g, light.b);

    EXPECT_EQ(red.lighter(100), red);
    EXPECT_EQ(red.darker(100), red);
}

TEST(Theme, HasAllPredefinedThemes) {
    const auto& names = theme_names();
    EXPECT_EQ(names.size(), 29u);
    EXPECT_EQ(names.front(), "Default Dark");
    for (const auto& name : names) {
        EXPECT_TRUE(predefined_theme(name).has_value()) << name;
    }
    EXPECT_FALSE(predefined_theme("Custom").has_value());
}

TEST(Theme, ResolvesPredefinedTheme) {
    AppSettings s;
    s.theme_name = "Light Steel";
    s.opacity = 100;
    const ThemePalette p = resolve_theme(s);

    EXPECT_EQ(p.background, (Color{200, 205, 210, 190}));
    EXPECT_EQ(p.key_background, (Color{230, 235, 240, 220}));
    EXPECT_EQ(p.key_text, (Color{0, 0, 0, 255}));
    EXPECT_EQ(p.pressed_background, *Color::parse("#A0D8F0"));
    EXPECT_EQ(p.pressed_border, Color::parse("#A0D8F0")->darker(120));
    EXPECT_EQ(p.window_alpha, 255);
}

TEST(Theme, UnknownThemeFallsBackToDefaultDark) {
    AppSettings s;
    s.theme_name = "Solarized Something";
    AppSettings d;
    const ThemePalette p = resolve_theme(s);
    const ThemePalette expected = resolve_theme(d);
    EXPECT_EQ(p.background, expected.background);
    EXPECT_EQ(p.modifier_background, *Color::parse("#4682B4"));
}

TEST(Theme, CustomThemeDerivesColours) {
    AppSettings s;
    s.theme_name = "Custom";
    s.custom_bg_color = "#AA14141E";
    s.custom_key_color = "#CC646464";
    s.custom_text_color = "#80FFFFFF";
    const ThemePalette p = resolve_theme(s);

    EXPECT_EQ(p.background, (Color{0x14, 0x14, 0x1E, 0xAA}));
    EXPECT_EQ(p.key_background, (Color{100, 100, 100, 0xCC}));
    EXPECT_EQ(p.key_text, (Color{255, 255, 255, 255}));
    EXPECT_EQ(p.key_border, (Color{170, 170, 170, 255}));
    EXPECT_EQ(p.shortcut_text, *Color::parse("#DDDD00"));
    EXPECT_EQ(p.pressed_background, (Color{130, 130, 130, 255}));
    EXPECT_EQ(p.modifier_background, (Color{115, 115, 115, 255}));
}

TEST(Color, CompositeOverKeepsTranslucency) {
    const Color bg{20, 20, 30, 170};
    EXPECT_EQ(composite_over(bg, Color{0, 0, 0, 0}), bg);
    EXPECT_EQ(composite_over(Color{1, 2, 3, 255}, bg), (Color{1, 2, 3, 255}));
    EXPECT_EQ(composite_over(Color{}, Color{0, 0, 0, 0}).a, 255);
    EXPECT_EQ(composite_over(Color{9, 9, 9, 0}, Color{0, 0, 0, 0}), (Color{0, 0, 0, 0}));

    // Default Dark key cap over its window background
    EXPECT_EQ(composite_over(Color{50, 50, 60, 180}, bg), (Color{43, 43, 53, 230}));

    // Over an opaque colour the result is opaque
    EXPECT_EQ(composite_over(Color{255, 255, 255, 128}, Color{0, 0, 0, 255}), (Color{128, 128, 128, 255}));
}

TEST(Color, PremultipliedScalesChannels) {
    EXPECT_EQ((Color{200, 100, 50, 128}).premultiplied(), (Color{100, 50, 25, 128}));
    EXPECT_EQ((Color{200, 100, 50, 255}).premultiplied(), (Color{200, 100, 50, 255}));
    EXPECT_EQ((Color{200, 100, 50, 0}).premultiplied(), (Color{0, 0, 0, 0}));
}

TEST(Theme, DefaultDarkBackgroundStaysTranslucent) {
    const ThemePalette p = resolve_theme(AppSettings{});
    EXPECT_EQ(p.background.a, 170);
    EXPECT_EQ(p.key_background.a, 180);
    EXPECT_EQ(p.pressed_background.a, 255);
}

TEST(Theme, OpacityIsClampedAndScaled) {
    AppSettings s;
    s.opacity = 5;
    EXPECT_EQ(resolve_theme(s).window_alpha, 51);
    s.opacity = 250;
    EXPECT_EQ(resolve_theme(s).window_alpha, 255);
    s.opacity = 85;
    EXPECT_EQ(resolve_theme(s).window_alpha, 217);
}

} // namespace
