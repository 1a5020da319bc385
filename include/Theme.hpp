#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include "SettingsStore.hpp"

inline constexpr const char* CUSTOM_THEME = "Custom";
inline constexpr const char* DEFAULT_THEME = "Default Dark";

/**
 * @struct Color
 * @brief 8-bit RGBA colour.
 */
struct Color {
    uint8_t r{0}, g{0}, b{0}, a{255};

    /**
     * @brief Accepts "#RRGGBB", "#AARRGGBB", "rgba(r, g, b, a)", "white" and "black".
     */
    static std::optional<Color> parse(std::string_view text);

    /**
     * @brief Scales the HSV value by factor percent. Values past full brightness are
     * taken from the saturation instead, so light colours turn whiter.
     */
    Color lighter(int factor = 150) const;

    /**
     * @brief Divides the HSV value by factor percent.
     */
    Color darker(int factor = 200) const;

    Color opaque() const { return {r, g, b, 255}; }
    /// Channels scaled by alpha, the form per-pixel layered windows expect.
    Color premultiplied() const;
    std::string hex_rgb() const;  // "#rrggbb"
    std::string hex_argb() const; // "#aarrggbb"

    bool operator==(const Color&) const = default;
};

/**
 * @struct ThemeColors
 * @brief The seven colours a theme defines.
 */
struct ThemeColors {
    Color background;          // window, usually translucent
    Color key_background;      // key cap, may be translucent
    Color key_text;
    Color key_border;
    Color shortcut_text;
    Color pressed_background;  // opaque
    Color modifier_background; // opaque
};

/**
 * @struct ThemePalette
 * @brief Colours the overlay paints with, plus derived borders and window alpha.
 */
struct ThemePalette : ThemeColors {
    Color pressed_border;
    Color modifier_border;
    uint8_t window_alpha{255};
};

/**
 * @brief Porter-Duff "over" of two straight-alpha colours. The result is straight alpha too;
 * a fully transparent result is {0, 0, 0, 0}.
 */
Color composite_over(const Color& top, const Color& bottom);

/**
 * @brief Names of the predefined themes in menu order. "Custom" is not included.
 */
const std::vector<std::string>& theme_names();

std::optional<ThemeColors> predefined_theme(std::string_view name);

/**
 * @brief Palette for the current settings: a predefined theme, the custom colours,
 * or Default Dark for an unknown name. Opacity is clamped to 20..100 percent.
 */
ThemePalette resolve_theme(const AppSettings& settings);
