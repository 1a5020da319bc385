#include "Theme.hpp"
#include "KeyNames.hpp"
#include <algorithm>
#include <charconv>
#include <cmath>
#include <cstdio>

namespace {

struct ThemeDefinition {
    const char* name;
    const char* background;
    const char* key_background;
    const char* key_text;
    const char* key_border;
    const char* shortcut_text;
    const char* pressed_background;
    const char* modifier_background;
};

constexpr ThemeDefinition kThemes[] = {
    {"Default Dark", "rgba(20, 20, 30, 170)", "rgba(50, 50, 60, 180)", "white", "#444444", "#DDDD00", "#5A98D1", "#4682B4"},
    {"Light Steel", "rgba(200, 205, 210, 190)", "rgba(230, 235, 240, 220)", "black", "#B0B0B0", "#0055A4", "#A0D8F0", "#7CB9E8"},
    {"Midnight Blue", "rgba(25, 25, 112, 180)", "rgba(40, 40, 130, 200)", "white", "#6060C0", "#FFFF00", "#3A78B1", "#2C5F8F"},
    {"Nord Dark", "rgba(46, 52, 64, 185)", "rgba(67, 76, 94, 200)", "#D8DEE9", "#4C566A", "#88C0D0", "#5E81AC", "#81A1C1"},
    {"Tokyo Night", "rgba(26, 27, 38, 180)", "rgba(41, 42, 58, 195)", "#C0CAF5", "#565F89", "#7AA2F7", "#BB9AF7", "#F7768E"},
    {"Dracula", "rgba(40, 42, 54, 175)", "rgba(68, 71, 90, 190)", "#F8F8F2", "#6272A4", "#50FA7B", "#BD93F9", "#FF79C6"},
    {"Forest Green", "rgba(34, 53, 44, 170)", "rgba(52, 73, 62, 185)", "#E8F5E8", "#2D5A3D", "#7ED321", "#4CAF50", "#66BB6A"},
    {"Warm Sepia", "rgba(73, 63, 50, 165)", "rgba(95, 83, 68, 180)", "#F5E6D3", "#8B7355", "#D4AF37", "#CD853F", "#DEB887"},
    {"Soft Purple", "rgba(56, 47, 66, 172)", "rgba(78, 67, 88, 187)", "#E6E1F0", "#6B5B7B", "#9C88FF", "#8A7CA8", "#B39DDB"},
    {"High Contrast Dark", "rgba(0, 0, 0, 200)", "rgba(33, 33, 33, 220)", "#FFFFFF", "#666666", "#00FF00", "#0099FF", "#FF6600"},
    {"High Contrast Light", "rgba(255, 255, 255, 200)", "rgba(240, 240, 240, 220)", "#000000", "#CCCCCC", "#FF0066", "#0066FF", "#FF9900"},
    {"Neon Cyber", "rgba(0, 5, 15, 180)", "rgba(15, 25, 35, 195)", "#00FFFF", "#003366", "#FF00FF", "#00FF88", "#FF6600"},
    {"RGB Gaming", "rgba(18, 18, 18, 185)", "rgba(35, 35, 35, 200)", "#FFFFFF", "#555555", "#FF0080", "#8000FF", "#00FF80"},
    {"Retro Synthwave", "rgba(20, 8, 30, 175)", "rgba(40, 20, 50, 190)", "#FF00FF", "#4A0E4E", "#00FFFF", "#FF1493", "#FF4500"},
    {"Corporate Blue", "rgba(240, 248, 255, 190)", "rgba(230, 240, 250, 210)", "#1E3A8A", "#B0C4DE", "#2563EB", "#3B82F6", "#60A5FA"},
    {"Elegant Gray", "rgba(248, 250, 252, 185)", "rgba(241, 245, 249, 205)", "#374151", "#D1D5DB", "#6366F1", "#8B5CF6", "#A855F7"},
    {"Professional Green", "rgba(240, 253, 244, 188)", "rgba(220, 252, 231, 208)", "#064E3B", "#A7F3D0", "#059669", "#10B981", "#34D399"},
    {"Sunset Orange", "rgba(45, 25, 15, 170)", "rgba(70, 45, 30, 185)", "#FFF7ED", "#7C2D12", "#EA580C", "#F97316", "#FB923C"},
    {"Cherry Blossom", "rgba(60, 40, 50, 168)", "rgba(85, 65, 75, 183)", "#FDF2F8", "#881337", "#E11D48", "#F43F5E", "#FB7185"},
    {"Golden Hour", "rgba(55, 45, 25, 172)", "rgba(80, 68, 45, 187)", "#FFFBEB", "#92400E", "#D97706", "#F59E0B", "#FBBF24"},
    {"Ocean Breeze", "rgba(20, 40, 60, 175)", "rgba(40, 65, 85, 190)", "#F0F9FF", "#0C4A6E", "#0284C7", "#0EA5E9", "#38BDF8"},
    {"Spring Mint", "rgba(30, 50, 40, 170)", "rgba(50, 75, 65, 185)", "#F0FDF4", "#14532D", "#16A34A", "#22C55E", "#4ADE80"},
    {"Lavender Dream", "rgba(45, 35, 60, 173)", "rgba(70, 60, 85, 188)", "#FAF5FF", "#581C87", "#7C3AED", "#8B5CF6", "#A78BFA"},
    {"Pure White", "rgba(255, 255, 255, 200)", "rgba(248, 250, 252, 220)", "#111827", "#E5E7EB", "#3B82F6", "#6366F1", "#8B5CF6"},
    {"Deep Black", "rgba(0, 0, 0, 190)", "rgba(17, 24, 39, 210)", "#F9FAFB", "#374151", "#10B981", "#06B6D4", "#8B5CF6"},
    {"Monochrome", "rgba(128, 128, 128, 180)", "rgba(156, 163, 175, 195)", "#FFFFFF", "#6B7280", "#000000", "#374151", "#111827"},
    {"Low Light", "rgba(15, 15, 15, 185)", "rgba(30, 30, 30, 200)", "#DC2626", "#1F2937", "#EF4444", "#F87171", "#FCA5A5"},
    {"Blue Light Filter", "rgba(50, 40, 30, 175)", "rgba(70, 60, 50, 190)", "#FEF3C7", "#92400E", "#F59E0B", "#FBBF24", "#FCD34D"},
    {"Accessibility", "rgba(255, 255, 255, 220)", "rgba(0, 0, 0, 255)", "#000000", "#808080", "#0000FF", "#FF0000", "#008000"},
};

const AppSettings kDefaults{};

Color parse_or(std::string_view text, const char* fallback) {
    if (auto c = Color::parse(text)) return *c;
    return Color::parse(fallback).value_or(Color{});
}

ThemeColors to_colors(const ThemeDefinition& d) {
    // Table entries always parse
    return {
        parse_or(d.background, "black"),     parse_or(d.key_background, "black"),
        parse_or(d.key_text, "white"),       parse_or(d.key_border, "black"),
        parse_or(d.shortcut_text, "white"),  parse_or(d.pressed_background, "black"),
        parse_or(d.modifier_background, "black"),
    };
}

std::optional<uint8_t> hex_byte(std::string_view text) {
    unsigned value = 0;
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value, 16);
    if (ec != std::errc() || ptr != text.data() + text.size()) return std::nullopt;
    return static_cast<uint8_t>(value);
}

std::string_view trim(std::string_view s) {
    while (!s.empty() && s.front() == ' ') s.remove_prefix(1);
    while (!s.empty() && s.back() == ' ') s.remove_suffix(1);
    return s;
}

std::optional<Color> parse_function(std::string_view text) {
    const bool has_alpha = text.starts_with("rgba(");
    if (!has_alpha && !text.starts_with("rgb(")) return std::nullopt;
    if (!text.ends_with(")")) return std::nullopt;
    text.remove_prefix(has_alpha ? 5 : 4);
    text.remove_suffix(1);

    int parts[4] = {0, 0, 0, 255};
    const size_t expected = has_alpha ? 4 : 3;
    size_t count = 0;
    while (count < expected) {
        auto comma = text.find(',');
        auto part = trim(text.substr(0, comma));
        int v = 0;
        auto [ptr, ec] = std::from_chars(part.data(), part.data() + part.size(), v);
        if (part.empty() || ec != std::errc() || ptr != part.data() + part.size() || v < 0 || v > 255) {
            return std::nullopt;
        }
        parts[count++] = v;
        if (comma == std::string_view::npos) break;
        text.remove_prefix(comma + 1);
        if (count == expected) return std::nullopt; // trailing component
    }
    if (count != expected) return std::nullopt;
    return Color{static_cast<uint8_t>(parts[0]), static_cast<uint8_t>(parts[1]), static_cast<uint8_t>(parts[2]),
                 static_cast<uint8_t>(parts[3])};
}

struct Hsv {
    double h{0}; // degrees, negative when achromatic
    double s{0};
    double v{0};
};

Hsv to_hsv(const Color& c) {
    const double r = c.r / 255.0, g = c.g / 255.0, b = c.b / 255.0;
    const double max = std::max({r, g, b});
    const double min = std::min({r, g, b});
    const double delta = max - min;
    Hsv hsv;
    hsv.v = max;
    hsv.s = max > 0.0 ? delta / max : 0.0;
    if (delta <= 0.0) {
        hsv.h = -1.0;
    } else if (max == r) {
        hsv.h = 60.0 * std::fmod((g - b) / delta, 6.0);
    } else if (max == g) {
        hsv.h = 60.0 * ((b - r) / delta + 2.0);
    } else {
        hsv.h = 60.0 * ((r - g) / delta + 4.0);
    }
    if (hsv.h < 0.0 && delta > 0.0) hsv.h += 360.0;
    return hsv;
}

Color from_hsv(const Hsv& hsv, uint8_t alpha) {
    auto to_byte = [](double x) { return static_cast<uint8_t>(std::lround(std::clamp(x, 0.0, 1.0) * 255.0)); };
    if (hsv.h < 0.0 || hsv.s <= 0.0) {
        const uint8_t v = to_byte(hsv.v);
        return {v, v, v, alpha};
    }
    const double c = hsv.v * hsv.s;
    const double hp = hsv.h / 60.0;
    const double x = c * (1.0 - std::fabs(std::fmod(hp, 2.0) - 1.0));
    double r = 0, g = 0, b = 0;
    switch (static_cast<int>(hp) % 6) {
        case 0: r = c; g = x; break;
        case 1: r = x; g = c; break;
        case 2: g = c; b = x; break;
        case 3: g = x; b = c; break;
        case 4: r = x; b = c; break;
        default: r = c; b = x; break;
    }
    const double m = hsv.v - c;
    return {to_byte(r + m), to_byte(g + m), to_byte(b + m), alpha};
}

} // namespace

std::optional<Color> Color::parse(std::string_view text) {
    text = trim(text);
    const std::string lower = ascii_lower(text);
    if (lower == "white") return Color{255, 255, 255, 255};
    if (lower == "black") return Color{0, 0, 0, 255};

    if (text.starts_with('#')) {
        std::string_view hex = text.substr(1);
        if (hex.size() != 6 && hex.size() != 8) return std::nullopt;
        uint8_t bytes[4];
        for (size_t i = 0; i < hex.size() / 2; ++i) {
            auto b = hex_byte(hex.substr(i * 2, 2));
            if (!b) return std::nullopt;
            bytes[i] = *b;
        }
        if (hex.size() == 6) return Color{bytes[0], bytes[1], bytes[2], 255};
        return Color{bytes[1], bytes[2], bytes[3], bytes[0]};
    }
    return parse_function(lower);
}

Color Color::lighter(int factor) const {
    if (factor <= 0) return *this;
    if (factor < 100) return darker(10000 / factor);
    Hsv hsv = to_hsv(*this);
    hsv.v = hsv.v * factor / 100.0;
    if (hsv.v > 1.0) {
        hsv.s = std::max(0.0, hsv.s - (hsv.v - 1.0));
        hsv.v = 1.0;
    }
    return from_hsv(hsv, a);
}

Color Color::darker(int factor) const {
    if (factor <= 0) return *this;
    if (factor < 100) return lighter(10000 / factor);
    Hsv hsv = to_hsv(*this);
    hsv.v = hsv.v * 100.0 / factor;
    return from_hsv(hsv, a);
}

Color Color::premultiplied() const {
    auto scale = [&](uint8_t c) { return static_cast<uint8_t>((c * a + 127) / 255); };
    return {scale(r), scale(g), scale(b), a};
}

std::string Color::hex_rgb() const {
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", r, g, b);
    return buf;
}

std::string Color::hex_argb() const {
    char buf[10];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x%02x", a, r, g, b);
    return buf;
}

Color composite_over(const Color& top, const Color& bottom) {
    const double ta = top.a / 255.0;
    const double ba = bottom.a / 255.0 * (1.0 - ta);
    const double out_a = ta + ba;
    if (out_a <= 0.0) {
        return {0, 0, 0, 0};
    }
    auto mix = [&](uint8_t t, uint8_t b) {
        return static_cast<uint8_t>(std::clamp(std::lround((t * ta + b * ba) / out_a), 0L, 255L));
    };
    return {mix(top.r, bottom.r), mix(top.g, bottom.g), mix(top.b, bottom.b),
            static_cast<uint8_t>(std::lround(out_a * 255.0))};
}

const std::vector<std::string>& theme_names() {
    static const std::vector<std::string> names = [] {
        std::vector<std::string> n;
        for (const auto& t : kThemes) n.emplace_back(t.name);
        return n;
    }();
    return names;
}

std::optional<ThemeColors> predefined_theme(std::string_view name) {
    for (const auto& t : kThemes) {
        if (name == t.name) return to_colors(t);
    }
    return std::nullopt;
}

ThemePalette resolve_theme(const AppSettings& settings) {
    ThemePalette p;
    if (settings.theme_name == CUSTOM_THEME) {
        const Color bg = parse_or(settings.custom_bg_color, kDefaults.custom_bg_color.c_str());
        const Color key = parse_or(settings.custom_key_color, kDefaults.custom_key_color.c_str());
        const Color text = parse_or(settings.custom_text_color, kDefaults.custom_text_color.c_str()).opaque();
        p.background = bg;
        p.key_background = key;
        p.key_text = text;
        p.key_border = text.darker(150);
        p.shortcut_text = Color{0xDD, 0xDD, 0x00, 255};
        p.pressed_background = key.opaque().lighter(130);
        p.modifier_background = key.opaque().lighter(115);
    } else {
        auto colors = predefined_theme(settings.theme_name);
        static_cast<ThemeColors&>(p) = colors ? *colors : *predefined_theme(DEFAULT_THEME);
    }
    p.pressed_border = p.pressed_background.darker(120);
    p.modifier_border = p.modifier_background.darker(120);

    const int opacity = std::clamp(settings.opacity, SettingsStore::MIN_OPACITY, SettingsStore::MAX_OPACITY);
    p.window_alpha = static_cast<uint8_t>(std::lround(opacity * 255 / 100.0));
    return p;
}
