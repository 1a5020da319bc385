#include "KeyNames.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <map>
#include <sstream>

namespace {

struct VirtualKeyName {
    uint32_t vk;
    const char* name;
};

// Windows virtual-key codes outside the contiguous digit, letter and F1-F24 ranges.
constexpr VirtualKeyName kVirtualKeys[] = {
    {0x08, "Backspace"}, {0x09, "Tab"}, {0x0D, "Enter"},
    {0x10, "Shift"}, {0x11, "Ctrl"}, {0x12, "Alt"},
    {0x13, "Pause"}, {0x14, "Caps Lock"}, {0x1B, "Esc"}, {0x20, "Space"},
    {0x21, "PgUp"}, {0x22, "PgDn"}, {0x23, "End"}, {0x24, "Home"},
    {0x25, "\xE2\x86\x90"}, {0x26, "\xE2\x86\x91"}, {0x27, "\xE2\x86\x92"}, {0x28, "\xE2\x86\x93"},
    {0x2C, "PrtSc"}, {0x2D, "Ins"}, {0x2E, "Del"},
    {0x5B, "Win"}, {0x5C, "Win"}, {0x5D, "Menu"},
    {0x60, "0"}, {0x61, "1"}, {0x62, "2"}, {0x63, "3"}, {0x64, "4"},
    {0x65, "5"}, {0x66, "6"}, {0x67, "7"}, {0x68, "8"}, {0x69, "9"},
    {0x6A, "*"}, {0x6B, "+"}, {0x6C, ","}, {0x6D, "-"}, {0x6E, "."}, {0x6F, "/"},
    {0x91, "ScrLk"},
    {0xA0, "Shift"}, {0xA1, "Shift"}, {0xA2, "Ctrl"}, {0xA3, "Ctrl"}, {0xA4, "Alt"}, {0xA5, "Alt"},
    {0xBA, ";"}, {0xBB, "="}, {0xBC, ","}, {0xBD, "-"}, {0xBE, "."}, {0xBF, "/"},
    {0xC0, "`"}, {0xDB, "["}, {0xDC, "\\"}, {0xDD, "]"}, {0xDE, "'"}, {0xE2, "\\"},
};

const std::map<std::string, std::string, std::less<>>& special_keys() {
    static const std::map<std::string, std::string, std::less<>> m = {
        {"escape", "Esc"}, {"esc", "Esc"},
        {"space", "Space"}, {"space bar", "Space"},
        {"enter", "Enter"}, {"return", "Enter"},
        {"backspace", "Backspace"},
        {"caps lock", "Caps Lock"}, {"capslock", "Caps Lock"},
        {"tab", "Tab"},
        {"delete", "Del"}, {"del", "Del"},
        {"home", "Home"}, {"end", "End"},
        {"page up", "PgUp"}, {"pgup", "PgUp"},
        {"page down", "PgDn"}, {"pgdn", "PgDn"},
        {"insert", "Ins"}, {"ins", "Ins"},
        {"print screen", "PrtSc"}, {"printscr", "PrtSc"}, {"prtsc", "PrtSc"},
        {"scroll lock", "ScrLk"}, {"scrolllock", "ScrLk"}, {"scrlk", "ScrLk"},
        {"pause", "Pause"}, {"pause break", "Pause"},
        {"up", "\xE2\x86\x91"}, {"down", "\xE2\x86\x93"},
        {"left", "\xE2\x86\x90"}, {"right", "\xE2\x86\x92"},
        {"menu", "Menu"}, {"apps", "Menu"}, {"application", "Menu"},
        {"decimal", "."}, {"numpad decimal", "."},
        {"separator", ","},
    };
    return m;
}

const std::map<std::string, std::string, std::less<>>& symbol_names() {
    static const std::map<std::string, std::string, std::less<>> m = {
        {"semicolon", ";"}, {"equals", "="}, {"comma", ","},
        {"minus", "-"}, {"subtract", "-"}, {"hyphen", "-"}, {"numpad subtract", "-"},
        {"period", "."}, {"dot", "."},
        {"slash", "/"}, {"forward slash", "/"}, {"divide", "/"}, {"numpad divide", "/"},
        {"backtick", "`"}, {"grave accent", "`"},
        {"open bracket", "["}, {"left bracket", "["},
        {"close bracket", "]"}, {"right bracket", "]"},
        {"backslash", "\\"}, {"back slash", "\\"},
        {"apostrophe", "'"}, {"single quote", "'"},
        {"multiply", "*"}, {"asterisk", "*"}, {"numpad multiply", "*"},
        {"add", "+"}, {"plus", "+"}, {"numpad plus", "+"}, {"numpad add", "+"},
    };
    return m;
}

constexpr std::array<Modifier, 4> kComboOrder = {
    Modifier::Ctrl, Modifier::Alt, Modifier::Shift, Modifier::Win};

std::vector<std::string> split_plus(std::string_view text) {
    std::vector<std::string> parts;
    std::stringstream ss{std::string(text)};
    std::string segment;
    while (std::getline(ss, segment, '+')) {
        segment.erase(0, segment.find_first_not_of(" \t"));
        segment.erase(segment.find_last_not_of(" \t") + 1);
        parts.push_back(segment);
    }
    // "Ctrl++" names the plus key itself
    if (!text.empty() && text.back() == '+' && !parts.empty() && parts.back().empty()) {
        parts.back() = "+";
    }
    return parts;
}

} // namespace

size_t ModifierSet::size() const {
    size_t n = 0;
    for (auto m : kComboOrder) {
        if (contains(m)) ++n;
    }
    return n;
}

std::string ModifierSet::combo_string() const {
    std::string out;
    for (auto m : kComboOrder) {
        if (!contains(m)) continue;
        if (!out.empty()) out += '+';
        out += modifier_name(m);
    }
    return out;
}

const char* modifier_name(Modifier m) {
    switch (m) {
        case Modifier::Ctrl: return "Ctrl";
        case Modifier::Shift: return "Shift";
        case Modifier::Alt: return "Alt";
        case Modifier::Win: return "Win";
    }
    return "";
}

std::string ascii_upper(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (static_cast<unsigned char>(c) < 0x80) c = (char)std::toupper(static_cast<unsigned char>(c));
    }
    return out;
}

std::string ascii_lower(std::string_view s) {
    std::string out(s);
    for (auto& c : out) {
        if (static_cast<unsigned char>(c) < 0x80) c = (char)std::tolower(static_cast<unsigned char>(c));
    }
    return out;
}

std::optional<std::string> normalize_key_name(std::string_view raw) {
    if (raw.empty()) {
        return std::nullopt;
    }
    const std::string lower = ascii_lower(raw);

    // Modifiers first: "left ctrl", "right shift", "alt gr", "left windows", ...
    if (lower.find("ctrl") != std::string::npos) return "Ctrl";
    if (lower.find("shift") != std::string::npos) return "Shift";
    if (lower.find("alt") != std::string::npos) return "Alt";
    if (lower.find("win") != std::string::npos || lower.find("cmd") != std::string::npos ||
        lower == "meta") {
        return "Win";
    }

    if (lower.size() > 1 && lower[0] == 'f' &&
        std::all_of(lower.begin() + 1, lower.end(), [](unsigned char c) { return std::isdigit(c); }) &&
        lower.size() <= 3) {
        const int num = std::stoi(lower.substr(1));
        if (num >= 1 && num <= 24) {
            return "F" + std::to_string(num);
        }
    }

    if (auto it = special_keys().find(lower); it != special_keys().end()) {
        return it->second;
    }
    if (auto it = symbol_names().find(lower); it != symbol_names().end()) {
        return it->second;
    }

    if (lower.size() == 1) {
        if (std::isalpha(static_cast<unsigned char>(lower[0]))) {
            return ascii_upper(lower);
        }
        return lower;
    }
    return ascii_upper(raw);
}

std::optional<std::string> key_name_from_virtual_key(uint32_t vk) {
    if (vk >= 0x30 && vk <= 0x39) return std::string(1, static_cast<char>(vk));
    if (vk >= 0x41 && vk <= 0x5A) return std::string(1, static_cast<char>(vk));
    if (vk >= 0x70 && vk <= 0x87) return "F" + std::to_string(vk - 0x70 + 1);
    for (const auto& entry : kVirtualKeys) {
        if (entry.vk == vk) return std::string(entry.name);
    }
    return std::nullopt;
}

std::vector<uint32_t> virtual_keys_for_key_name(std::string_view name) {
    if (auto mod = modifier_from_key_name(name)) {
        switch (*mod) {
            case Modifier::Ctrl: return {0xA2, 0xA3};
            case Modifier::Shift: return {0xA0, 0xA1};
            case Modifier::Alt: return {0xA4, 0xA5};
            case Modifier::Win: return {0x5B, 0x5C};
        }
    }
    std::vector<uint32_t> codes;
    if (name.size() == 1) {
        const unsigned char c = static_cast<unsigned char>(name[0]);
        if (std::isdigit(c) || std::isupper(c)) codes.push_back(c);
    }
    if (name.size() >= 2 && name[0] == 'F') {
        const std::string digits(name.substr(1));
        if (std::all_of(digits.begin(), digits.end(), [](unsigned char c) { return std::isdigit(c); }) &&
            digits.size() <= 2) {
            const int num = std::stoi(digits);
            if (num >= 1 && num <= 24) codes.push_back(static_cast<uint32_t>(0x70 + num - 1));
        }
    }
    for (const auto& entry : kVirtualKeys) {
        if (name == entry.name && std::find(codes.begin(), codes.end(), entry.vk) == codes.end()) {
            codes.push_back(entry.vk);
        }
    }
    return codes;
}

std::optional<Modifier> modifier_from_key_name(std::string_view name) {
    if (name == "Ctrl") return Modifier::Ctrl;
    if (name == "Shift") return Modifier::Shift;
    if (name == "Alt") return Modifier::Alt;
    if (name == "Win") return Modifier::Win;
    return std::nullopt;
}

std::expected<ModifierSet, std::string> parse_modifier_combo(std::string_view text) {
    ModifierSet mods;
    for (const auto& part : split_plus(text)) {
        auto name = normalize_key_name(part);
        auto mod = name ? modifier_from_key_name(*name) : std::nullopt;
        if (!mod) {
            return std::unexpected("Not a modifier: '" + part + "'");
        }
        mods.insert(*mod);
    }
    if (mods.empty()) {
        return std::unexpected("Empty modifier combination");
    }
    return mods;
}

std::expected<Hotkey, std::string> parse_hotkey(std::string_view text) {
    Hotkey hk;
    for (const auto& part : split_plus(text)) {
        auto name = normalize_key_name(part);
        if (!name) {
            return std::unexpected("Empty key in hotkey '" + std::string(text) + "'");
        }
        if (auto mod = modifier_from_key_name(*name)) {
            hk.modifiers.insert(*mod);
            continue;
        }
        auto codes = virtual_keys_for_key_name(*name);
        if (codes.empty()) {
            return std::unexpected("Unknown key '" + part + "' in hotkey '" + std::string(text) + "'");
        }
        hk.vk = codes.front();
    }
    if (hk.vk == 0) {
        return std::unexpected("Hotkey '" + std::string(text) + "' names no key");
    }
    return hk;
}
