#include "SettingsStore.hpp"
#include "JsonFile.hpp"
#include "KeyboardLayout.hpp"
#include "Theme.hpp"
#include <algorithm>
#include <charconv>
#include <spdlog/spdlog.h>

namespace {

std::optional<int> parse_int(std::string_view text) {
    int value = 0;
    const char* first = text.data();
    const char* last = text.data() + text.size();
    if (first != last && *first == '+') ++first;
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || first == last) {
        return std::nullopt;
    }
    return value;
}

std::optional<int> node_int(const YAML::Node& node) {
    if (!node.IsScalar() || node.Tag() == "!") {
        return std::nullopt;
    }
    return parse_int(node.Scalar());
}

/// Copies a parsed JSON value into the matching field. False when the type is wrong.
bool assign_field(AppSettings& s, const std::string& key, const YAML::Node& value) {
    auto assign_string = [&](std::string& field) {
        if (!value.IsScalar()) return false;
        field = value.Scalar();
        return true;
    };
    auto assign_int = [&](int& field) {
        auto v = node_int(value);
        if (!v) return false;
        field = *v;
        return true;
    };
    auto assign_position = [&](std::optional<int>& field) {
        if (value.IsNull()) {
            field.reset();
            return true;
        }
        auto v = node_int(value);
        if (!v) return false;
        field = *v;
        return true;
    };

    if (key == "theme_name") return assign_string(s.theme_name);
    if (key == "opacity") return assign_int(s.opacity);
    if (key == "custom_bg_color") return assign_string(s.custom_bg_color);
    if (key == "custom_key_color") return assign_string(s.custom_key_color);
    if (key == "custom_text_color") return assign_string(s.custom_text_color);
    if (key == "language") return assign_string(s.language);
    if (key == "window_x") return assign_position(s.window_x);
    if (key == "window_y") return assign_position(s.window_y);
    if (key == "window_width") return assign_int(s.window_width);
    if (key == "window_height") return assign_int(s.window_height);
    return false;
}

void emit_field(YAML::Emitter& out, const AppSettings& s, const std::string& key) {
    auto emit_position = [&](const std::optional<int>& v) {
        if (v) out << *v;
        else out << YAML::Null;
    };
    out << YAML::Key << YAML::DoubleQuoted << key << YAML::Value;
    if (key == "theme_name") out << YAML::DoubleQuoted << s.theme_name;
    else if (key == "opacity") out << s.opacity;
    else if (key == "custom_bg_color") out << YAML::DoubleQuoted << s.custom_bg_color;
    else if (key == "custom_key_color") out << YAML::DoubleQuoted << s.custom_key_color;
    else if (key == "custom_text_color") out << YAML::DoubleQuoted << s.custom_text_color;
    else if (key == "language") out << YAML::DoubleQuoted << s.language;
    else if (key == "window_x") emit_position(s.window_x);
    else if (key == "window_y") emit_position(s.window_y);
    else if (key == "window_width") out << s.window_width;
    else if (key == "window_height") out << s.window_height;
}

bool is_known(std::string_view key) {
    const auto& keys = SettingsStore::known_keys();
    return std::find(keys.begin(), keys.end(), key) != keys.end();
}

} // namespace

SettingsStore::SettingsStore(std::filesystem::path path) : m_path(std::move(path)) {}

const std::vector<std::string>& SettingsStore::known_keys() {
    static const std::vector<std::string> keys = {
        "theme_name", "opacity",  "custom_bg_color", "custom_key_color", "custom_text_color",
        "language",   "window_x", "window_y",        "window_width",     "window_height",
    };
    return keys;
}

void SettingsStore::load_or_create() {
    m_settings = AppSettings{};
    m_unknown = YAML::Node(YAML::NodeType::Map);
    bool needs_save = false;

    if (!std::filesystem::exists(m_path)) {
        spdlog::info("Settings file '{}' not found, creating it with defaults", m_path.string());
        needs_save = true;
    } else if (auto root = read_json_file(m_path); !root) {
        spdlog::warn("Error loading settings from '{}': {}. Using defaults.", m_path.string(), root.error());
        needs_save = true;
    } else if (!root->IsMap()) {
        spdlog::warn("Settings file '{}' is not a JSON object. Using defaults.", m_path.string());
        needs_save = true;
    } else {
        std::vector<std::string> seen;
        for (const auto& kv : *root) {
            const auto key = kv.first.as<std::string>();
            if (!is_known(key)) {
                m_unknown[key] = kv.second;
                continue;
            }
            if (assign_field(m_settings, key, kv.second)) {
                seen.push_back(key);
            } else {
                spdlog::warn("Setting '{}' has an invalid value, using default", key);
            }
        }
        for (const auto& key : known_keys()) {
            if (std::find(seen.begin(), seen.end(), key) == seen.end()) {
                needs_save = true;
            }
        }
    }

    if (needs_save) {
        if (auto res = save(); !res) {
            spdlog::error("Could not save settings to '{}': {}", m_path.string(), res.error());
        }
    }
}

std::string SettingsStore::to_json() const {
    YAML::Emitter out;
    configure_json_emitter(out);
    out << YAML::BeginMap;
    for (const auto& key : known_keys()) {
        emit_field(out, m_settings, key);
    }
    for (const auto& kv : m_unknown) {
        out << YAML::Key << YAML::DoubleQuoted << kv.first.as<std::string>() << YAML::Value;
        emit_json_value(out, kv.second);
    }
    out << YAML::EndMap;
    return out.c_str();
}

std::expected<void, std::string> SettingsStore::save() const {
    auto res = write_text_file(m_path, to_json());
    if (!res) {
        spdlog::error("Error saving settings: {}", res.error());
    }
    return res;
}

std::expected<void, std::string> SettingsStore::update(AppSettings settings) {
    m_settings = std::move(settings);
    return save();
}

std::expected<std::string, std::string> SettingsStore::get_value(std::string_view key) const {
    const auto& s = m_settings;
    auto position = [](const std::optional<int>& v) { return v ? std::to_string(*v) : std::string("null"); };

    if (key == "theme_name") return s.theme_name;
    if (key == "opacity") return std::to_string(s.opacity);
    if (key == "custom_bg_color") return s.custom_bg_color;
    if (key == "custom_key_color") return s.custom_key_color;
    if (key == "custom_text_color") return s.custom_text_color;
    if (key == "language") return s.language;
    if (key == "window_x") return position(s.window_x);
    if (key == "window_y") return position(s.window_y);
    if (key == "window_width") return std::to_string(s.window_width);
    if (key == "window_height") return std::to_string(s.window_height);
    return std::unexpected("Unknown setting '" + std::string(key) + "'");
}

std::expected<void, std::string> SettingsStore::set_value(std::string_view key, std::string_view value) {
    auto& s = m_settings;
    const std::string k(key);

    auto int_in_range = [&](int lo, int hi) -> std::expected<int, std::string> {
        auto v = parse_int(value);
        if (!v || *v < lo || *v > hi) {
            return std::unexpected(k + " must be an integer between " + std::to_string(lo) + " and " +
                                   std::to_string(hi));
        }
        return *v;
    };
    auto colour = [&](std::string& field) -> std::expected<void, std::string> {
        if (!Color::parse(value)) {
            return std::unexpected("'" + std::string(value) + "' is not a colour (#RRGGBB or #AARRGGBB)");
        }
        field = value;
        return {};
    };
    auto position = [&](std::optional<int>& field) -> std::expected<void, std::string> {
        if (value == "null") {
            field.reset();
            return {};
        }
        auto v = parse_int(value);
        if (!v) {
            return std::unexpected(k + " must be an integer or null");
        }
        field = *v;
        return {};
    };

    if (key == "theme_name") {
        const auto& names = theme_names();
        if (value != CUSTOM_THEME && std::find(names.begin(), names.end(), value) == names.end()) {
            return std::unexpected("Unknown theme '" + std::string(value) + "'");
        }
        s.theme_name = value;
        return {};
    }
    if (key == "opacity") {
        auto v = int_in_range(MIN_OPACITY, MAX_OPACITY);
        if (!v) return std::unexpected(v.error());
        s.opacity = *v;
        return {};
    }
    if (key == "custom_bg_color") return colour(s.custom_bg_color);
    if (key == "custom_key_color") return colour(s.custom_key_color);
    if (key == "custom_text_color") return colour(s.custom_text_color);
    if (key == "language") {
        if (value.empty()) {
            return std::unexpected("language must not be empty");
        }
        s.language = value;
        return {};
    }
    if (key == "window_x") return position(s.window_x);
    if (key == "window_y") return position(s.window_y);
    if (key == "window_width") {
        auto v = int_in_range(MIN_WINDOW_WIDTH, 100000);
        if (!v) return std::unexpected(v.error());
        s.window_width = *v;
        return {};
    }
    if (key == "window_height") {
        auto v = int_in_range(MIN_WINDOW_HEIGHT, 100000);
        if (!v) return std::unexpected(v.error());
        s.window_height = *v;
        return {};
    }
    return std::unexpected("Unknown setting '" + k + "'");
}
