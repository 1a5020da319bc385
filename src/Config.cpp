#include "Config.hpp"
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <algorithm>
#include <cctype>

AppConfig AppConfig::defaults() {
    AppConfig c;
    c.paths.config_dir = "config";
    c.monitor.foreground_poll_ms = 1000;
    c.keyboard.key_timeout_ms = 250;
    c.keyboard.state_check_ms = 50;
    c.overlay.hotkey_toggle = "CTRL+ALT+K";
    c.overlay.font_name = "Segoe UI";
    c.overlay.key_font_size = 14;
    c.overlay.shortcut_font_size = 11;
    c.logging.level = "info";
    c.logging.file = "";
    return c;
}

std::expected<AppConfig, std::string> AppConfig::load(const std::string& path) {
    if (!std::filesystem::exists(path)) {
        return std::unexpected("Config missing: " + path);
    }
    try {
        YAML::Node node = YAML::LoadFile(path);
        const AppConfig d = defaults();
        AppConfig c;
        c.paths.config_dir = node["paths"]["config_dir"].as<std::string>(d.paths.config_dir);

        c.monitor.foreground_poll_ms = node["monitor"]["foreground_poll_ms"].as<int>(d.monitor.foreground_poll_ms);
        c.monitor.foreground_poll_ms = std::clamp(c.monitor.foreground_poll_ms, 100, 10000);

        c.keyboard.key_timeout_ms = node["keyboard"]["key_timeout_ms"].as<int>(d.keyboard.key_timeout_ms);
        c.keyboard.key_timeout_ms = std::max(c.keyboard.key_timeout_ms, 0);
        c.keyboard.state_check_ms = node["keyboard"]["state_check_ms"].as<int>(d.keyboard.state_check_ms);
        c.keyboard.state_check_ms = std::clamp(c.keyboard.state_check_ms, 10, 1000);

        c.overlay.hotkey_toggle = node["overlay"]["hotkey_toggle"].as<std::string>(d.overlay.hotkey_toggle);
        std::transform(c.overlay.hotkey_toggle.begin(), c.overlay.hotkey_toggle.end(), c.overlay.hotkey_toggle.begin(),
                                    [](unsigned char c){ return std::toupper(c); }
                                );
        c.overlay.font_name = node["overlay"]["font_name"].as<std::string>(d.overlay.font_name);
        c.overlay.key_font_size = node["overlay"]["key_font_size"].as<int>(d.overlay.key_font_size);
        c.overlay.shortcut_font_size = node["overlay"]["shortcut_font_size"].as<int>(d.overlay.shortcut_font_size);

        c.logging.level = node["logging"]["level"].as<std::string>(d.logging.level);
        c.logging.file = node["logging"]["file"].as<std::string>(d.logging.file);
        return c;
    } catch (const std::exception& e) {
        return std::unexpected(e.what());
    }
}
