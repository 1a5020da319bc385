#pragma once
#include <string>
#include <expected>

/**
 * @struct AppConfig
 * @brief Application configuration loaded from YAML.
 */
struct AppConfig {
    struct {
        std::string config_dir;
    } paths;

    struct {
        int foreground_poll_ms;
    } monitor;

    struct {
        int key_timeout_ms;
        int state_check_ms;
    } keyboard;

    struct {
        std::string hotkey_toggle;
        std::string font_name;
        int key_font_size;
        int shortcut_font_size;
    } overlay;

    struct {
        std::string level;
        std::string file;
    } logging;

    /**
     * @brief Configuration used when no config.yaml exists.
     */
    static AppConfig defaults();

    /**
     * @brief Parses config.yaml into the struct. Absent keys take their default value.
     * @return std::expected containing config or error string.
     */
    static std::expected<AppConfig, std::string> load(const std::string& path);
};
