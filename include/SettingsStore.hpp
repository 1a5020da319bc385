#ifndef SETTINGS_STORE_HPP
#define SETTINGS_STORE_HPP

#include <expected>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>
#include <yaml-cpp/yaml.h>

/**
 * @struct AppSettings
 * @brief User-editable overlay settings. Member initializers are the defaults.
 */
struct AppSettings {
    std::string theme_name{"Default Dark"};
    int opacity{85}; // percent
    std::string custom_bg_color{"#AA14141E"};
    std::string custom_key_color{"#CC32323C"};
    std::string custom_text_color{"#FFFFFFFF"};
    std::string language{"en_US"};
    std::optional<int> window_x;
    std::optional<int> window_y;
    int window_width{850};
    int window_height{280};

    bool operator==(const AppSettings&) const = default;
};

/**
 * @class SettingsStore
 * @brief settings.json with merge-with-defaults loading.
 *
 * Keys the application does not know are kept as parsed and written back on save.
 */
class SettingsStore {
public:
    static constexpr int MIN_OPACITY = 20;
    static constexpr int MAX_OPACITY = 100;

    explicit SettingsStore(std::filesystem::path path);

    /**
     * @brief Overlays the file's values on the defaults. The file is rewritten when it was
     * missing, unreadable, not an object, or lacked (or mistyped) a known key.
     */
    void load_or_create();

    std::expected<void, std::string> save() const;

    const AppSettings& settings() const { return m_settings; }

    /**
     * @brief Replaces all settings and saves.
     */
    std::expected<void, std::string> update(AppSettings settings);

    /**
     * @brief Text form of a known setting, "null" for an unset window position.
     */
    std::expected<std::string, std::string> get_value(std::string_view key) const;

    /**
     * @brief Parses and validates a text value into a known setting. Does not save.
     */
    std::expected<void, std::string> set_value(std::string_view key, std::string_view value);

    /// Known keys in file order.
    static const std::vector<std::string>& known_keys();

    std::string to_json() const;
    const std::filesystem::path& path() const { return m_path; }

private:
    std::filesystem::path m_path;
    AppSettings m_settings;
    YAML::Node m_unknown{YAML::NodeType::Map};
};

#endif
