#pragma once
#include <expected>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <yaml-cpp/yaml.h>
#include "KeyNames.hpp"

/**
 * @struct ShortcutDescription
 * @brief Text shown on a key: either a plain string or per-language translations.
 */
struct ShortcutDescription {
    std::optional<std::string> plain;
    std::map<std::string, std::string> translations; // "en" -> "Save File"

    static ShortcutDescription text(std::string s) { return {std::move(s), {}}; }
    static ShortcutDescription localized(std::map<std::string, std::string> t) { return {std::nullopt, std::move(t)}; }

    /**
     * @brief Picks the text for a language setting such as "zh_CN".
     * Order: requested language, fallback language ("en", or "zh" when the request is "en"),
     * first translation. A plain string is returned unchanged. Nothing usable gives "N/A".
     */
    std::string resolve(std::string_view language_setting) const;

    bool operator==(const ShortcutDescription&) const = default;
};

using KeyShortcuts = std::map<std::string, ShortcutDescription>;   // "S" -> description
using ModifierGroups = std::map<std::string, KeyShortcuts>;        // "Ctrl+Shift" -> keys
using ShortcutTable = std::map<std::string, ModifierGroups>;       // "NOTEPAD.EXE" -> groups

/**
 * @struct PreservedEntries
 * @brief Parts of shortcuts.json the table does not model (non-object apps or groups,
 * descriptions that are neither a string nor a map of strings). Written back unchanged.
 */
struct PreservedEntries {
    std::map<std::string, YAML::Node> apps;                                  // app -> value
    std::map<std::string, std::map<std::string, YAML::Node>> groups;         // app -> group -> value
    std::map<std::string, std::map<std::string, std::map<std::string, YAML::Node>>> keys; // app -> group -> key -> value

    bool empty() const { return apps.empty() && groups.empty() && keys.empty(); }
};

/**
 * @class ShortcutStore
 * @brief Per-application shortcut definitions persisted in shortcuts.json.
 */
class ShortcutStore {
public:
    static constexpr const char* DEFAULT_APP = "DEFAULT";

    explicit ShortcutStore(std::filesystem::path path);

    /**
     * @brief Loads the file, or creates it from the built-in defaults when missing.
     * An unreadable or malformed file is left untouched and the defaults are used in memory.
     */
    void load_or_create();

    /**
     * @brief Writes the current table to disk.
     */
    std::expected<void, std::string> save() const;

    /**
     * @brief Shortcuts for an executable name (case-insensitive), falling back to DEFAULT.
     * @return Empty groups if neither the app nor DEFAULT is defined.
     */
    const ModifierGroups& shortcuts_for_app(std::string_view app) const;

    /**
     * @brief Group matching the active modifiers: exact combo key first, then any key that
     * names the same modifiers in another order ("Shift+Ctrl").
     */
    static const KeyShortcuts* group_for(const ModifierGroups& groups, const ModifierSet& modifiers);

    /**
     * @brief Group named by user input: exact name first, then a group naming the same
     * modifiers ("ctrl" finds "Ctrl", "Shift+Ctrl" finds "Ctrl+Shift").
     */
    static ModifierGroups::const_iterator find_group(const ModifierGroups& groups, std::string_view combo);
    static ModifierGroups::iterator find_group(ModifierGroups& groups, std::string_view combo);

    const ShortcutTable& table() const { return m_table; }
    const PreservedEntries& preserved() const { return m_preserved; }
    void replace_table(ShortcutTable table) { m_table = std::move(table); }
    const std::filesystem::path& path() const { return m_path; }

    std::expected<void, std::string> add_application(std::string_view app);
    std::expected<void, std::string> remove_application(std::string_view app);
    std::expected<void, std::string> add_modifier_group(std::string_view app, std::string_view combo);
    std::expected<void, std::string> rename_modifier_group(std::string_view app, std::string_view old_combo,
                                                           std::string_view new_combo);
    std::expected<void, std::string> remove_modifier_group(std::string_view app, std::string_view combo);
    std::expected<void, std::string> add_shortcut(std::string_view app, std::string_view combo,
                                                  std::string_view key, ShortcutDescription desc);
    std::expected<void, std::string> edit_shortcut(std::string_view app, std::string_view combo,
                                                   std::string_view old_key, std::string_view new_key,
                                                   ShortcutDescription desc);
    std::expected<void, std::string> remove_shortcut(std::string_view app, std::string_view combo,
                                                     std::string_view key);

    /**
     * @brief Deep-merges another shortcuts JSON file into the table. App names are
     * upper-cased; localized descriptions merge per language.
     */
    std::expected<void, std::string> import_file(const std::filesystem::path& path);

    static ShortcutTable default_table();
    /**
     * @brief Builds the table from a parsed document. Entries the table cannot hold are
     * skipped, or collected into preserved when it is given.
     */
    static std::expected<ShortcutTable, std::string> parse(const YAML::Node& root,
                                                           PreservedEntries* preserved = nullptr);
    static std::string to_json(const ShortcutTable& table, const PreservedEntries& preserved = {});

private:
    ModifierGroups* find_app(std::string_view app);
    ShortcutTable::iterator find_app_entry(std::string_view app);

    std::filesystem::path m_path;
    ShortcutTable m_table;
    PreservedEntries m_preserved;
};
