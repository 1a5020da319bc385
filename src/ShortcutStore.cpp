#include "ShortcutStore.hpp"
#include "JsonFile.hpp"
#include <spdlog/spdlog.h>

namespace {

std::string language_code(std::string_view language_setting) {
    auto pos = language_setting.find('_');
    return std::string(language_setting.substr(0, pos));
}

/// Description the table can hold: a string, or a map of language -> string.
std::optional<ShortcutDescription> parse_description(const YAML::Node& node) {
    if (node.IsScalar()) {
        return ShortcutDescription::text(node.Scalar());
    }
    if (!node.IsMap()) {
        return std::nullopt;
    }
    ShortcutDescription desc;
    for (const auto& kv : node) {
        if (!kv.second.IsScalar()) {
            return std::nullopt;
        }
        desc.translations[kv.first.as<std::string>()] = kv.second.Scalar();
    }
    return desc;
}

void emit_description(YAML::Emitter& out, const ShortcutDescription& desc) {
    if (desc.plain) {
        out << YAML::DoubleQuoted << *desc.plain;
        return;
    }
    out << YAML::BeginMap;
    for (const auto& [lang, text] : desc.translations) {
        out << YAML::Key << YAML::DoubleQuoted << lang << YAML::Value << YAML::DoubleQuoted << text;
    }
    out << YAML::EndMap;
}

void merge_description(ShortcutDescription& target, const ShortcutDescription& source) {
    if (!target.plain && !source.plain) {
        for (const auto& [lang, text] : source.translations) {
            target.translations[lang] = text;
        }
        return;
    }
    target = source;
}

std::string trimmed(std::string_view s) {
    std::string out(s);
    out.erase(0, out.find_first_not_of(" \t"));
    out.erase(out.find_last_not_of(" \t") + 1);
    return out;
}

template <typename Map>
auto entry_of(Map& m, const std::string& key) -> decltype(&m.begin()->second) {
    auto it = m.find(key);
    return it == m.end() ? nullptr : &it->second;
}

/// Exact group name first, then any group naming the same modifier set.
template <typename Map>
auto find_group_in(Map& groups, std::string_view combo) -> decltype(groups.begin()) {
    const std::string name = trimmed(combo);
    if (auto it = groups.find(name); it != groups.end()) {
        return it;
    }
    auto wanted = parse_modifier_combo(name);
    if (!wanted) {
        return groups.end();
    }
    for (auto it = groups.begin(); it != groups.end(); ++it) {
        auto parsed = parse_modifier_combo(it->first);
        if (parsed && *parsed == *wanted) return it;
    }
    return groups.end();
}

/// Canonical key name first ("esc" finds "Esc"), then the text as typed.
template <typename Map>
auto find_key_in(Map& keys, std::string_view key) -> decltype(keys.begin()) {
    const std::string raw = trimmed(key);
    if (auto name = normalize_key_name(raw)) {
        if (auto it = keys.find(*name); it != keys.end()) return it;
    }
    return keys.find(raw);
}

/// Case-insensitive application entry.
template <typename Map>
auto find_app_in(Map& m, std::string_view app) -> decltype(m.begin()) {
    const std::string key = ascii_upper(trimmed(app));
    if (auto it = m.find(key); it != m.end()) {
        return it;
    }
    for (auto it = m.begin(); it != m.end(); ++it) {
        if (ascii_upper(it->first) == key) return it;
    }
    return m.end();
}

std::map<std::string, YAML::Node>* preserved_keys(PreservedEntries& p, const std::string& app,
                                                  const std::string& combo) {
    auto* groups = entry_of(p.keys, app);
    return groups ? entry_of(*groups, combo) : nullptr;
}

} // namespace

std::string ShortcutDescription::resolve(std::string_view language_setting) const {
    if (plain) {
        return *plain;
    }
    const std::string lang = language_code(language_setting);
    const std::string fallback = lang != "en" ? "en" : "zh";
    if (auto it = translations.find(lang); it != translations.end()) return it->second;
    if (auto it = translations.find(fallback); it != translations.end()) return it->second;
    if (!translations.empty()) return translations.begin()->second;
    return "N/A";
}

ShortcutStore::ShortcutStore(std::filesystem::path path) : m_path(std::move(path)) {}

ShortcutTable ShortcutStore::default_table() {
    using L = std::map<std::string, std::string>;
    ShortcutTable t;
    t["NOTEPAD.EXE"]["Ctrl"] = {
        {"S", ShortcutDescription::localized(L{{"en", "Save File"}, {"zh", "\xE4\xBF\x9D\xE5\xAD\x98\xE6\x96\x87\xE4\xBB\xB6"}})},
        {"O", ShortcutDescription::localized(L{{"en", "Open File"}, {"zh", "\xE6\x89\x93\xE5\xBC\x80\xE6\x96\x87\xE4\xBB\xB6"}})},
        {"N", ShortcutDescription::localized(L{{"en", "New File"}, {"zh", "\xE6\x96\xB0\xE5\xBB\xBA\xE6\x96\x87\xE4\xBB\xB6"}})},
    };
    t[DEFAULT_APP]["Ctrl"] = {
        {"C", ShortcutDescription::localized(L{{"en", "Copy (Global)"}, {"zh", "\xE5\xA4\x8D\xE5\x88\xB6 (\xE5\x85\xA8\xE5\xB1\x80)"}})},
        {"V", ShortcutDescription::localized(L{{"en", "Paste (Global)"}, {"zh", "\xE7\xB2\x98\xE8\xB4\xB4 (\xE5\x85\xA8\xE5\xB1\x80)"}})},
        {"X", ShortcutDescription::localized(L{{"en", "Cut (Global)"}, {"zh", "\xE5\x89\xAA\xE5\x88\x87 (\xE5\x85\xA8\xE5\xB1\x80)"}})},
    };
    t[DEFAULT_APP]["Alt"] = {
        {"F4", ShortcutDescription::localized(L{{"en", "Close Window"}, {"zh", "\xE5\x85\xB3\xE9\x97\xAD\xE7\xAA\x97\xE5\x8F\xA3"}})},
    };
    return t;
}

std::expected<ShortcutTable, std::string> ShortcutStore::parse(const YAML::Node& root, PreservedEntries* preserved) {
    if (!root.IsMap()) {
        return std::unexpected("Shortcuts content is not a JSON object");
    }
    ShortcutTable table;
    for (const auto& app_kv : root) {
        const auto app = app_kv.first.as<std::string>();
        if (!app_kv.second.IsMap()) {
            spdlog::warn("Shortcuts: entry '{}' is not an object, kept as is", app);
            if (preserved) preserved->apps[app] = app_kv.second;
            continue;
        }
        auto& groups = table[app];
        for (const auto& group_kv : app_kv.second) {
            const auto combo = group_kv.first.as<std::string>();
            if (!group_kv.second.IsMap()) {
                spdlog::warn("Shortcuts: group '{}' of '{}' is not an object, kept as is", combo, app);
                if (preserved) preserved->groups[app][combo] = group_kv.second;
                continue;
            }
            auto& keys = groups[combo];
            for (const auto& key_kv : group_kv.second) {
                const auto key = key_kv.first.as<std::string>();
                if (auto desc = parse_description(key_kv.second)) {
                    keys[key] = std::move(*desc);
                } else if (preserved) {
                    preserved->keys[app][combo][key] = key_kv.second;
                }
            }
        }
    }
    return table;
}

std::string ShortcutStore::to_json(const ShortcutTable& table, const PreservedEntries& preserved) {
    YAML::Emitter out;
    configure_json_emitter(out);
    out << YAML::BeginMap;
    for (const auto& [app, groups] : table) {
        out << YAML::Key << YAML::DoubleQuoted << app << YAML::Value << YAML::BeginMap;
        const auto* kept_keys = entry_of(preserved.keys, app);
        for (const auto& [combo, keys] : groups) {
            out << YAML::Key << YAML::DoubleQuoted << combo << YAML::Value << YAML::BeginMap;
            for (const auto& [key, desc] : keys) {
                out << YAML::Key << YAML::DoubleQuoted << key << YAML::Value;
                emit_description(out, desc);
            }
            if (const auto* kept = kept_keys ? entry_of(*kept_keys, combo) : nullptr) {
                for (const auto& [key, value] : *kept) {
                    if (keys.contains(key)) continue;
                    out << YAML::Key << YAML::DoubleQuoted << key << YAML::Value;
                    emit_json_value(out, value);
                }
            }
            out << YAML::EndMap;
        }
        if (const auto* kept = entry_of(preserved.groups, app)) {
            for (const auto& [combo, value] : *kept) {
                if (groups.contains(combo)) continue;
                out << YAML::Key << YAML::DoubleQuoted << combo << YAML::Value;
                emit_json_value(out, value);
            }
        }
        out << YAML::EndMap;
    }
    for (const auto& [app, value] : preserved.apps) {
        if (table.contains(app)) continue;
        out << YAML::Key << YAML::DoubleQuoted << app << YAML::Value;
        emit_json_value(out, value);
    }
    out << YAML::EndMap;
    return out.c_str();
}

void ShortcutStore::load_or_create() {
    m_preserved = {};
    if (!std::filesystem::exists(m_path)) {
        m_table = default_table();
        if (auto res = save(); !res) {
            spdlog::error("Could not create default shortcuts at '{}': {}", m_path.string(), res.error());
        } else {
            spdlog::info("Created default shortcuts at '{}'", m_path.string());
        }
        return;
    }

    auto root = read_json_file(m_path);
    PreservedEntries preserved;
    auto table = root ? parse(*root, &preserved)
                      : std::expected<ShortcutTable, std::string>(std::unexpected(root.error()));
    if (!table) {
        spdlog::warn("Error loading shortcuts from '{}': {}. Using default shortcuts.", m_path.string(), table.error());
        m_table = default_table();
        return;
    }
    m_table = std::move(*table);
    m_preserved = std::move(preserved);
    spdlog::info("Loaded shortcuts for {} application(s) from '{}'", m_table.size(), m_path.string());
}

std::expected<void, std::string> ShortcutStore::save() const {
    return write_text_file(m_path, to_json(m_table, m_preserved));
}

const ModifierGroups& ShortcutStore::shortcuts_for_app(std::string_view app) const {
    static const ModifierGroups empty;
    const std::string key = app.empty() ? std::string(DEFAULT_APP) : ascii_upper(app);

    if (auto it = m_table.find(key); it != m_table.end()) {
        return it->second;
    }
    for (const auto& [name, groups] : m_table) {
        if (ascii_upper(name) == key) return groups;
    }
    if (key != DEFAULT_APP) {
        if (auto it = m_table.find(DEFAULT_APP); it != m_table.end()) {
            return it->second;
        }
    }
    return empty;
}

const KeyShortcuts* ShortcutStore::group_for(const ModifierGroups& groups, const ModifierSet& modifiers) {
    if (modifiers.empty()) {
        return nullptr;
    }
    if (auto it = groups.find(modifiers.combo_string()); it != groups.end()) {
        return &it->second;
    }
    for (const auto& [combo, keys] : groups) {
        auto parsed = parse_modifier_combo(combo);
        if (parsed && *parsed == modifiers) {
            return &keys;
        }
    }
    return nullptr;
}

ShortcutTable::iterator ShortcutStore::find_app_entry(std::string_view app) {
    return find_app_in(m_table, app);
}

ModifierGroups* ShortcutStore::find_app(std::string_view app) {
    auto it = find_app_entry(app);
    return it == m_table.end() ? nullptr : &it->second;
}

ModifierGroups::const_iterator ShortcutStore::find_group(const ModifierGroups& groups, std::string_view combo) {
    return find_group_in(groups, combo);
}

ModifierGroups::iterator ShortcutStore::find_group(ModifierGroups& groups, std::string_view combo) {
    return find_group_in(groups, combo);
}

std::expected<void, std::string> ShortcutStore::add_application(std::string_view app) {
    const std::string name = ascii_upper(trimmed(app));
    if (name.empty()) {
        return std::unexpected("Application name is empty.");
    }
    if (find_app(name) || find_app_in(m_preserved.apps, name) != m_preserved.apps.end()) {
        return std::unexpected("Application already exists.");
    }
    m_table[name];
    return {};
}

std::expected<void, std::string> ShortcutStore::remove_application(std::string_view app) {
    if (auto it = find_app_entry(app); it != m_table.end()) {
        m_preserved.groups.erase(it->first);
        m_preserved.keys.erase(it->first);
        m_table.erase(it);
        return {};
    }
    if (auto it = find_app_in(m_preserved.apps, app); it != m_preserved.apps.end()) {
        m_preserved.apps.erase(it);
        return {};
    }
    return std::unexpected("No application named '" + std::string(app) + "'.");
}

std::expected<void, std::string> ShortcutStore::add_modifier_group(std::string_view app, std::string_view combo) {
    auto entry = find_app_entry(app);
    if (entry == m_table.end()) {
        return std::unexpected("No application named '" + std::string(app) + "'.");
    }
    const std::string name = trimmed(combo);
    if (name.empty()) {
        return std::unexpected("Modifier group name is empty.");
    }
    auto& groups = entry->second;
    const auto* kept = entry_of(m_preserved.groups, entry->first);
    if (find_group_in(groups, name) != groups.end() || (kept && find_group_in(*kept, name) != kept->end())) {
        return std::unexpected("Modifier group already exists.");
    }
    groups[name];
    return {};
}

std::expected<void, std::string> ShortcutStore::rename_modifier_group(std::string_view app, std::string_view old_combo,
                                                                      std::string_view new_combo) {
    auto entry = find_app_entry(app);
    if (entry == m_table.end()) {
        return std::unexpected("No application named '" + std::string(app) + "'.");
    }
    auto& groups = entry->second;
    auto it = find_group_in(groups, old_combo);
    if (it == groups.end()) {
        return std::unexpected("No modifier group named '" + std::string(old_combo) + "'.");
    }
    const std::string name = trimmed(new_combo);
    if (name.empty() || name == it->first) {
        return {};
    }
    auto clash = find_group_in(groups, name);
    const auto* kept = entry_of(m_preserved.groups, entry->first);
    if ((clash != groups.end() && clash != it) || (kept && find_group_in(*kept, name) != kept->end())) {
        return std::unexpected("Another modifier group with this name already exists.");
    }

    const std::string old_name = it->first;
    auto node = groups.extract(it);
    node.key() = name;
    groups.insert(std::move(node));

    if (auto* kept_keys = entry_of(m_preserved.keys, entry->first)) {
        if (auto moved = kept_keys->extract(old_name); !moved.empty()) {
            moved.key() = name;
            kept_keys->insert(std::move(moved));
        }
    }
    return {};
}

std::expected<void, std::string> ShortcutStore::remove_modifier_group(std::string_view app, std::string_view combo) {
    auto entry = find_app_entry(app);
    if (entry == m_table.end()) {
        return std::unexpected("No application named '" + std::string(app) + "'.");
    }
    auto& groups = entry->second;
    if (auto it = find_group_in(groups, combo); it != groups.end()) {
        if (auto* kept_keys = entry_of(m_preserved.keys, entry->first)) {
            kept_keys->erase(it->first);
        }
        groups.erase(it);
        return {};
    }
    if (auto* kept = entry_of(m_preserved.groups, entry->first)) {
        if (auto it = find_group_in(*kept, combo); it != kept->end()) {
            kept->erase(it);
            return {};
        }
    }
    return std::unexpected("No modifier group named '" + std::string(combo) + "'.");
}

std::expected<void, std::string> ShortcutStore::add_shortcut(std::string_view app, std::string_view combo,
                                                             std::string_view key, ShortcutDescription desc) {
    auto entry = find_app_entry(app);
    if (entry == m_table.end()) {
        return std::unexpected("No application named '" + std::string(app) + "'.");
    }
    auto group = find_group_in(entry->second, combo);
    if (group == entry->second.end()) {
        return std::unexpected("No modifier group named '" + std::string(combo) + "'.");
    }
    auto name = normalize_key_name(trimmed(key));
    if (!name) {
        return std::unexpected("Key name is empty.");
    }
    auto& keys = group->second;
    auto* kept = preserved_keys(m_preserved, entry->first, group->first);
    if (find_key_in(keys, key) != keys.end() || (kept && find_key_in(*kept, key) != kept->end())) {
        return std::unexpected("Shortcut for key '" + *name + "' already exists in this group.");
    }
    keys[*name] = std::move(desc);
    return {};
}

std::expected<void, std::string> ShortcutStore::edit_shortcut(std::string_view app, std::string_view combo,
                                                              std::string_view old_key, std::string_view new_key,
                                                              ShortcutDescription desc) {
    auto entry = find_app_entry(app);
    if (entry == m_table.end()) {
        return std::unexpected("No application named '" + std::string(app) + "'.");
    }
    auto group = find_group_in(entry->second, combo);
    if (group == entry->second.end()) {
        return std::unexpected("No modifier group named '" + std::string(combo) + "'.");
    }
    auto& keys = group->second;
    auto* kept = preserved_keys(m_preserved, entry->first, group->first);

    // The edited entry may be one the table could not model; it becomes a regular shortcut
    auto old_it = find_key_in(keys, old_key);
    const bool old_is_kept = old_it == keys.end() && kept && find_key_in(*kept, old_key) != kept->end();
    if (old_it == keys.end() && !old_is_kept) {
        return std::unexpected("No shortcut for key '" + std::string(old_key) + "'.");
    }
    const std::string old_name = old_is_kept ? find_key_in(*kept, old_key)->first : old_it->first;

    auto name = normalize_key_name(trimmed(new_key));
    if (!name) {
        return std::unexpected("Key name is empty.");
    }
    if (*name != old_name) {
        auto clash = find_key_in(keys, new_key);
        const bool clash_in_table = clash != keys.end() && clash->first != old_name;
        bool clash_in_kept = false;
        if (kept) {
            auto kept_clash = find_key_in(*kept, new_key);
            clash_in_kept = kept_clash != kept->end() && kept_clash->first != old_name;
        }
        if (clash_in_table || clash_in_kept) {
            return std::unexpected("Another shortcut for key '" + *name + "' already exists.");
        }
    }

    if (old_is_kept) {
        kept->erase(old_name);
    } else if (old_name != *name) {
        keys.erase(old_it);
    }
    keys[*name] = std::move(desc);
    return {};
}

std::expected<void, std::string> ShortcutStore::remove_shortcut(std::string_view app, std::string_view combo,
                                                                std::string_view key) {
    auto entry = find_app_entry(app);
    if (entry == m_table.end()) {
        return std::unexpected("No application named '" + std::string(app) + "'.");
    }
    auto group = find_group_in(entry->second, combo);
    if (group == entry->second.end()) {
        return std::unexpected("No modifier group named '" + std::string(combo) + "'.");
    }
    auto& keys = group->second;
    if (auto it = find_key_in(keys, key); it != keys.end()) {
        keys.erase(it);
        return {};
    }
    if (auto* kept = preserved_keys(m_preserved, entry->first, group->first)) {
        if (auto it = find_key_in(*kept, key); it != kept->end()) {
            kept->erase(it);
            return {};
        }
    }
    return std::unexpected("No shortcut for key '" + std::string(key) + "'.");
}

std::expected<void, std::string> ShortcutStore::import_file(const std::filesystem::path& path) {
    auto root = read_json_file(path);
    if (!root) {
        return std::unexpected(root.error());
    }
    PreservedEntries imported_extra;
    auto imported = parse(*root, &imported_extra);
    if (!imported) {
        return std::unexpected("Imported file is not a valid shortcut JSON object.");
    }

    size_t merged = 0;
    for (auto& [app, groups] : *imported) {
        auto target = find_app_entry(app);
        if (target == m_table.end()) {
            target = m_table.try_emplace(ascii_upper(app)).first;
        }
        for (auto& [combo, keys] : groups) {
            auto& target_keys = target->second[combo];
            auto* kept = preserved_keys(m_preserved, target->first, combo);
            for (auto& [key, desc] : keys) {
                if (kept) kept->erase(key);
                auto it = target_keys.find(key);
                if (it == target_keys.end()) {
                    target_keys.emplace(key, std::move(desc));
                } else {
                    merge_description(it->second, desc);
                }
                ++merged;
            }
        }
    }

    // Entries the table cannot model are carried over as they are
    for (auto& [app, value] : imported_extra.apps) {
        if (find_app_entry(app) != m_table.end()) {
            spdlog::warn("Import: '{}' is not an object, existing shortcuts kept", app);
            continue;
        }
        if (auto it = find_app_in(m_preserved.apps, app); it != m_preserved.apps.end()) {
            m_preserved.apps.erase(it);
        }
        m_preserved.apps[ascii_upper(app)] = value;
    }
    for (auto& [app, groups] : imported_extra.groups) {
        auto target = find_app_entry(app);
        for (auto& [combo, value] : groups) {
            if (target->second.contains(combo)) {
                spdlog::warn("Import: group '{}' of '{}' is not an object, existing shortcuts kept", combo, app);
                continue;
            }
            m_preserved.groups[target->first][combo] = value;
        }
    }
    for (auto& [app, groups] : imported_extra.keys) {
        auto target = find_app_entry(app);
        for (auto& [combo, keys] : groups) {
            for (auto& [key, value] : keys) {
                target->second[combo].erase(key);
                m_preserved.keys[target->first][combo][key] = value;
                ++merged;
            }
        }
    }

    spdlog::info("Imported {} shortcut(s) for {} application(s) from '{}'", merged, imported->size(), path.string());
    return {};
}
