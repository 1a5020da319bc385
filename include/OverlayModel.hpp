#pragma once
#include <map>
#include <set>
#include <string>
#include <string_view>
#include "KeyboardLayout.hpp"
#include "KeyboardState.hpp"
#include "SettingsStore.hpp"
#include "ShortcutStore.hpp"

enum class KeyVisual { Normal, Pressed, ModifierActive };

/**
 * @class OverlayModel
 * @brief Display state of the overlay: which app is active, which keys are down and
 * which shortcut text each key shows.
 *
 * Reads the stores on every refresh, so edits made to them show up after refresh_shortcuts().
 */
class OverlayModel {
public:
    OverlayModel(const ShortcutStore& shortcuts, const SettingsStore& settings,
                 KeyboardLayout layout = KeyboardLayout::standard());

    /**
     * @brief Switches the application whose shortcuts are shown. Empty means DEFAULT.
     * @return true if the active app changed.
     */
    bool set_active_app(std::string_view app);

    /**
     * @brief Records a physical press or release.
     * @return true if the set of pressed keys changed.
     */
    bool apply_key_event(std::string_view key, KeyAction action);

    /**
     * @brief Replaces the logical modifiers and re-resolves shortcut texts.
     * @return true if the set changed.
     */
    bool set_modifiers(const ModifierSet& modifiers);

    /// Re-reads shortcuts and language after either store changed.
    void refresh_shortcuts();

    const std::string& active_app() const { return m_active_app; }
    const ModifierSet& modifiers() const { return m_modifiers; }
    const KeyboardLayout& layout() const { return m_layout; }

    /// Current modifier group key, "" when no modifier is active.
    std::string modifier_combo() const { return m_modifiers.combo_string(); }

    KeyVisual visual_for(std::string_view match_name) const;

    /// Shortcut text for a key, "" when the current group defines none.
    std::string shortcut_for(std::string_view match_name) const;

private:
    const ShortcutStore& m_shortcuts;
    const SettingsStore& m_settings;
    KeyboardLayout m_layout;

    std::string m_active_app{ShortcutStore::DEFAULT_APP};
    ModifierSet m_modifiers;
    std::set<std::string, std::less<>> m_pressed;
    std::map<std::string, std::string, std::less<>> m_shortcut_text;
};
