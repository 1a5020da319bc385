#include "OverlayModel.hpp"
#include <spdlog/spdlog.h>

OverlayModel::OverlayModel(const ShortcutStore& shortcuts, const SettingsStore& settings, KeyboardLayout layout)
    : m_shortcuts(shortcuts), m_settings(settings), m_layout(std::move(layout)) {
    refresh_shortcuts();
}

bool OverlayModel::set_active_app(std::string_view app) {
    std::string name = app.empty() ? std::string(ShortcutStore::DEFAULT_APP) : ascii_upper(app);
    if (name == m_active_app) {
        return false;
    }
    m_active_app = std::move(name);
    spdlog::debug("Active application: {}", m_active_app);
    refresh_shortcuts();
    return true;
}

bool OverlayModel::apply_key_event(std::string_view key, KeyAction action) {
    if (key.empty()) {
        return false;
    }
    std::string name = ascii_upper(key);
    if (action == KeyAction::Down) {
        return m_pressed.insert(std::move(name)).second;
    }
    return m_pressed.erase(name) > 0;
}

bool OverlayModel::set_modifiers(const ModifierSet& modifiers) {
    if (modifiers == m_modifiers) {
        return false;
    }
    m_modifiers = modifiers;
    refresh_shortcuts();
    return true;
}

void OverlayModel::refresh_shortcuts() {
    m_shortcut_text.clear();
    const auto& groups = m_shortcuts.shortcuts_for_app(m_active_app);
    const KeyShortcuts* keys = ShortcutStore::group_for(groups, m_modifiers);
    if (!keys) {
        return;
    }
    const std::string& language = m_settings.settings().language;
    for (const auto& [key, desc] : *keys) {
        m_shortcut_text[ascii_upper(key)] = desc.resolve(language);
    }
}

KeyVisual OverlayModel::visual_for(std::string_view match_name) const {
    for (auto mod : {Modifier::Ctrl, Modifier::Shift, Modifier::Alt, Modifier::Win}) {
        if (m_modifiers.contains(mod) && match_name == ascii_upper(modifier_name(mod))) {
            return KeyVisual::ModifierActive;
        }
    }
    if (m_pressed.find(match_name) != m_pressed.end()) {
        return KeyVisual::Pressed;
    }
    return KeyVisual::Normal;
}

std::string OverlayModel::shortcut_for(std::string_view match_name) const {
    auto it = m_shortcut_text.find(match_name);
    return it != m_shortcut_text.end() ? it->second : std::string();
}
