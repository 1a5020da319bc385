#include "KeyboardState.hpp"
#include <spdlog/spdlog.h>

KeyboardState::KeyboardState(const KeyStateReader& reader, std::chrono::milliseconds key_timeout)
    : m_reader(reader), m_key_timeout(key_timeout) {}

void KeyboardState::handle(std::string_view key_name, KeyAction action, uint32_t source_code,
                           Clock::time_point now) {
    auto normalized = normalize_key_name(key_name);
    if (!normalized) {
        return;
    }
    const std::string& key = *normalized;
    const auto mod = modifier_from_key_name(key);

    bool modifiers_changed = false;
    if (action == KeyAction::Down) {
        // Auto-repeat keeps the first press time
        m_pressed.try_emplace(key, now);
        if (mod) {
            m_modifier_sources[*mod].insert(source_code);
            if (!m_modifiers.contains(*mod)) {
                m_modifiers.insert(*mod);
                modifiers_changed = true;
            }
        }
    } else {
        bool still_held = false;
        if (mod) {
            auto& sources = m_modifier_sources[*mod];
            sources.erase(source_code);
            // Left Shift up while right Shift is held keeps Shift active
            still_held = !sources.empty();
            if (!still_held && m_modifiers.contains(*mod)) {
                m_modifiers.erase(*mod);
                modifiers_changed = true;
            }
        }
        if (!still_held) {
            m_pressed.erase(key);
        }
    }

    if (m_key_listener) {
        m_key_listener(key, action);
    }
    if (modifiers_changed) {
        notify_modifiers();
    }
}

void KeyboardState::sweep_stuck_keys(Clock::time_point now) {
    std::vector<std::string> stuck;
    for (const auto& [key, pressed_at] : m_pressed) {
        auto down = m_reader.is_key_down(key);
        if (!down) {
            if (now - pressed_at > m_key_timeout) {
                spdlog::debug("Key state unavailable for '{}' ({}), releasing after timeout", key, down.error());
                stuck.push_back(key);
            }
        } else if (!*down) {
            stuck.push_back(key);
        }
    }
    for (const auto& key : stuck) {
        spdlog::debug("Releasing stuck key '{}'", key);
        release(key);
    }
}

void KeyboardState::release(const std::string& key) {
    auto it = m_pressed.find(key);
    if (it == m_pressed.end()) {
        return;
    }
    m_pressed.erase(it);

    if (m_key_listener) {
        m_key_listener(key, KeyAction::Up);
    }

    auto mod = modifier_from_key_name(key);
    if (mod && m_modifiers.contains(*mod)) {
        m_modifier_sources[*mod].clear();
        m_modifiers.erase(*mod);
        notify_modifiers();
    }
}

void KeyboardState::reset() {
    const bool had_modifiers = !m_modifiers.empty();
    m_pressed.clear();
    m_modifier_sources.clear();
    m_modifiers.clear();
    if (had_modifiers) {
        notify_modifiers();
    }
}

std::vector<std::string> KeyboardState::pressed_keys() const {
    std::vector<std::string> keys;
    keys.reserve(m_pressed.size());
    for (const auto& [key, _] : m_pressed) {
        keys.push_back(key);
    }
    return keys;
}

void KeyboardState::notify_modifiers() {
    if (m_modifiers_listener) {
        m_modifiers_listener(m_modifiers);
    }
}
