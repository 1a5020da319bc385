#pragma once
#include <chrono>
#include <expected>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>
#include "KeyNames.hpp"

enum class KeyAction { Down, Up };

/**
 * @class KeyStateReader
 * @brief Live physical key state, used to detect keys whose release event was lost.
 */
class KeyStateReader {
public:
    virtual ~KeyStateReader() = default;

    /**
     * @param key Canonical key name ("Ctrl", "A", "F4").
     * @return true if any physical key producing the name is down, or an error message
     *         when the state cannot be determined.
     */
    virtual std::expected<bool, std::string> is_key_down(std::string_view key) const = 0;
};

/**
 * @class KeyboardState
 * @brief Tracks physically pressed keys and the active logical modifiers.
 *
 * Fed from the global keyboard hook. Listeners are invoked synchronously on the
 * thread that calls handle() / sweep_stuck_keys() / reset().
 */
class KeyboardState {
public:
    using Clock = std::chrono::steady_clock;
    using KeyListener = std::function<void(const std::string& key, KeyAction action)>;
    using ModifiersListener = std::function<void(const ModifierSet& modifiers)>;

    explicit KeyboardState(const KeyStateReader& reader,
                           std::chrono::milliseconds key_timeout = std::chrono::milliseconds(250));

    void set_key_listener(KeyListener l) { m_key_listener = std::move(l); }
    void set_modifiers_listener(ModifiersListener l) { m_modifiers_listener = std::move(l); }

    /**
     * @brief Processes one key event.
     * @param key_name Raw or canonical key name; events that cannot be normalized are dropped.
     * @param action Down or Up.
     * @param source_code Physical key identifier (virtual-key code). Distinguishes left and
     *        right modifier keys so a modifier stays active while either side is held.
     * @param now Event time.
     */
    void handle(std::string_view key_name, KeyAction action, uint32_t source_code, Clock::time_point now);

    /**
     * @brief Releases keys whose "up" event never arrived.
     * Keys the reader reports as released are released immediately; when the reader fails,
     * a key is released once it has been held longer than the key timeout.
     */
    void sweep_stuck_keys(Clock::time_point now);

    /**
     * @brief Forgets all state. Reports an empty modifier set, synchronously, when modifiers
     * were active.
     */
    void reset();

    const ModifierSet& modifiers() const { return m_modifiers; }
    bool is_pressed(std::string_view key) const { return m_pressed.find(key) != m_pressed.end(); }
    std::vector<std::string> pressed_keys() const;

private:
    void release(const std::string& key);
    void notify_modifiers();

    const KeyStateReader& m_reader;
    std::chrono::milliseconds m_key_timeout;

    std::map<std::string, Clock::time_point, std::less<>> m_pressed;
    std::map<Modifier, std::set<uint32_t>> m_modifier_sources;
    ModifierSet m_modifiers;

    KeyListener m_key_listener;
    ModifiersListener m_modifiers_listener;
};
