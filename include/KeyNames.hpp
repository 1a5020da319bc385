#pragma once
#include <cstdint>
#include <expected>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @enum Modifier
 * @brief Logical modifier keys. Left/right variants collapse onto one value.
 */
enum class Modifier : uint8_t {
    Ctrl = 1 << 0,
    Shift = 1 << 1,
    Alt = 1 << 2,
    Win = 1 << 3,
};

/**
 * @class ModifierSet
 * @brief Value-type set of active logical modifiers.
 */
class ModifierSet {
public:
    ModifierSet() = default;
    ModifierSet(std::initializer_list<Modifier> mods) {
        for (auto m : mods) insert(m);
    }

    bool contains(Modifier m) const { return (m_bits & static_cast<uint8_t>(m)) != 0; }
    void insert(Modifier m) { m_bits |= static_cast<uint8_t>(m); }
    void erase(Modifier m) { m_bits &= static_cast<uint8_t>(~static_cast<uint8_t>(m)); }
    void clear() { m_bits = 0; }
    bool empty() const { return m_bits == 0; }
    size_t size() const;
    uint8_t bits() const { return m_bits; }

    /**
     * @brief Group key as stored in shortcuts.json ("Ctrl", "Ctrl+Shift", ...).
     * Modifiers are joined in the order Ctrl, Alt, Shift, Win. Empty set gives "".
     */
    std::string combo_string() const;

    bool operator==(const ModifierSet&) const = default;

private:
    uint8_t m_bits{0};
};

/**
 * @struct Hotkey
 * @brief A parsed global hotkey such as "Ctrl+Alt+K".
 */
struct Hotkey {
    ModifierSet modifiers;
    uint32_t vk{0};
};

/// Display name of a modifier ("Ctrl", "Shift", "Alt", "Win").
const char* modifier_name(Modifier m);

/// ASCII upper-casing; multi-byte UTF-8 sequences pass through untouched.
std::string ascii_upper(std::string_view s);
std::string ascii_lower(std::string_view s);

/**
 * @brief Converts a loose key name ("left ctrl", "page up", "a", "semicolon") to the
 * canonical name used by the layout and shortcuts.json ("Ctrl", "PgUp", "A", ";").
 * @return std::nullopt for an empty name. Canonical names map to themselves.
 */
std::optional<std::string> normalize_key_name(std::string_view raw);

/**
 * @brief Canonical name for a Windows virtual-key code.
 * @return std::nullopt for keys the overlay does not track.
 */
std::optional<std::string> key_name_from_virtual_key(uint32_t vk);

/**
 * @brief Virtual-key codes producing a canonical name. Modifiers return both sides.
 */
std::vector<uint32_t> virtual_keys_for_key_name(std::string_view name);

std::optional<Modifier> modifier_from_key_name(std::string_view name);

/**
 * @brief Parses a modifier group key ("Shift+Ctrl", "alt") in any order and case.
 */
std::expected<ModifierSet, std::string> parse_modifier_combo(std::string_view text);

/**
 * @brief Translates a config string (e.g., "Ctrl+Shift+F1") into modifiers and a virtual key.
 */
std::expected<Hotkey, std::string> parse_hotkey(std::string_view text);
