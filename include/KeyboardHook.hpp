#pragma once
#include <windows.h>
#include "KeyboardState.hpp"

/**
 * @class KeyboardHook
 * @brief Global low-level keyboard hook feeding a KeyboardState.
 *
 * Must be created on a thread that pumps messages. Events are observed, never swallowed.
 * Only one instance can be active at a time.
 */
class KeyboardHook {
public:
    /**
     * @brief Installs WH_KEYBOARD_LL.
     * @throws std::runtime_error if the hook cannot be installed.
     */
    explicit KeyboardHook(KeyboardState& state);
    ~KeyboardHook();

    KeyboardHook(const KeyboardHook&) = delete;
    KeyboardHook& operator=(const KeyboardHook&) = delete;

    /**
     * @brief Unhooks and resets the keyboard state. Safe to call twice.
     */
    void stop();

private:
    static LRESULT CALLBACK LowLevelProc(int code, WPARAM w, LPARAM l);

    static KeyboardHook* s_instance;

    KeyboardState& m_state;
    HHOOK m_hook{nullptr};
};
