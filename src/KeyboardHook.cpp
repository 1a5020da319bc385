#include "KeyboardHook.hpp"
#include <stdexcept>
#include <string>
#include <spdlog/spdlog.h>

KeyboardHook* KeyboardHook::s_instance = nullptr;

KeyboardHook::KeyboardHook(KeyboardState& state) : m_state(state) {
    if (s_instance) {
        throw std::runtime_error("A keyboard hook is already installed.");
    }
    s_instance = this;
    m_hook = SetWindowsHookExW(WH_KEYBOARD_LL, LowLevelProc, GetModuleHandleW(nullptr), 0);
    if (!m_hook) {
        s_instance = nullptr;
        throw std::runtime_error("Failed to install keyboard hook (error " + std::to_string(GetLastError()) +
                                 "). Try running with administrator rights.");
    }
    spdlog::info("Keyboard hook installed");
}

KeyboardHook::~KeyboardHook() {
    stop();
}

void KeyboardHook::stop() {
    if (!m_hook) {
        return;
    }
    if (!UnhookWindowsHookEx(m_hook)) {
        spdlog::warn("UnhookWindowsHookEx failed (error {})", GetLastError());
    }
    m_hook = nullptr;
    s_instance = nullptr;
    m_state.reset();
    spdlog::info("Keyboard hook removed");
}

LRESULT CALLBACK KeyboardHook::LowLevelProc(int code, WPARAM w, LPARAM l) {
    if (code == HC_ACTION && s_instance) {
        const auto* info = reinterpret_cast<const KBDLLHOOKSTRUCT*>(l);
        const bool down = (w == WM_KEYDOWN || w == WM_SYSKEYDOWN);
        const bool up = (w == WM_KEYUP || w == WM_SYSKEYUP);
        if (down || up) {
            if (auto name = key_name_from_virtual_key(info->vkCode)) {
                s_instance->m_state.handle(*name, down ? KeyAction::Down : KeyAction::Up, info->vkCode,
                                           KeyboardState::Clock::now());
            }
        }
    }
    return CallNextHookEx(nullptr, code, w, l);
}
