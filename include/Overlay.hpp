#pragma once
#include <windows.h>
#include <functional>
#include <memory>
#include <type_traits>
#include <string>
#include "Config.hpp"
#include "OverlayModel.hpp"
#include "SettingsStore.hpp"
#include "Theme.hpp"
#include "TrayIcon.hpp"

struct GDIObjectDeleter {
    void operator()(HGDIOBJ obj) const { if (obj) DeleteObject(obj); }
};
using UniqueGDIObject = std::unique_ptr<std::remove_pointer_t<HGDIOBJ>, GDIObjectDeleter>;

/**
 * @class Overlay
 * @brief Top-most keyboard window showing the focused application's shortcuts.
 *
 * Owns the toggle hotkey, the tray icon and the polling timers. Everything runs on the
 * thread that created it.
 */
class Overlay {
public:
    /**
     * @brief Creates the window at the saved geometry and registers the global hotkey.
     * @throws std::runtime_error if the window class or window cannot be created.
     */
    Overlay(const AppConfig& c, OverlayModel& model, SettingsStore& settings);

    /**
     * @brief Unregisters hotkeys and cleans up resources.
     */
    ~Overlay();

    Overlay(const Overlay&) = delete;
    Overlay& operator=(const Overlay&) = delete;

    /**
     * @brief Runs the Win32 message loop until the window is closed.
     */
    void run();

    /**
     * @brief Closes the window, which ends run().
     */
    void stop();

    /// Called every foreground_poll_ms.
    void set_foreground_tick(std::function<void()> f) { m_on_foreground_tick = std::move(f); }
    /// Called every state_check_ms.
    void set_keyboard_tick(std::function<void()> f) { m_on_keyboard_tick = std::move(f); }
    /// Called from the tray menu's Reload Shortcuts.
    void set_reload_handler(std::function<void()> f) { m_on_reload = std::move(f); }
    /// Called on WM_DESTROY while the window still exists.
    void set_shutdown_handler(std::function<void()> f) { m_on_shutdown = std::move(f); }

    /**
     * @brief Redraws the window after the model changed. Does nothing once the window
     * has been destroyed.
     */
    void refresh();

    /**
     * @brief Re-resolves the theme and window opacity from the settings.
     */
    void apply_settings();

    void toggle_visibility();
    bool is_visible() const;

private:
    static LRESULT CALLBACK WindowProc(HWND h, UINT m, WPARAM w, LPARAM l);
    void render();
    Color paint_key(HDC hdc, const KeyRect& key);
    void paint_grip(HDC hdc, int width, int height);
    LRESULT hit_test(LPARAM l) const;
    void save_geometry();
    void register_hotkey();

    OverlayModel& m_model;
    SettingsStore& m_settings;
    AppConfig m_cfg;
    ThemePalette m_palette;

    HWND m_hwnd{nullptr};
    HINSTANCE m_hInstance;
    UniqueGDIObject m_key_font;
    UniqueGDIObject m_shortcut_font;
    std::unique_ptr<TrayIcon> m_tray;

    std::function<void()> m_on_foreground_tick;
    std::function<void()> m_on_keyboard_tick;
    std::function<void()> m_on_reload;
    std::function<void()> m_on_shutdown;

    const int HOTKEY_ID = 101; // Unique ID for this app's hotkey
    static constexpr UINT_PTR FOREGROUND_TIMER_ID = 1;
    static constexpr UINT_PTR KEYBOARD_TIMER_ID = 2;
};
