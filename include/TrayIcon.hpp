#pragma once
#include <windows.h>
#include <shellapi.h>

/**
 * @class TrayIcon
 * @brief Notification-area icon owned by the overlay window.
 *
 * Clicks arrive at the owner as CALLBACK_MESSAGE; menu picks arrive as WM_COMMAND with
 * one of the Command ids.
 */
class TrayIcon {
public:
    static constexpr UINT CALLBACK_MESSAGE = WM_APP + 1;

    enum Command : UINT {
        CMD_TOGGLE = 40001,
        CMD_RELOAD = 40002,
        CMD_EXIT = 40003,
    };

    /**
     * @throws std::runtime_error if the icon cannot be added.
     */
    TrayIcon(HWND owner, HICON icon);
    ~TrayIcon();

    TrayIcon(const TrayIcon&) = delete;
    TrayIcon& operator=(const TrayIcon&) = delete;

    void remove();

    /**
     * @brief Handles CALLBACK_MESSAGE: double-click posts CMD_TOGGLE, right-click opens the menu.
     */
    void on_callback(LPARAM l, bool overlay_visible);

private:
    void show_menu(bool overlay_visible);

    NOTIFYICONDATAW m_nid{};
    bool m_added{false};
};
