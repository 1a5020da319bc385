#include "TrayIcon.hpp"
#include <stdexcept>
#include <cwchar>
#include <spdlog/spdlog.h>

TrayIcon::TrayIcon(HWND owner, HICON icon) {
    m_nid.cbSize = sizeof(NOTIFYICONDATAW);
    m_nid.hWnd = owner;
    m_nid.uID = 1;
    m_nid.uFlags = NIF_ICON | NIF_MESSAGE | NIF_TIP;
    m_nid.uCallbackMessage = CALLBACK_MESSAGE;
    m_nid.hIcon = icon;
    wcsncpy_s(m_nid.szTip, L"Shortcut Overlay", _TRUNCATE);

    if (!Shell_NotifyIconW(NIM_ADD, &m_nid)) {
        throw std::runtime_error("Failed to add the notification-area icon.");
    }
    m_added = true;
}

TrayIcon::~TrayIcon() {
    remove();
}

void TrayIcon::remove() {
    if (m_added) {
        Shell_NotifyIconW(NIM_DELETE, &m_nid);
        m_added = false;
    }
}

void TrayIcon::on_callback(LPARAM l, bool overlay_visible) {
    switch (LOWORD(l)) {
        case WM_LBUTTONDBLCLK:
            PostMessageW(m_nid.hWnd, WM_COMMAND, CMD_TOGGLE, 0);
            break;
        case WM_RBUTTONUP:
        case WM_CONTEXTMENU:
            show_menu(overlay_visible);
            break;
    }
}

void TrayIcon::show_menu(bool overlay_visible) {
    POINT pt;
    GetCursorPos(&pt);

    HMENU menu = CreatePopupMenu();
    if (!menu) {
        spdlog::warn("CreatePopupMenu failed (error {})", GetLastError());
        return;
    }
    AppendMenuW(menu, MF_STRING, CMD_TOGGLE, overlay_visible ? L"Hide Overlay" : L"Show Overlay");
    AppendMenuW(menu, MF_STRING, CMD_RELOAD, L"Reload Shortcuts");
    AppendMenuW(menu, MF_SEPARATOR, 0, nullptr);
    AppendMenuW(menu, MF_STRING, CMD_EXIT, L"Exit");

    // Required for the menu to close when clicking elsewhere
    SetForegroundWindow(m_nid.hWnd);
    TrackPopupMenu(menu, TPM_RIGHTBUTTON, pt.x, pt.y, 0, m_nid.hWnd, nullptr);
    DestroyMenu(menu);
}
