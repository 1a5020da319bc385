/**
 * @file Overlay.cpp
 * @brief Implementation of the layered Win32 keyboard overlay with global hotkey support.
 */

#include "Overlay.hpp"
#include "KeyNames.hpp"
#include "Win32Readers.hpp"
#include <windowsx.h>
#include <stdexcept>
#include <algorithm>
#include <vector>
#include <spdlog/spdlog.h>

namespace {

struct DCDeleter {
    void operator()(HDC dc) const { if (dc) DeleteDC(dc); }
};
using UniqueDC = std::unique_ptr<std::remove_pointer_t<HDC>, DCDeleter>;

COLORREF to_colorref(const Color& c) {
    return RGB(c.r, c.g, c.b);
}

constexpr int KEY_CORNER_RADIUS = 3;

bool inside_rounded(const KeyRect& k, int x, int y) {
    const int r = KEY_CORNER_RADIUS;
    const int cx = std::clamp(x, k.x + r, k.x + k.width - 1 - r);
    const int cy = std::clamp(y, k.y + r, k.y + k.height - 1 - r);
    return (x - cx) * (x - cx) + (y - cy) * (y - cy) <= r * r;
}

UniqueGDIObject make_font(const std::string& name, int point_size, int weight) {
    HDC screen = GetDC(nullptr);
    const int height = -MulDiv(point_size, GetDeviceCaps(screen, LOGPIXELSY), 72);
    ReleaseDC(nullptr, screen);
    return UniqueGDIObject(CreateFontW(
        height, 0, 0, 0, weight, FALSE, FALSE, FALSE,
        DEFAULT_CHARSET, OUT_OUTLINE_PRECIS, CLIP_DEFAULT_PRECIS,
        CLEARTYPE_QUALITY, VARIABLE_PITCH,
        to_wide(name).c_str()
    ));
}

UINT to_win32_modifiers(const ModifierSet& mods) {
    UINT out = MOD_NOREPEAT; // Standard behavior: don't auto-repeat toggle
    if (mods.contains(Modifier::Ctrl)) out |= MOD_CONTROL;
    if (mods.contains(Modifier::Alt)) out |= MOD_ALT;
    if (mods.contains(Modifier::Shift)) out |= MOD_SHIFT;
    if (mods.contains(Modifier::Win)) out |= MOD_WIN;
    return out;
}

} // namespace

/**
 * @brief Constructor for the keyboard overlay.
 * Initializes the Win32 window, the tray icon and registers a global system hotkey.
 */
Overlay::Overlay(const AppConfig& c, OverlayModel& model, SettingsStore& settings)
    : m_model(model), m_settings(settings), m_cfg(c), m_hInstance(GetModuleHandleW(nullptr)) {
    const wchar_t* CLASS_NAME = L"ShortcutOverlayClass";

    WNDCLASSW wc = {};
    wc.lpfnWndProc = WindowProc;
    wc.hInstance = m_hInstance;
    wc.lpszClassName = CLASS_NAME;
    wc.hCursor = LoadCursorW(nullptr, IDC_ARROW);
    wc.hIcon = LoadIconW(nullptr, IDI_APPLICATION);

    if (!RegisterClassW(&wc)) {
        throw std::runtime_error("Failed to register Win32 window class.");
    }

    const AppSettings& s = m_settings.settings();
    const int width = std::max(s.window_width, MIN_WINDOW_WIDTH);
    const int height = std::max(s.window_height, MIN_WINDOW_HEIGHT);
    int x = 0;
    int y = 0;
    if (s.window_x && s.window_y) {
        x = *s.window_x;
        y = *s.window_y;
    } else {
        // First run: bottom centre of the primary work area
        RECT work{};
        SystemParametersInfoW(SPI_GETWORKAREA, 0, &work, 0);
        x = work.left + (work.right - work.left - width) / 2;
        y = work.bottom - height - 40;
    }

    // Topmost, frameless, no taskbar button, never takes focus from the app being watched
    m_hwnd = CreateWindowExW(
        WS_EX_TOPMOST | WS_EX_LAYERED | WS_EX_NOACTIVATE | WS_EX_TOOLWINDOW,
        CLASS_NAME, L"Shortcut Overlay",
        WS_POPUP,
        x, y, width, height,
        NULL, NULL, m_hInstance, this
    );

    if (!m_hwnd) {
        throw std::runtime_error("Failed to create overlay window.");
    }

    m_key_font = make_font(m_cfg.overlay.font_name, m_cfg.overlay.key_font_size, FW_BOLD);
    m_shortcut_font = make_font(m_cfg.overlay.font_name, m_cfg.overlay.shortcut_font_size, FW_NORMAL);
    apply_settings();
    register_hotkey();

    try {
        m_tray = std::make_unique<TrayIcon>(m_hwnd, wc.hIcon);
    } catch (const std::runtime_error& e) {
        spdlog::warn("{} The overlay can still be toggled with {}.", e.what(), m_cfg.overlay.hotkey_toggle);
    }

    SetTimer(m_hwnd, FOREGROUND_TIMER_ID, static_cast<UINT>(m_cfg.monitor.foreground_poll_ms), nullptr);
    SetTimer(m_hwnd, KEYBOARD_TIMER_ID, static_cast<UINT>(m_cfg.keyboard.state_check_ms), nullptr);

    ShowWindow(m_hwnd, SW_SHOWNOACTIVATE);
}

/**
 * @brief Destructor. Unregisters the system hotkey.
 */
Overlay::~Overlay() {
    if (m_hwnd && IsWindow(m_hwnd)) {
        UnregisterHotKey(m_hwnd, HOTKEY_ID);
        DestroyWindow(m_hwnd);
    }
    UnregisterClassW(L"ShortcutOverlayClass", m_hInstance);
}

void Overlay::register_hotkey() {
    auto hotkey = parse_hotkey(m_cfg.overlay.hotkey_toggle);
    if (!hotkey) {
        spdlog::error("Hotkey Error: {}", hotkey.error());
        return;
    }
    if (!RegisterHotKey(m_hwnd, HOTKEY_ID, to_win32_modifiers(hotkey->modifiers), hotkey->vk)) {
        spdlog::error("Hotkey Error: '{}' is already in use.", m_cfg.overlay.hotkey_toggle);
        return;
    }
    spdlog::info("Toggle hotkey: {}", m_cfg.overlay.hotkey_toggle);
}

void Overlay::stop() {
    if (m_hwnd) PostMessageW(m_hwnd, WM_CLOSE, 0, 0);
}

void Overlay::run() {
    MSG msg = {};
    while (GetMessageW(&msg, NULL, 0, 0) > 0) {
        TranslateMessage(&msg);
        DispatchMessageW(&msg);
    }
}

void Overlay::refresh() {
    if (m_hwnd) render();
}

void Overlay::apply_settings() {
    m_palette = resolve_theme(m_settings.settings());
    refresh();
}

bool Overlay::is_visible() const {
    return m_hwnd && IsWindowVisible(m_hwnd);
}

void Overlay::toggle_visibility() {
    if (!m_hwnd) {
        return;
    }
    const bool show = !is_visible();
    ShowWindow(m_hwnd, show ? SW_SHOWNOACTIVATE : SW_HIDE);
    spdlog::info("Overlay {}", show ? "shown" : "hidden");
}

void Overlay::save_geometry() {
    RECT r;
    if (!m_hwnd || !GetWindowRect(m_hwnd, &r)) {
        return;
    }
    AppSettings s = m_settings.settings();
    s.window_x = r.left;
    s.window_y = r.top;
    s.window_width = r.right - r.left;
    s.window_height = r.bottom - r.top;
    if (s == m_settings.settings()) {
        return;
    }
    // The store logs failures itself
    if (m_settings.update(std::move(s))) {
        spdlog::debug("Saved window geometry {}x{} at ({}, {})", r.right - r.left, r.bottom - r.top, r.left, r.top);
    }
}

LRESULT Overlay::hit_test(LPARAM l) const {
    POINT pt{GET_X_LPARAM(l), GET_Y_LPARAM(l)};
    ScreenToClient(m_hwnd, &pt);
    RECT rect;
    GetClientRect(m_hwnd, &rect);
    if (KeyboardLayout::resize_grip_contains(pt.x, pt.y, rect.right, rect.bottom)) {
        return HTBOTTOMRIGHT;
    }
    // Dragging anywhere else moves the window
    return HTCAPTION;
}

/**
 * @brief Draws the keyboard into a 32-bit DIB and hands it to UpdateLayeredWindow.
 *
 * GDI leaves the alpha channel undefined, so alpha is rebuilt per pixel from the theme:
 * the window background keeps its own alpha, key caps the alpha of their fill. The
 * opacity setting is applied on top as the constant alpha of the blend.
 */
void Overlay::render() {
    RECT win;
    if (!GetWindowRect(m_hwnd, &win)) {
        return;
    }
    const int w = win.right - win.left;
    const int h = win.bottom - win.top;
    if (w <= 0 || h <= 0) {
        return;
    }

    HDC screen = GetDC(nullptr);
    UniqueDC mem(CreateCompatibleDC(screen));
    BITMAPINFO bmi{};
    bmi.bmiHeader.biSize = sizeof(BITMAPINFOHEADER);
    bmi.bmiHeader.biWidth = w;
    bmi.bmiHeader.biHeight = -h; // top-down rows
    bmi.bmiHeader.biPlanes = 1;
    bmi.bmiHeader.biBitCount = 32;
    bmi.bmiHeader.biCompression = BI_RGB;
    void* bits = nullptr;
    UniqueGDIObject bitmap(CreateDIBSection(screen, &bmi, DIB_RGB_COLORS, &bits, nullptr, 0));
    if (!mem || !bitmap || !bits) {
        ReleaseDC(nullptr, screen);
        spdlog::warn("Overlay: could not allocate a {}x{} drawing surface", w, h);
        return;
    }
    HGDIOBJ old_bitmap = SelectObject(mem.get(), bitmap.get());

    RECT rect{0, 0, w, h};
    UniqueGDIObject background(CreateSolidBrush(to_colorref(m_palette.background)));
    FillRect(mem.get(), &rect, static_cast<HBRUSH>(background.get()));
    SetBkMode(mem.get(), TRANSPARENT);

    std::vector<uint8_t> alpha(static_cast<size_t>(w) * h, m_palette.background.a);
    for (const auto& key : m_model.layout().compute_key_rects(w, h)) {
        const uint8_t key_alpha = paint_key(mem.get(), key).a;
        for (int y = std::max(key.y, 0); y < std::min(key.y + key.height, h); ++y) {
            for (int x = std::max(key.x, 0); x < std::min(key.x + key.width, w); ++x) {
                if (inside_rounded(key, x, y)) alpha[static_cast<size_t>(y) * w + x] = key_alpha;
            }
        }
    }
    paint_grip(mem.get(), w, h);
    GdiFlush();

    // DIB pixels are BGRA
    auto* px = static_cast<uint8_t*>(bits);
    for (size_t i = 0; i < alpha.size(); ++i, px += 4) {
        const Color c = Color{px[2], px[1], px[0], alpha[i]}.premultiplied();
        px[0] = c.b;
        px[1] = c.g;
        px[2] = c.r;
        px[3] = c.a;
    }

    POINT src{0, 0};
    SIZE size{w, h};
    BLENDFUNCTION blend{AC_SRC_OVER, 0, m_palette.window_alpha, AC_SRC_ALPHA};
    if (!UpdateLayeredWindow(m_hwnd, screen, nullptr, &size, mem.get(), &src, 0, &blend, ULW_ALPHA)) {
        spdlog::debug("UpdateLayeredWindow failed (error {})", GetLastError());
    }
    SelectObject(mem.get(), old_bitmap);
    ReleaseDC(nullptr, screen);
}

/// Draws one key cap and returns its fill colour.
Color Overlay::paint_key(HDC hdc, const KeyRect& key) {
    Color fill = composite_over(m_palette.key_background, m_palette.background);
    Color border = m_palette.key_border;
    switch (m_model.visual_for(key.match_name)) {
        case KeyVisual::Pressed:
            fill = m_palette.pressed_background;
            border = m_palette.pressed_border;
            break;
        case KeyVisual::ModifierActive:
            fill = m_palette.modifier_background;
            border = m_palette.modifier_border;
            break;
        case KeyVisual::Normal:
            break;
    }

    UniqueGDIObject brush(CreateSolidBrush(to_colorref(fill)));
    UniqueGDIObject pen(CreatePen(PS_SOLID, 1, to_colorref(border)));
    HGDIOBJ old_brush = SelectObject(hdc, brush.get());
    HGDIOBJ old_pen = SelectObject(hdc, pen.get());
    RoundRect(hdc, key.x, key.y, key.x + key.width, key.y + key.height, KEY_CORNER_RADIUS * 2, KEY_CORNER_RADIUS * 2);
    SelectObject(hdc, old_pen);
    SelectObject(hdc, old_brush);

    const int pad = 2;
    const std::string shortcut = m_model.shortcut_for(key.match_name);
    // Label takes the whole key when there is no shortcut text
    const int label_bottom = shortcut.empty() ? key.y + key.height : key.y + key.height * 2 / 5;

    HGDIOBJ old_font = SelectObject(hdc, m_key_font.get());
    SetTextColor(hdc, to_colorref(m_palette.key_text));
    RECT label_rect{key.x + pad, key.y + pad, key.x + key.width - pad, label_bottom};
    std::wstring label = to_wide(key.label);
    DrawTextW(hdc, label.c_str(), static_cast<int>(label.size()), &label_rect,
              DT_CENTER | DT_VCENTER | DT_SINGLELINE | DT_END_ELLIPSIS | DT_NOPREFIX);

    if (!shortcut.empty()) {
        SelectObject(hdc, m_shortcut_font.get());
        SetTextColor(hdc, to_colorref(m_palette.shortcut_text));
        RECT text_rect{key.x + pad, label_bottom, key.x + key.width - pad, key.y + key.height - pad};
        std::wstring text = to_wide(shortcut);
        DrawTextW(hdc, text.c_str(), static_cast<int>(text.size()), &text_rect,
                  DT_CENTER | DT_WORDBREAK | DT_END_ELLIPSIS | DT_NOPREFIX | DT_EDITCONTROL);
    }
    SelectObject(hdc, old_font);
    return fill;
}

void Overlay::paint_grip(HDC hdc, int width, int height) {
    UniqueGDIObject pen(CreatePen(PS_SOLID, 1, to_colorref(m_palette.key_border)));
    HGDIOBJ old_pen = SelectObject(hdc, pen.get());
    const int g = KeyboardLayout::GRIP_SIZE;
    for (int offset = 4; offset < g; offset += 4) {
        MoveToEx(hdc, width - offset, height - 1, nullptr);
        LineTo(hdc, width - 1, height - offset);
    }
    SelectObject(hdc, old_pen);
}

/**
 * @brief Static Win32 Procedure. Routes messages to the class instance.
 */
LRESULT CALLBACK Overlay::WindowProc(HWND h, UINT m, WPARAM w, LPARAM l) {
    Overlay* pOverlay = nullptr;
    if (m == WM_NCCREATE) {
        CREATESTRUCTW* pCreate = reinterpret_cast<CREATESTRUCTW*>(l);
        pOverlay = reinterpret_cast<Overlay*>(pCreate->lpCreateParams);
        SetWindowLongPtrW(h, GWLP_USERDATA, reinterpret_cast<LONG_PTR>(pOverlay));
    } else {
        pOverlay = reinterpret_cast<Overlay*>(GetWindowLongPtrW(h, GWLP_USERDATA));
    }

    if (pOverlay) {
        switch (m) {
            case WM_HOTKEY:
                if (static_cast<int>(w) == pOverlay->HOTKEY_ID) {
                    pOverlay->toggle_visibility();
                }
                return 0;

            case WM_TIMER:
                if (w == FOREGROUND_TIMER_ID && pOverlay->m_on_foreground_tick) {
                    pOverlay->m_on_foreground_tick();
                } else if (w == KEYBOARD_TIMER_ID && pOverlay->m_on_keyboard_tick) {
                    pOverlay->m_on_keyboard_tick();
                }
                return 0;

            case WM_NCHITTEST:
                return pOverlay->hit_test(l);

            case WM_GETMINMAXINFO: {
                auto* info = reinterpret_cast<MINMAXINFO*>(l);
                info->ptMinTrackSize.x = MIN_WINDOW_WIDTH;
                info->ptMinTrackSize.y = MIN_WINDOW_HEIGHT;
                return 0;
            }

            case WM_SIZE:
                pOverlay->refresh();
                return 0;

            case WM_EXITSIZEMOVE:
                pOverlay->save_geometry();
                return 0;

            case WM_ERASEBKGND:
                return 1;

            case WM_PAINT: {
                // Contents go through UpdateLayeredWindow
                PAINTSTRUCT ps;
                BeginPaint(h, &ps);
                EndPaint(h, &ps);
                return 0;
            }

            case TrayIcon::CALLBACK_MESSAGE:
                if (pOverlay->m_tray) {
                    pOverlay->m_tray->on_callback(l, pOverlay->is_visible());
                }
                return 0;

            case WM_COMMAND:
                switch (LOWORD(w)) {
                    case TrayIcon::CMD_TOGGLE:
                        pOverlay->toggle_visibility();
                        break;
                    case TrayIcon::CMD_RELOAD:
                        if (pOverlay->m_on_reload) pOverlay->m_on_reload();
                        break;
                    case TrayIcon::CMD_EXIT:
                        DestroyWindow(h);
                        break;
                }
                return 0;

            case WM_CLOSE:
                DestroyWindow(h);
                return 0;

            case WM_DESTROY: {
                if (pOverlay->m_on_shutdown) pOverlay->m_on_shutdown();
                KillTimer(h, FOREGROUND_TIMER_ID);
                KillTimer(h, KEYBOARD_TIMER_ID);
                UnregisterHotKey(h, pOverlay->HOTKEY_ID);
                if (pOverlay->m_tray) pOverlay->m_tray->remove();
                SetWindowLongPtrW(h, GWLP_USERDATA, 0);
                pOverlay->m_hwnd = nullptr;
                PostQuitMessage(0);
                return 0;
            }
        }
    }
    return DefWindowProcW(h, m, w, l);
}
