#include <windows.h>
#include <chrono>
#include <filesystem>
#include <stdexcept>
#include <spdlog/spdlog.h>
#include "Config.hpp"
#include "ForegroundMonitor.hpp"
#include "KeyboardHook.hpp"
#include "KeyboardState.hpp"
#include "Logging.hpp"
#include "Overlay.hpp"
#include "OverlayModel.hpp"
#include "SettingsStore.hpp"
#include "ShortcutStore.hpp"
#include "Win32Readers.hpp"

namespace {
struct HandleDeleter {
    void operator()(HANDLE h) const {
        if (h) {
            ReleaseMutex(h);
            CloseHandle(h);
        }
    }
};
using UniqueMutex = std::unique_ptr<std::remove_pointer_t<HANDLE>, HandleDeleter>;
} // namespace

int main() {
    spdlog::set_pattern(LOG_PATTERN);
    spdlog::set_level(spdlog::level::info);

    UniqueMutex instance_mutex(CreateMutexW(NULL, TRUE, L"ShortcutOverlaySingleInstance"));
    if (GetLastError() == ERROR_ALREADY_EXISTS) {
        spdlog::warn("Shortcut Overlay is already running.");
        return 0;
    }

    auto app_start = std::chrono::steady_clock::now();
    auto config_res = AppConfig::load("config.yaml");
    AppConfig config;
    if (config_res) {
        config = *config_res;
    } else if (!std::filesystem::exists("config.yaml")) {
        spdlog::warn("{}. Using built-in defaults.", config_res.error());
        config = AppConfig::defaults();
    } else {
        spdlog::error("Config Error: {}", config_res.error());
        return -1;
    }

    if (auto res = init_logging(config.logging.level, config.logging.file); !res) {
        spdlog::error("{}", res.error());
    }
    spdlog::info("Starting Shortcut Overlay...");
    spdlog::info("Config loaded in {:.1f} ms", std::chrono::duration<double, std::milli>(
        std::chrono::steady_clock::now() - app_start).count());
    spdlog::info("Config dir '{}', foreground poll {} ms, key check {} ms",
        config.paths.config_dir, config.monitor.foreground_poll_ms, config.keyboard.state_check_ms);

    const std::filesystem::path config_dir = config.paths.config_dir;
    ShortcutStore shortcuts(config_dir / "shortcuts.json");
    SettingsStore settings(config_dir / "settings.json");
    shortcuts.load_or_create();
    settings.load_or_create();

    try {
        OverlayModel model(shortcuts, settings);
        Overlay overlay(config, model, settings);

        AsyncKeyReader key_reader;
        KeyboardState keyboard(key_reader, std::chrono::milliseconds(config.keyboard.key_timeout_ms));
        keyboard.set_key_listener([&](const std::string& key, KeyAction action) {
            if (model.apply_key_event(key, action)) overlay.refresh();
        });
        keyboard.set_modifiers_listener([&](const ModifierSet& mods) {
            if (model.set_modifiers(mods)) overlay.refresh();
        });

        ForegroundProcessReader process_reader;
        ForegroundMonitor monitor(process_reader);
        monitor.set_listener([&](const std::string& app) {
            if (model.set_active_app(app)) overlay.refresh();
        });

        overlay.set_foreground_tick([&] { monitor.check(); });
        overlay.set_keyboard_tick([&] { keyboard.sweep_stuck_keys(KeyboardState::Clock::now()); });
        overlay.set_reload_handler([&] {
            shortcuts.load_or_create();
            settings.load_or_create();
            model.refresh_shortcuts();
            overlay.apply_settings();
            spdlog::info("Shortcuts and settings reloaded");
        });

        KeyboardHook hook(keyboard);
        // The hook resets the keyboard state, which repaints; do it before the window goes away
        overlay.set_shutdown_handler([&] { hook.stop(); });

        monitor.check();
        model.set_modifiers(keyboard.modifiers());
        overlay.refresh();
        spdlog::info("Overlay ready in {:.1f} ms", std::chrono::duration<double, std::milli>(
            std::chrono::steady_clock::now() - app_start).count());

        overlay.run();
    } catch (const std::exception& e) {
        spdlog::critical("Fatal: {}", e.what());
        return -1;
    }
    spdlog::info("Shortcut Overlay stopped");
    return 0;
}
