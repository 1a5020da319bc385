#include <gtest/gtest.h>

#include "Config.hpp"
#include "TempDir.hpp"

namespace {

TEST(AppConfig, MissingFileIsAnError) {
    TempDir dir;
    auto res = AppConfig::load((dir.path() / "config.yaml").string());
    ASSERT_FALSE(res.has_value());
    EXPECT_NE(res.error().find("Config missing"), std::string::npos);
}

TEST(AppConfig, EmptyFileGivesDefaults) {
    TempDir dir;
    auto res = AppConfig::load(dir.write("config.yaml", "").string());
    ASSERT_TRUE(res.has_value()) << res.error();
    const AppConfig d = AppConfig::defaults();
    EXPECT_EQ(res->paths.config_dir, d.paths.config_dir);
    EXPECT_EQ(res->monitor.foreground_poll_ms, 1000);
    EXPECT_EQ(res->keyboard.key_timeout_ms, 250);
    EXPECT_EQ(res->keyboard.state_check_ms, 50);
    EXPECT_EQ(res->overlay.hotkey_toggle, "CTRL+ALT+K");
    EXPECT_EQ(res->overlay.font_name, "Segoe UI");
    EXPECT_EQ(res->logging.level, "info");
    EXPECT_EQ(res->logging.file, "");
}

TEST(AppConfig, ReadsAndClampsValues) {
    TempDir dir;
    auto file = dir.write("config.yaml",
                          "paths:\n"
                          "  config_dir: \"data\"\n"
                          "monitor:\n"
                          "  foreground_poll_ms: 5\n"
                          "keyboard:\n"
                          "  key_timeout_ms: 400\n"
                          "  state_check_ms: 5000\n"
                          "overlay:\n"
                          "  hotkey_toggle: \"ctrl+shift+o\"\n"
                          "  key_font_size: 16\n"
                          "logging:\n"
                          "  level: debug\n"
                          "  file: overlay.log\n");
    auto res = AppConfig::load(file.string());
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->paths.config_dir, "data");
    EXPECT_EQ(res->monitor.foreground_poll_ms, 100);
    EXPECT_EQ(res->keyboard.key_timeout_ms, 400);
    EXPECT_EQ(res->keyboard.state_check_ms, 1000);
    EXPECT_EQ(res->overlay.hotkey_toggle, "CTRL+SHIFT+O");
    EXPECT_EQ(res->overlay.key_font_size, 16);
    EXPECT_EQ(res->overlay.shortcut_font_size, 11);
    EXPECT_EQ(res->logging.level, "debug");
    EXPECT_EQ(res->logging.file, "overlay.log");
}

TEST(AppConfig, MalformedFileIsAnError) {
    TempDir dir;
    EXPECT_FALSE(AppConfig::load(dir.write("config.yaml", "monitor: [unclosed").string()).has_value());
}

TEST(AppConfig, UnconvertibleValueKeepsDefault) {
    TempDir dir;
    auto res = AppConfig::load(dir.write("config.yaml", "monitor:\n  foreground_poll_ms: often\n").string());
    ASSERT_TRUE(res.has_value()) << res.error();
    EXPECT_EQ(res->monitor.foreground_poll_ms, 1000);
}

} // namespace
