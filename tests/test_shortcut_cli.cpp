#include <gtest/gtest.h>

#include <sstream>

#include "JsonFile.hpp"
#include "ShortcutCli.hpp"
#include "ShortcutStore.hpp"
#include "TempDir.hpp"

namespace {

class ShortcutCliTest : public ::testing::Test {
protected:
    int run(std::vector<std::string> args) {
        out.str("");
        err.str("");
        args.insert(args.begin(), {"--config-dir", dir.path().string()});
        return run_shortcut_cli(args, out, err);
    }

    ShortcutTable stored_table() {
        auto root = read_json_file(dir.path() / "shortcuts.json");
        EXPECT_TRUE(root.has_value());
        auto table = ShortcutStore::parse(*root);
        EXPECT_TRUE(table.has_value());
        return *table;
    }

    TempDir dir;
    std::ostringstream out;
    std::ostringstream err;
};

TEST_F(ShortcutCliTest, ListAppsCreatesDefaults) {
    EXPECT_EQ(run({"list-apps"}), 0);
    EXPECT_EQ(out.str(), "DEFAULT\nNOTEPAD.EXE\n");
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "shortcuts.json"));
    EXPECT_TRUE(std::filesystem::exists(dir.path() / "settings.json"));
}

TEST_F(ShortcutCliTest, ShowPrintsGroups) {
    EXPECT_EQ(run({"show", "notepad.exe", "Ctrl"}), 0);
    EXPECT_NE(out.str().find("Ctrl:\n"), std::string::npos);
    EXPECT_NE(out.str().find("  S: en=Save File; zh="), std::string::npos);

    EXPECT_EQ(run({"show", "nothing.exe"}), 1);
    EXPECT_NE(err.str().find("No application"), std::string::npos);
}

TEST_F(ShortcutCliTest, ResolveUsesLanguageAndDefaultFallback) {
    EXPECT_EQ(run({"resolve", "calc.exe", "Alt", "en_US"}), 0);
    EXPECT_EQ(out.str(), "F4: Close Window\n");

    EXPECT_EQ(run({"resolve", "calc.exe", "Alt+Nope"}), 2);
}

TEST_F(ShortcutCliTest, EditingCommandsPersist) {
    EXPECT_EQ(run({"add-app", "code.exe"}), 0);
    EXPECT_EQ(run({"add-group", "CODE.EXE", "Ctrl+Shift"}), 0);
    EXPECT_EQ(run({"add", "CODE.EXE", "Ctrl+Shift", "p", "Command Palette", "\xE5\x91\xBD\xE4\xBB\xA4"}), 0);

    auto table = stored_table();
    const auto& desc = table.at("CODE.EXE").at("Ctrl+Shift").at("P");
    EXPECT_EQ(desc.translations.at("en"), "Command Palette");
    EXPECT_EQ(desc.translations.at("zh"), "\xE5\x91\xBD\xE4\xBB\xA4");

    EXPECT_EQ(run({"edit", "CODE.EXE", "Ctrl+Shift", "P", "F", "Find"}), 0);
    EXPECT_EQ(run({"rename-group", "CODE.EXE", "Ctrl+Shift", "Ctrl+Alt"}), 0);
    table = stored_table();
    EXPECT_EQ(table.at("CODE.EXE").at("Ctrl+Alt").at("F").resolve("zh_CN"), "Find");

    EXPECT_EQ(run({"remove", "CODE.EXE", "Ctrl+Alt", "F"}), 0);
    EXPECT_EQ(run({"remove-group", "CODE.EXE", "Ctrl+Alt"}), 0);
    EXPECT_EQ(run({"remove-app", "CODE.EXE"}), 0);
    EXPECT_FALSE(stored_table().contains("CODE.EXE"));
}

TEST_F(ShortcutCliTest, RefusedOperationsReturnOne) {
    EXPECT_EQ(run({"add-app", "notepad.exe"}), 1);
    EXPECT_NE(err.str().find("Application already exists."), std::string::npos);
    EXPECT_EQ(run({"remove", "NOTEPAD.EXE", "Ctrl", "Q"}), 1);
}

TEST_F(ShortcutCliTest, KeyAndGroupArgumentsAreNormalized) {
    EXPECT_EQ(run({"add", "notepad.exe", "Ctrl", "esc", "Quit"}), 0);
    EXPECT_TRUE(stored_table().at("NOTEPAD.EXE").at("Ctrl").contains("Esc"));
    EXPECT_EQ(run({"edit", "notepad.exe", "Ctrl", "esc", "esc", "Exit"}), 0);
    EXPECT_EQ(run({"remove", "notepad.exe", "Ctrl", "esc"}), 0) << err.str();
    EXPECT_FALSE(stored_table().at("NOTEPAD.EXE").at("Ctrl").contains("Esc"));

    EXPECT_EQ(run({"add", "notepad.exe", "ctrl", "K", "Kill"}), 0) << err.str();
    EXPECT_EQ(run({"show", "notepad.exe", "ctrl"}), 0);
    EXPECT_NE(out.str().find("  K: en=Kill"), std::string::npos);
}

TEST_F(ShortcutCliTest, EditingKeepsEntriesItCannotShow) {
    dir.write("shortcuts.json",
              R"({"NOTEPAD.EXE":{"Ctrl":{"S":"Save","Q":["Quit","Exit"]}},"_comment":"team file v2"})");
    EXPECT_EQ(run({"add-app", "CODE.EXE"}), 0);

    const std::string saved = dir.read("shortcuts.json");
    EXPECT_NE(saved.find("_comment"), std::string::npos) << saved;
    EXPECT_NE(saved.find("team file v2"), std::string::npos) << saved;
    EXPECT_NE(saved.find("Quit"), std::string::npos) << saved;
    EXPECT_TRUE(stored_table().contains("CODE.EXE"));
}

TEST_F(ShortcutCliTest, ImportMergesFile) {
    auto file = dir.write("extra.json", R"({"paint.exe": {"Ctrl": {"Z": "Undo"}}})");
    EXPECT_EQ(run({"import", file.string()}), 0);
    EXPECT_EQ(stored_table().at("PAINT.EXE").at("Ctrl").at("Z"), ShortcutDescription::text("Undo"));

    EXPECT_EQ(run({"import", (dir.path() / "missing.json").string()}), 1);
}

TEST_F(ShortcutCliTest, GetAndSetSettings) {
    EXPECT_EQ(run({"get", "theme_name"}), 0);
    EXPECT_EQ(out.str(), "Default Dark\n");

    EXPECT_EQ(run({"set", "opacity", "50"}), 0);
    EXPECT_EQ(run({"get", "opacity"}), 0);
    EXPECT_EQ(out.str(), "50\n");

    EXPECT_EQ(run({"set", "opacity", "5"}), 1);
    EXPECT_EQ(run({"get", "unknown_key"}), 1);
}

TEST_F(ShortcutCliTest, UsageErrors) {
    EXPECT_EQ(run({}), 2);
    EXPECT_EQ(run({"frobnicate"}), 2);
    EXPECT_EQ(run({"add-app"}), 2);
    EXPECT_EQ(run({"show", "a", "b", "c"}), 2);
    EXPECT_EQ(run_shortcut_cli({"--config-dir"}, out, err), 2);

    EXPECT_EQ(run({"help"}), 0);
    EXPECT_NE(out.str().find("Usage: shortcutctl"), std::string::npos);
}

} // namespace
