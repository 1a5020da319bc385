#include <gtest/gtest.h>

#include "OverlayModel.hpp"
#include "TempDir.hpp"

namespace {

class OverlayModelTest : public ::testing::Test {
protected:
    OverlayModelTest()
        : shortcuts(dir.path() / "shortcuts.json"), settings(dir.path() / "settings.json") {
        shortcuts.load_or_create();
        settings.load_or_create();
    }

    TempDir dir;
    ShortcutStore shortcuts;
    SettingsStore settings;
};

TEST_F(OverlayModelTest, StartsOnDefaultWithoutShortcutText) {
    OverlayModel model(shortcuts, settings);
    EXPECT_EQ(model.active_app(), "DEFAULT");
    EXPECT_EQ(model.modifier_combo(), "");
    EXPECT_EQ(model.shortcut_for("C"), "");
}

TEST_F(OverlayModelTest, ShowsAppShortcutsForActiveModifiers) {
    OverlayModel model(shortcuts, settings);
    EXPECT_TRUE(model.set_active_app("notepad.exe"));
    EXPECT_EQ(model.active_app(), "NOTEPAD.EXE");
    EXPECT_FALSE(model.set_active_app("NOTEPAD.EXE"));

    EXPECT_TRUE(model.set_modifiers(ModifierSet{Modifier::Ctrl}));
    EXPECT_EQ(model.modifier_combo(), "Ctrl");
    EXPECT_EQ(model.shortcut_for("S"), "Save File");
    EXPECT_EQ(model.shortcut_for("C"), "");
    EXPECT_FALSE(model.set_modifiers(ModifierSet{Modifier::Ctrl}));
}

TEST_F(OverlayModelTest, UnknownAppUsesDefaultShortcuts) {
    OverlayModel model(shortcuts, settings);
    model.set_active_app("calc.exe");
    model.set_modifiers(ModifierSet{Modifier::Alt});
    EXPECT_EQ(model.shortcut_for("F4"), "Close Window");

    model.set_modifiers(ModifierSet{Modifier::Alt, Modifier::Shift});
    EXPECT_EQ(model.shortcut_for("F4"), "");
}

TEST_F(OverlayModelTest, LanguageChangeNeedsRefresh) {
    OverlayModel model(shortcuts, settings);
    model.set_modifiers(ModifierSet{Modifier::Ctrl});
    EXPECT_EQ(model.shortcut_for("C"), "Copy (Global)");

    ASSERT_TRUE(settings.set_value("language", "zh_CN"));
    model.refresh_shortcuts();
    EXPECT_EQ(model.shortcut_for("C"), "\xE5\xA4\x8D\xE5\x88\xB6 (\xE5\x85\xA8\xE5\xB1\x80)");
}

TEST_F(OverlayModelTest, ShortcutKeysMatchLayoutCaseInsensitively) {
    ASSERT_TRUE(shortcuts.add_modifier_group("DEFAULT", "Ctrl+Shift"));
    ASSERT_TRUE(shortcuts.add_shortcut("DEFAULT", "Ctrl+Shift", "esc", ShortcutDescription::text("Task Manager")));
    OverlayModel model(shortcuts, settings);
    model.set_modifiers(ModifierSet{Modifier::Shift, Modifier::Ctrl});
    EXPECT_EQ(model.shortcut_for("ESC"), "Task Manager");
}

TEST_F(OverlayModelTest, KeyVisualStates) {
    OverlayModel model(shortcuts, settings);
    EXPECT_TRUE(model.apply_key_event("a", KeyAction::Down));
    EXPECT_FALSE(model.apply_key_event("A", KeyAction::Down));
    EXPECT_EQ(model.visual_for("A"), KeyVisual::Pressed);
    EXPECT_EQ(model.visual_for("B"), KeyVisual::Normal);

    model.apply_key_event("Ctrl", KeyAction::Down);
    model.set_modifiers(ModifierSet{Modifier::Ctrl});
    EXPECT_EQ(model.visual_for("CTRL"), KeyVisual::ModifierActive);

    // Logically released modifier still physically down shows as pressed
    model.set_modifiers(ModifierSet{});
    EXPECT_EQ(model.visual_for("CTRL"), KeyVisual::Pressed);

    EXPECT_TRUE(model.apply_key_event("A", KeyAction::Up));
    EXPECT_EQ(model.visual_for("A"), KeyVisual::Normal);
    EXPECT_FALSE(model.apply_key_event("", KeyAction::Down));
}

TEST_F(OverlayModelTest, EmptyAppNameMeansDefault) {
    OverlayModel model(shortcuts, settings);
    model.set_active_app("notepad.exe");
    EXPECT_TRUE(model.set_active_app(""));
    EXPECT_EQ(model.active_app(), "DEFAULT");
}

} // namespace
