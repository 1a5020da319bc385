#include <gtest/gtest.h>

#include "KeyNames.hpp"

namespace {

TEST(KeyNames, NormalizesModifierVariants) {
    EXPECT_EQ(normalize_key_name("left ctrl"), "Ctrl");
    EXPECT_EQ(normalize_key_name("Right Shift"), "Shift");
    EXPECT_EQ(normalize_key_name("alt gr"), "Alt");
    EXPECT_EQ(normalize_key_name("left windows"), "Win");
    EXPECT_EQ(normalize_key_name("cmd"), "Win");
}

TEST(KeyNames, NormalizesNamedKeys) {
    EXPECT_EQ(normalize_key_name("escape"), "Esc");
    EXPECT_EQ(normalize_key_name("page up"), "PgUp");
    EXPECT_EQ(normalize_key_name("capslock"), "Caps Lock");
    EXPECT_EQ(normalize_key_name("return"), "Enter");
    EXPECT_EQ(normalize_key_name("semicolon"), ";");
    EXPECT_EQ(normalize_key_name("f4"), "F4");
    EXPECT_EQ(normalize_key_name("F24"), "F24");
    EXPECT_EQ(normalize_key_name("a"), "A");
    EXPECT_EQ(normalize_key_name("7"), "7");
}

TEST(KeyNames, EmptyNameIsRejected) {
    EXPECT_FALSE(normalize_key_name("").has_value());
}

TEST(KeyNames, CanonicalNamesAreStable) {
    for (uint32_t vk = 0; vk < 0x100; ++vk) {
        auto name = key_name_from_virtual_key(vk);
        if (!name) continue;
        EXPECT_EQ(normalize_key_name(*name), *name) << "vk " << vk;
    }
}

TEST(KeyNames, VirtualKeyRanges) {
    EXPECT_EQ(key_name_from_virtual_key(0x41), "A");
    EXPECT_EQ(key_name_from_virtual_key(0x5A), "Z");
    EXPECT_EQ(key_name_from_virtual_key(0x30), "0");
    EXPECT_EQ(key_name_from_virtual_key(0x70), "F1");
    EXPECT_EQ(key_name_from_virtual_key(0x87), "F24");
    EXPECT_EQ(key_name_from_virtual_key(0xA2), "Ctrl");
    EXPECT_EQ(key_name_from_virtual_key(0xA1), "Shift");
    EXPECT_EQ(key_name_from_virtual_key(0x5C), "Win");
    EXPECT_EQ(key_name_from_virtual_key(0x14), "Caps Lock");
    EXPECT_EQ(key_name_from_virtual_key(0xBA), ";");
    EXPECT_FALSE(key_name_from_virtual_key(0x07).has_value());
}

TEST(KeyNames, ModifiersMapToBothSides) {
    EXPECT_EQ(virtual_keys_for_key_name("Ctrl"), (std::vector<uint32_t>{0xA2, 0xA3}));
    EXPECT_EQ(virtual_keys_for_key_name("Shift"), (std::vector<uint32_t>{0xA0, 0xA1}));
    EXPECT_EQ(virtual_keys_for_key_name("F4"), (std::vector<uint32_t>{0x73}));
    EXPECT_TRUE(virtual_keys_for_key_name("NoSuchKey").empty());
}

TEST(KeyNames, ComboStringUsesFixedOrder) {
    ModifierSet mods{Modifier::Shift, Modifier::Ctrl};
    EXPECT_EQ(mods.combo_string(), "Ctrl+Shift");
    EXPECT_EQ((ModifierSet{Modifier::Win, Modifier::Alt, Modifier::Ctrl}).combo_string(), "Ctrl+Alt+Win");
    EXPECT_EQ(ModifierSet{}.combo_string(), "");
    EXPECT_EQ(mods.size(), 2u);
}

TEST(KeyNames, ParsesModifierCombosInAnyOrder) {
    auto mods = parse_modifier_combo("shift + CTRL");
    ASSERT_TRUE(mods.has_value()) << mods.error();
    EXPECT_EQ(*mods, (ModifierSet{Modifier::Ctrl, Modifier::Shift}));

    EXPECT_FALSE(parse_modifier_combo("Ctrl+S").has_value());
    EXPECT_FALSE(parse_modifier_combo("").has_value());
}

TEST(KeyNames, ParsesHotkeys) {
    auto hk = parse_hotkey("CTRL+ALT+K");
    ASSERT_TRUE(hk.has_value()) << hk.error();
    EXPECT_EQ(hk->modifiers, (ModifierSet{Modifier::Ctrl, Modifier::Alt}));
    EXPECT_EQ(hk->vk, 0x4Bu);

    auto f1 = parse_hotkey("Shift+F1");
    ASSERT_TRUE(f1.has_value());
    EXPECT_EQ(f1->vk, 0x70u);

    EXPECT_FALSE(parse_hotkey("Ctrl+Alt").has_value());
    EXPECT_FALSE(parse_hotkey("Ctrl+Bogus").has_value());
}

} // namespace
