#include <gtest/gtest.h>

#include <algorithm>

#include "KeyboardLayout.hpp"

namespace {

TEST(KeyboardLayout, StandardLayoutShape) {
    const auto layout = KeyboardLayout::standard();
    const auto& rows = layout.rows();
    ASSERT_EQ(rows.size(), 6u);
    EXPECT_EQ(rows[0].size(), 13u);
    EXPECT_EQ(rows[1].back().label, "Backspace");
    EXPECT_DOUBLE_EQ(rows[1].back().stretch, 2.0);
    EXPECT_EQ(rows[2].front().label, "Tab");
    EXPECT_EQ(rows[3].back().label, "Enter");
    EXPECT_DOUBLE_EQ(rows[3].back().stretch, 2.2);
    EXPECT_EQ(rows[4].front().label, "Shift");
    EXPECT_EQ(rows[4].back().label, "Shift");
    EXPECT_EQ(rows[5].size(), 8u);
    EXPECT_DOUBLE_EQ(rows[5][3].stretch, 6.0);
}

TEST(KeyboardLayout, MatchNamesAreUpperCaseAndDistinct) {
    const auto names = KeyboardLayout::standard().match_names();
    EXPECT_NE(std::find(names.begin(), names.end(), "CAPS LOCK"), names.end());
    EXPECT_NE(std::find(names.begin(), names.end(), "ESC"), names.end());
    EXPECT_EQ(std::count(names.begin(), names.end(), "SHIFT"), 1);
}

TEST(KeyboardLayout, KeysFillRowsWithoutGapsOrOverlap) {
    const auto layout = KeyboardLayout::standard();
    const int width = 850;
    const int height = 280;
    const auto rects = layout.compute_key_rects(width, height);

    size_t index = 0;
    int previous_bottom = -1;
    for (size_t r = 0; r < layout.rows().size(); ++r) {
        const size_t count = layout.rows()[r].size();
        const KeyRect& first = rects[index];
        const KeyRect& last = rects[index + count - 1];
        EXPECT_EQ(first.x, KeyboardLayout::OUTER_MARGIN);
        EXPECT_EQ(last.x + last.width, width - KeyboardLayout::OUTER_MARGIN);
        for (size_t i = 1; i < count; ++i) {
            const KeyRect& a = rects[index + i - 1];
            const KeyRect& b = rects[index + i];
            EXPECT_EQ(b.x - (a.x + a.width), KeyboardLayout::SPACING);
            EXPECT_EQ(a.y, b.y);
            EXPECT_EQ(a.height, b.height);
        }
        if (previous_bottom >= 0) {
            EXPECT_EQ(first.y - previous_bottom, KeyboardLayout::SPACING);
        }
        previous_bottom = first.y + first.height;
        index += count;
    }
    EXPECT_EQ(index, rects.size());
    EXPECT_EQ(previous_bottom, height - KeyboardLayout::OUTER_MARGIN);
}

TEST(KeyboardLayout, WiderKeysGetProportionalWidth) {
    const auto rects = KeyboardLayout::standard().compute_key_rects(1200, 400);
    auto find = [&](const std::string& label) {
        return *std::find_if(rects.begin(), rects.end(), [&](const KeyRect& k) { return k.label == label; });
    };
    const KeyRect space = find("Space");
    const KeyRect win = find("Win");
    EXPECT_NEAR(static_cast<double>(space.width) / win.width, 6.0 / 1.2, 0.1);
    EXPECT_EQ(find("Caps Lock").match_name, "CAPS LOCK");
}

TEST(KeyboardLayout, ResizeGrip) {
    EXPECT_TRUE(KeyboardLayout::resize_grip_contains(849, 279, 850, 280));
    EXPECT_TRUE(KeyboardLayout::resize_grip_contains(834, 264, 850, 280));
    EXPECT_FALSE(KeyboardLayout::resize_grip_contains(833, 279, 850, 280));
    EXPECT_FALSE(KeyboardLayout::resize_grip_contains(849, 263, 850, 280));
    EXPECT_FALSE(KeyboardLayout::resize_grip_contains(850, 280, 850, 280));
}

} // namespace
