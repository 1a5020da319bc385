#include "KeyboardLayout.hpp"
#include "KeyNames.hpp"
#include <algorithm>
#include <cmath>

KeyboardLayout::KeyboardLayout(std::vector<LayoutRow> rows) : m_rows(std::move(rows)) {}

KeyboardLayout KeyboardLayout::standard() {
    auto keys = [](std::initializer_list<const char*> labels) {
        LayoutRow row;
        for (const char* l : labels) row.push_back({l, 1.0});
        return row;
    };

    std::vector<LayoutRow> rows;
    rows.push_back(keys({"Esc", "F1", "F2", "F3", "F4", "F5", "F6", "F7", "F8", "F9", "F10", "F11", "F12"}));

    LayoutRow numbers = keys({"`", "1", "2", "3", "4", "5", "6", "7", "8", "9", "0", "-", "="});
    numbers.push_back({"Backspace", 2.0});
    rows.push_back(std::move(numbers));

    LayoutRow top{{"Tab", 1.5}};
    for (auto& k : keys({"Q", "W", "E", "R", "T", "Y", "U", "I", "O", "P", "[", "]"})) top.push_back(k);
    top.push_back({"\\", 1.5});
    rows.push_back(std::move(top));

    LayoutRow home{{"Caps Lock", 1.8}};
    for (auto& k : keys({"A", "S", "D", "F", "G", "H", "J", "K", "L", ";", "'"})) home.push_back(k);
    home.push_back({"Enter", 2.2});
    rows.push_back(std::move(home));

    LayoutRow bottom{{"Shift", 2.5}};
    for (auto& k : keys({"Z", "X", "C", "V", "B", "N", "M", ",", ".", "/"})) bottom.push_back(k);
    bottom.push_back({"Shift", 2.5});
    rows.push_back(std::move(bottom));

    rows.push_back({{"Ctrl", 1.5}, {"Win", 1.2}, {"Alt", 1.2}, {"Space", 6.0},
                    {"Alt", 1.2}, {"Win", 1.2}, {"Menu", 1.2}, {"Ctrl", 1.5}});
    return KeyboardLayout(std::move(rows));
}

std::vector<KeyRect> KeyboardLayout::compute_key_rects(int width, int height) const {
    std::vector<KeyRect> rects;
    if (m_rows.empty()) {
        return rects;
    }
    const int inner_w = std::max(0, width - 2 * OUTER_MARGIN);
    const int inner_h = std::max(0, height - 2 * OUTER_MARGIN);
    const int row_count = static_cast<int>(m_rows.size());
    const int usable_h = std::max(0, inner_h - SPACING * (row_count - 1));

    for (size_t r = 0; r < m_rows.size(); ++r) {
        const auto& row = m_rows[r];
        // Integer edges from cumulative fractions leave no gaps or overlap
        const int top = OUTER_MARGIN + static_cast<int>(r) * SPACING + usable_h * static_cast<int>(r) / row_count;
        const int bottom = OUTER_MARGIN + static_cast<int>(r) * SPACING + usable_h * static_cast<int>(r + 1) / row_count;

        double total_stretch = 0.0;
        for (const auto& k : row) total_stretch += k.stretch;
        const int key_count = static_cast<int>(row.size());
        const int usable_w = std::max(0, inner_w - SPACING * (key_count - 1));

        double acc = 0.0;
        for (size_t i = 0; i < row.size(); ++i) {
            const int left = OUTER_MARGIN + static_cast<int>(i) * SPACING +
                             static_cast<int>(std::lround(usable_w * acc / total_stretch));
            acc += row[i].stretch;
            const int right = OUTER_MARGIN + static_cast<int>(i) * SPACING +
                              static_cast<int>(std::lround(usable_w * acc / total_stretch));
            rects.push_back({row[i].label, ascii_upper(row[i].label), left, top, right - left, bottom - top, r});
        }
    }
    return rects;
}

std::vector<std::string> KeyboardLayout::match_names() const {
    std::vector<std::string> names;
    for (const auto& row : m_rows) {
        for (const auto& k : row) {
            auto name = ascii_upper(k.label);
            if (std::find(names.begin(), names.end(), name) == names.end()) {
                names.push_back(std::move(name));
            }
        }
    }
    return names;
}

bool KeyboardLayout::resize_grip_contains(int x, int y, int width, int height) {
    return x >= width - GRIP_SIZE && x < width && y >= height - GRIP_SIZE && y < height;
}
