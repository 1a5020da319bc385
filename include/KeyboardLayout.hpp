#pragma once
#include <string>
#include <vector>

inline constexpr int MIN_WINDOW_WIDTH = 600;
inline constexpr int MIN_WINDOW_HEIGHT = 200;
inline constexpr int DEFAULT_WINDOW_WIDTH = 850;
inline constexpr int DEFAULT_WINDOW_HEIGHT = 280;

struct LayoutKey {
    std::string label;   // "Caps Lock"
    double stretch{1.0}; // width relative to a plain key
};

using LayoutRow = std::vector<LayoutKey>;

/**
 * @struct KeyRect
 * @brief A laid out key in window client coordinates.
 */
struct KeyRect {
    std::string label;
    std::string match_name; // label upper-cased, compared against shortcut keys
    int x{0}, y{0}, width{0}, height{0};
    size_t row{0};
};

/**
 * @class KeyboardLayout
 * @brief Six-row keyboard grid and its geometry.
 */
class KeyboardLayout {
public:
    static constexpr int OUTER_MARGIN = 7; // window padding plus grid margin
    static constexpr int SPACING = 3;
    static constexpr int GRIP_SIZE = 16;

    /// The standard layout (function row down to the bottom modifier row).
    static KeyboardLayout standard();

    explicit KeyboardLayout(std::vector<LayoutRow> rows);

    const std::vector<LayoutRow>& rows() const { return m_rows; }

    /**
     * @brief Distributes the client area: rows share the height equally, keys in a row share
     * its width in proportion to their stretch. Adjacent keys are exactly SPACING apart.
     */
    std::vector<KeyRect> compute_key_rects(int width, int height) const;

    /// Distinct upper-cased key names, in layout order.
    std::vector<std::string> match_names() const;

    /**
     * @brief True if (x, y) lies in the bottom-right resize grip.
     */
    static bool resize_grip_contains(int x, int y, int width, int height);

private:
    std::vector<LayoutRow> m_rows;
};
