#pragma once

/**
 * @file Geometry.hpp
 * @brief Basic desktop geometry: rectangles, frame borders and gravity points
 *
 * All coordinates are desktop pixels with the origin at the top-left corner
 * of the desktop. Rect sizes are signed so that degenerate results of an
 * operation can be detected instead of wrapping around.
 */

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace worg {

struct Rect {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    Rect() = default;
    Rect(int x_, int y_, int w_, int h_) : x(x_), y(y_), width(w_), height(h_) {}

    inline int left() const { return x; }
    inline int top() const { return y; }
    inline int right() const { return x + width; }
    inline int bottom() const { return y + height; }

    inline int64_t area() const {
        return static_cast<int64_t>(width) * static_cast<int64_t>(height);
    }

    inline bool isValid() const { return width > 0 && height > 0; }

    inline bool contains(int px, int py) const {
        return px >= x && px < right() && py >= y && py < bottom();
    }

    inline bool contains(const Rect& other) const {
        return other.x >= x && other.y >= y &&
               other.right() <= right() && other.bottom() <= bottom();
    }

    Rect translated(int dx, int dy) const { return {x + dx, y + dy, width, height}; }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }

    bool operator!=(const Rect& other) const { return !(*this == other); }

    std::string toString() const;
};

/**
 * @brief Window frame extents (_NET_FRAME_EXTENTS)
 */
struct Borders {
    int left{0};
    int right{0};
    int top{0};
    int bottom{0};

    inline int horizontal() const { return left + right; }
    inline int vertical() const { return top + bottom; }

    bool operator==(const Borders& other) const {
        return left == other.left && right == other.right &&
               top == other.top && bottom == other.bottom;
    }
};

/**
 * @brief Anchor point expressed as a fraction of width and height
 *
 * (0, 0) is the top-left corner, (1, 1) the bottom-right one and
 * (0.5, 0.5) the middle. The middle counts as every side at once.
 */
struct Gravity {
    double x{0.0};
    double y{0.0};

    constexpr Gravity() = default;
    constexpr Gravity(double x_, double y_) : x(x_), y(y_) {}

    bool isMiddle() const { return x == 0.5 && y == 0.5; }
    bool isTop() const { return y < 0.5 || isMiddle(); }
    bool isBottom() const { return y > 0.5 || isMiddle(); }
    bool isLeft() const { return x < 0.5 || isMiddle(); }
    bool isRight() const { return x > 0.5 || isMiddle(); }

    Gravity invert(bool vertical = true, bool horizontal = true) const {
        return {horizontal ? 1.0 - x : x, vertical ? 1.0 - y : y};
    }

    bool operator==(const Gravity& other) const { return x == other.x && y == other.y; }
    bool operator!=(const Gravity& other) const { return !(*this == other); }

    static constexpr Gravity topLeft() { return {0.0, 0.0}; }
    static constexpr Gravity top() { return {0.5, 0.0}; }
    static constexpr Gravity topRight() { return {1.0, 0.0}; }
    static constexpr Gravity left() { return {0.0, 0.5}; }
    static constexpr Gravity center() { return {0.5, 0.5}; }
    static constexpr Gravity right() { return {1.0, 0.5}; }
    static constexpr Gravity bottomLeft() { return {0.0, 1.0}; }
    static constexpr Gravity bottom() { return {0.5, 1.0}; }
    static constexpr Gravity bottomRight() { return {1.0, 1.0}; }

    // Accepts "top-left", "top_left", "topleft", "NW", "center", "middle", ...
    static std::optional<Gravity> parse(std::string_view name);

    std::string toString() const;
};

/**
 * @brief Build a rect of the given size whose gravity point sits at (px, py)
 */
Rect rectAtGravity(int px, int py, int width, int height, const Gravity& gravity);

/**
 * @brief Point of @p rect selected by @p gravity
 */
void gravityPoint(const Rect& rect, const Gravity& gravity, int& px, int& py);

std::optional<Rect> intersect(const Rect& a, const Rect& b);

int64_t overlapArea(const Rect& a, const Rect& b);

}
