/**
 * @file Geometry.cpp
 * @brief Rect, gravity and overlap helpers
 */

#include "winorg/geometry/Geometry.hpp"
#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_map>

namespace worg {

std::string Rect::toString() const {
    std::ostringstream oss;
    oss << "{x: " << x << ", y: " << y << ", w: " << width << ", h: " << height << "}";
    return oss.str();
}

std::optional<Gravity> Gravity::parse(std::string_view name) {
    std::string key;
    key.reserve(name.size());
    for (char c : name) {
        if (c == '-' || c == '_' || c == ' ') continue;
        key += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    static const std::unordered_map<std::string, Gravity> names = {
        {"topleft", topLeft()},         {"nw", topLeft()},
        {"top", top()},                 {"n", top()},
        {"topright", topRight()},       {"ne", topRight()},
        {"left", left()},               {"w", left()},
        {"center", center()},           {"middle", center()},
        {"c", center()},
        {"right", right()},             {"e", right()},
        {"bottomleft", bottomLeft()},   {"sw", bottomLeft()},
        {"bottom", bottom()},           {"s", bottom()},
        {"bottomright", bottomRight()}, {"se", bottomRight()},
    };

    auto it = names.find(key);
    if (it == names.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::string Gravity::toString() const {
    std::ostringstream oss;
    oss.precision(2);
    oss << std::fixed << "(" << x << ", " << y << ")";
    return oss.str();
}

Rect rectAtGravity(int px, int py, int width, int height, const Gravity& gravity) {
    int x = px - static_cast<int>(std::lround(width * gravity.x));
    int y = py - static_cast<int>(std::lround(height * gravity.y));
    return {x, y, width, height};
}

void gravityPoint(const Rect& rect, const Gravity& gravity, int& px, int& py) {
    px = rect.x + static_cast<int>(std::lround(rect.width * gravity.x));
    py = rect.y + static_cast<int>(std::lround(rect.height * gravity.y));
}

std::optional<Rect> intersect(const Rect& a, const Rect& b) {
    int left = std::max(a.left(), b.left());
    int top = std::max(a.top(), b.top());
    int right = std::min(a.right(), b.right());
    int bottom = std::min(a.bottom(), b.bottom());

    if (right <= left || bottom <= top) {
        return std::nullopt;
    }
    return Rect{left, top, right - left, bottom - top};
}

int64_t overlapArea(const Rect& a, const Rect& b) {
    auto common = intersect(a, b);
    return common ? common->area() : 0;
}

} // namespace worg
