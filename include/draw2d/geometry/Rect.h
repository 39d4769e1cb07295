#pragma once

#include <glm/glm.hpp>
#include <cmath>

namespace draw2d {

// Axis-aligned rectangle in a y-up space.
template <typename T>
struct Rect {
    T left{};
    T right{};
    T bottom{};
    T top{};

    Rect() = default;
    Rect(T left, T right, T bottom, T top)
        : left(left), right(right), bottom(bottom), top(top) {}

    // Inclusive on every edge.
    bool contains(T x, T y) const {
        return x >= left && x <= right && y >= bottom && y <= top;
    }

    bool contains(const glm::vec<2, T>& point) const {
        return contains(point.x, point.y);
    }

    T width() const { return std::abs(right - left); }
    T height() const { return std::abs(top - bottom); }

    bool operator==(const Rect& other) const {
        return left == other.left && right == other.right &&
               bottom == other.bottom && top == other.top;
    }
    bool operator!=(const Rect& other) const { return !(*this == other); }
};

} // namespace draw2d
