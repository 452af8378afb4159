#pragma once

/**
 * @file Rect.hpp
 * @brief Integer pixel geometry shared by placement, movement and the registry
 */

#include <algorithm>
#include <cstdint>

namespace pswarm {

struct Size {
    int width{0};
    int height{0};

    bool operator==(const Size& other) const {
        return width == other.width && height == other.height;
    }
};

struct Rect {
    int x{0};
    int y{0};
    int width{0};
    int height{0};

    inline int64_t area() const { return static_cast<int64_t>(width) * height; }

    inline int left() const { return x; }
    inline int right() const { return x + width; }
    inline int top() const { return y; }
    inline int bottom() const { return y + height; }

    inline double centerX() const { return x + width / 2.0; }
    inline double centerY() const { return y + height / 2.0; }

    inline Size size() const { return {width, height}; }

    inline bool isEmpty() const { return width <= 0 || height <= 0; }

    inline bool contains(const Rect& other) const {
        return other.left() >= left() && other.right() <= right() &&
               other.top() >= top() && other.bottom() <= bottom();
    }

    bool operator==(const Rect& other) const {
        return x == other.x && y == other.y &&
               width == other.width && height == other.height;
    }

    bool operator!=(const Rect& other) const { return !(*this == other); }
};

inline int64_t overlapArea(const Rect& a, const Rect& b) {
    int64_t w = std::max(0, std::min(a.right(), b.right()) - std::max(a.left(), b.left()));
    int64_t h = std::max(0, std::min(a.bottom(), b.bottom()) - std::max(a.top(), b.top()));
    return w * h;
}

inline double centerDistanceSquared(const Rect& a, const Rect& b) {
    double dx = a.centerX() - b.centerX();
    double dy = a.centerY() - b.centerY();
    return dx * dx + dy * dy;
}

}
