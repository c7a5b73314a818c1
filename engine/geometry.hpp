/**
 * @file geometry.hpp
 * @brief Integer and floating-point 2D points and pixel bounds
 */

#pragma once

#include <algorithm>
#include <cstdint>

namespace sunbeam {

/**
 * @brief Integer 2D point (pixel coordinate)
 */
struct Point2i {
    int x = 0;
    int y = 0;
};

inline bool operator==(const Point2i& a, const Point2i& b) {
    return a.x == b.x && a.y == b.y;
}

/**
 * @brief Continuous 2D point (raster position or sample pair)
 */
struct Point2d {
    double x = 0.0;
    double y = 0.0;
};

/**
 * @brief Axis-aligned integer rectangle, min inclusive and max exclusive
 */
struct Bounds2i {
    Point2i min;
    Point2i max;

    Bounds2i() = default;
    Bounds2i(Point2i lo, Point2i hi) : min(lo), max(hi) {}

    int width() const { return std::max(0, max.x - min.x); }
    int height() const { return std::max(0, max.y - min.y); }

    int64_t area() const {
        return static_cast<int64_t>(width()) * static_cast<int64_t>(height());
    }

    bool empty() const { return max.x <= min.x || max.y <= min.y; }

    bool contains(Point2i p) const {
        return p.x >= min.x && p.x < max.x && p.y >= min.y && p.y < max.y;
    }

    /**
     * @brief Overlap of two bounds; empty() when they are disjoint
     */
    Bounds2i intersect(const Bounds2i& other) const {
        return Bounds2i(
            {std::max(min.x, other.min.x), std::max(min.y, other.min.y)},
            {std::min(max.x, other.max.x), std::min(max.y, other.max.y)});
    }
};

inline bool operator==(const Bounds2i& a, const Bounds2i& b) {
    return a.min == b.min && a.max == b.max;
}

} // namespace sunbeam
