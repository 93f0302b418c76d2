#pragma once

/**
 * @file geometry.hpp
 * @brief User-space (double precision) point and rectangle types.
 */

#include "etch/types.hpp"
#include <algorithm>

namespace etch {

/// @brief A point in user space.
struct PointD {
    f64 x = 0;
    f64 y = 0;
};

inline bool operator==(PointD a, PointD b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(PointD a, PointD b) { return !(a == b); }

/// @brief An axis-aligned rectangle in user space.
struct RectD {
    f64 x = 0;
    f64 y = 0;
    f64 w = 0;
    f64 h = 0;

    f64 right() const { return x + w; }
    f64 bottom() const { return y + h; }
    f64 centerX() const { return x + w / 2; }
    f64 centerY() const { return y + h / 2; }

    /// @brief True when width or height is not positive.
    bool isEmpty() const { return !(w > 0 && h > 0); }

    /// @brief True when the interiors of both rectangles overlap.
    bool intersects(const RectD& o) const {
        if (isEmpty() || o.isEmpty()) return false;
        return o.x < right() && x < o.right() && o.y < bottom() && y < o.bottom();
    }

    /// @brief Intersection of two rectangles; zero-sized when they do not overlap.
    RectD intersection(const RectD& o) const {
        f64 l = std::max(x, o.x);
        f64 t = std::max(y, o.y);
        f64 r = std::min(right(), o.right());
        f64 b = std::min(bottom(), o.bottom());
        if (r <= l || b <= t) return {};
        return {l, t, r - l, b - t};
    }

    static RectD MakeLTRB(f64 l, f64 t, f64 r, f64 b) { return {l, t, r - l, b - t}; }
};

inline bool operator==(const RectD& a, const RectD& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}
inline bool operator!=(const RectD& a, const RectD& b) { return !(a == b); }

/// @brief Integer rectangle, used for clip bounds reporting.
struct RectI {
    i32 x = 0;
    i32 y = 0;
    i32 w = 0;
    i32 h = 0;
};

inline bool operator==(const RectI& a, const RectI& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

/// @brief Smallest integer rectangle enclosing r.
RectI enclosingRect(const RectD& r);

}
