#pragma once

#include <cstdint>

/**
 * @file types.hpp
 * @brief Core type aliases and basic backend geometric/color types for etch.
 */

namespace etch {

using i32 = int32_t;   ///< Signed 32-bit integer.
using u32 = uint32_t;  ///< Unsigned 32-bit integer.
using u64 = uint64_t;  ///< Unsigned 64-bit integer.
using u16 = uint16_t;  ///< Unsigned 16-bit integer.
using u8 = uint8_t;    ///< Unsigned 8-bit integer.
using f32 = float;     ///< 32-bit floating point.
using f64 = double;    ///< 64-bit floating point.

/// @brief A 2D point in backend (single) precision.
struct Point {
    f32 x = 0;  ///< X coordinate.
    f32 y = 0;  ///< Y coordinate.
};

/// @brief An axis-aligned rectangle in backend precision, defined by position and size.
struct Rect {
    f32 x = 0;  ///< Left edge X coordinate.
    f32 y = 0;  ///< Top edge Y coordinate.
    f32 w = 0;  ///< Width.
    f32 h = 0;  ///< Height.

    f32 right() const { return x + w; }
    f32 bottom() const { return y + h; }

    /// @brief True when the rectangle encloses no area.
    bool isEmpty() const { return !(w > 0 && h > 0); }

    /// @brief Build a rectangle from its edges.
    static Rect MakeLTRB(f32 l, f32 t, f32 r, f32 b) { return {l, t, r - l, b - t}; }
};

/// @brief An RGBA color with 8-bit components.
struct Color {
    u8 r = 0;    ///< Red component (0–255).
    u8 g = 0;    ///< Green component (0–255).
    u8 b = 0;    ///< Blue component (0–255).
    u8 a = 255;  ///< Alpha component (0–255), default opaque.

    /// @brief Pack as 0xAARRGGBB.
    u32 argb() const {
        return (u32(a) << 24) | (u32(r) << 16) | (u32(g) << 8) | u32(b);
    }

    /// @brief Unpack from 0xAARRGGBB.
    static Color FromARGB(u32 v) {
        return {u8((v >> 16) & 0xFF), u8((v >> 8) & 0xFF), u8(v & 0xFF), u8(v >> 24)};
    }
};

inline bool operator==(Point a, Point b) { return a.x == b.x && a.y == b.y; }
inline bool operator!=(Point a, Point b) { return !(a == b); }

inline bool operator==(const Rect& a, const Rect& b) {
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}
inline bool operator!=(const Rect& a, const Rect& b) { return !(a == b); }

inline bool operator==(Color a, Color b) {
    return a.r == b.r && a.g == b.g && a.b == b.b && a.a == b.a;
}
inline bool operator!=(Color a, Color b) { return !(a == b); }

}
