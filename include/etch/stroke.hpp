#pragma once

#include "etch/types.hpp"
#include <vector>

namespace etch {

/// @brief Decoration at the open ends of stroked segments.
enum class LineCap : u8 {
    Butt,
    Round,
    Square
};

/// @brief Decoration where stroked segments meet.
enum class LineJoin : u8 {
    Miter,
    Round,
    Bevel
};

/// @brief User-level stroke attributes.
struct StrokeSpec {
    f32 width = 1;
    LineCap cap = LineCap::Square;
    LineJoin join = LineJoin::Miter;
    f32 miterLimit = 10;
    std::vector<f32> dash;  ///< Alternating on/off lengths; empty for a solid line.
    f32 dashPhase = 0;
};

inline bool operator==(const StrokeSpec& a, const StrokeSpec& b) {
    return a.width == b.width && a.cap == b.cap && a.join == b.join &&
           a.miterLimit == b.miterLimit && a.dash == b.dash && a.dashPhase == b.dashPhase;
}
inline bool operator!=(const StrokeSpec& a, const StrokeSpec& b) { return !(a == b); }

}
