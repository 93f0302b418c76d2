#pragma once

#include "etch/path.hpp"
#include "etch/shape.hpp"

namespace etch {

/// @brief Converts shape outlines into backend paths.
class PathBuilder {
public:
    /// @brief Replay every segment of the shape into a new path.
    ///
    /// Coordinates are narrowed to single precision. The fill mode is left
    /// at its default; fills set it with FillModeFor().
    /// @throws UnsupportedSegmentError on a segment kind outside SegmentType.
    static Path Build(const Shape& shape, const AffineTransform* at = nullptr);

    /// @copydoc Build(const Shape&, const AffineTransform*)
    static Path Build(PathIterator& it);

    static PathFillMode FillModeFor(WindingRule rule) {
        return rule == WindingRule::EvenOdd ? PathFillMode::EvenOdd : PathFillMode::Winding;
    }
};

}
