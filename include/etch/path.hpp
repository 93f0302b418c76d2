#pragma once

/**
 * @file path.hpp
 * @brief Backend path: verbs and single-precision points.
 */

#include "etch/types.hpp"
#include "etch/matrix.hpp"
#include <cstddef>
#include <vector>

namespace etch {

enum class PathVerb : u8 {
    Move,
    Line,
    Quad,
    Cubic,
    Close
};

enum class PathFillMode : u8 {
    Winding,
    EvenOdd
};

/// @brief An outline as understood by a backend Canvas.
class Path {
public:
    Path& moveTo(f32 x, f32 y);
    Path& lineTo(f32 x, f32 y);
    Path& quadTo(f32 cx, f32 cy, f32 x, f32 y);
    Path& cubicTo(f32 c1x, f32 c1y, f32 c2x, f32 c2y, f32 x, f32 y);
    Path& close();

    void setFillMode(PathFillMode mode) { fillMode_ = mode; }
    PathFillMode fillMode() const { return fillMode_; }

    bool isEmpty() const { return verbs_.empty(); }
    size_t countVerbs() const { return verbs_.size(); }
    size_t countPoints() const { return points_.size(); }
    const std::vector<PathVerb>& verbs() const { return verbs_; }
    const std::vector<Point>& points() const { return points_; }

    /// @brief Bounds of all points, control points included.
    Rect bounds() const;

    /// @brief Copy with every point mapped through m.
    Path transformed(const Matrix& m) const;

    bool operator==(const Path& o) const {
        return fillMode_ == o.fillMode_ && verbs_ == o.verbs_ && points_ == o.points_;
    }
    bool operator!=(const Path& o) const { return !(*this == o); }

private:
    std::vector<PathVerb> verbs_;
    std::vector<Point> points_;
    PathFillMode fillMode_ = PathFillMode::Winding;
};

}
