#pragma once

/**
 * @file shape.hpp
 * @brief User-space shapes and the segment iterator they expose.
 */

#include "etch/affine_transform.hpp"
#include "etch/geometry.hpp"
#include <memory>
#include <vector>

namespace etch {

/// @brief Kind of a path segment. The numeric values are stable.
enum class SegmentType : int {
    MoveTo = 0,   ///< One point.
    LineTo = 1,   ///< One point.
    QuadTo = 2,   ///< Control point, end point.
    CubicTo = 3,  ///< Two control points, end point.
    Close = 4     ///< No points.
};

/// @brief Interior membership rule for filled outlines.
enum class WindingRule : u8 {
    EvenOdd,
    NonZero
};

/// @brief Number of (x, y) pairs carried by a segment kind, or -1 if unknown.
int segmentPointCount(SegmentType type);

/// @brief Forward-only cursor over the segments of a shape outline.
class PathIterator {
public:
    virtual ~PathIterator() = default;

    virtual WindingRule windingRule() const = 0;

    /// @brief True once every segment has been visited.
    virtual bool isDone() const = 0;

    /// @brief Copy the current segment's coordinates into coords and return its kind.
    /// @param coords Receives up to three interleaved (x, y) pairs.
    virtual SegmentType currentSegment(f64 coords[6]) const = 0;

    /// @brief Advance to the next segment.
    virtual void next() = 0;
};

/// @brief A user-space outline.
///
/// Each call to pathIterator() starts a fresh traversal, so a shape can be
/// walked any number of times.
class Shape {
public:
    virtual ~Shape() = default;

    /// @brief Bounding box of the outline (control points included for curves).
    virtual RectD bounds() const = 0;

    /// @brief Begin a traversal of the outline.
    /// @param at Optional transform applied to every returned coordinate.
    virtual std::unique_ptr<PathIterator> pathIterator(const AffineTransform* at = nullptr) const = 0;
};

/// @brief A straight line segment.
class LineShape : public Shape {
public:
    LineShape() = default;
    LineShape(f64 x1, f64 y1, f64 x2, f64 y2) : p1_{x1, y1}, p2_{x2, y2} {}

    void setLine(f64 x1, f64 y1, f64 x2, f64 y2) { p1_ = {x1, y1}; p2_ = {x2, y2}; }

    PointD p1() const { return p1_; }
    PointD p2() const { return p2_; }

    RectD bounds() const override;
    std::unique_ptr<PathIterator> pathIterator(const AffineTransform* at = nullptr) const override;

private:
    PointD p1_;
    PointD p2_;
};

/// @brief An axis-aligned rectangle. Negative sizes produce an empty outline.
class RectShape : public Shape {
public:
    RectShape() = default;
    RectShape(f64 x, f64 y, f64 w, f64 h) : rect_{x, y, w, h} {}
    explicit RectShape(const RectD& r) : rect_(r) {}

    void setRect(f64 x, f64 y, f64 w, f64 h) { rect_ = {x, y, w, h}; }

    const RectD& rect() const { return rect_; }

    RectD bounds() const override { return rect_; }
    std::unique_ptr<PathIterator> pathIterator(const AffineTransform* at = nullptr) const override;

private:
    RectD rect_;
};

/// @brief An ellipse inscribed in a frame rectangle.
class EllipseShape : public Shape {
public:
    EllipseShape() = default;
    EllipseShape(f64 x, f64 y, f64 w, f64 h) : frame_{x, y, w, h} {}

    void setFrame(f64 x, f64 y, f64 w, f64 h) { frame_ = {x, y, w, h}; }

    const RectD& frame() const { return frame_; }

    RectD bounds() const override { return frame_; }
    std::unique_ptr<PathIterator> pathIterator(const AffineTransform* at = nullptr) const override;

private:
    RectD frame_;
};

/// @brief A rectangle with elliptical corners.
class RoundRectShape : public Shape {
public:
    RoundRectShape() = default;
    RoundRectShape(f64 x, f64 y, f64 w, f64 h, f64 arcW, f64 arcH)
        : rect_{x, y, w, h}, arcW_(arcW), arcH_(arcH) {}

    void setRoundRect(f64 x, f64 y, f64 w, f64 h, f64 arcW, f64 arcH) {
        rect_ = {x, y, w, h};
        arcW_ = arcW;
        arcH_ = arcH;
    }

    const RectD& rect() const { return rect_; }
    f64 arcWidth() const { return arcW_; }
    f64 arcHeight() const { return arcH_; }

    RectD bounds() const override { return rect_; }
    std::unique_ptr<PathIterator> pathIterator(const AffineTransform* at = nullptr) const override;

private:
    RectD rect_;
    f64 arcW_ = 0;
    f64 arcH_ = 0;
};

/// @brief How an arc outline is closed.
enum class ArcType : u8 {
    Open,   ///< Just the curve.
    Chord,  ///< Curve plus a straight line between its ends.
    Pie     ///< Curve plus lines to the ellipse center.
};

/// @brief A section of an ellipse.
///
/// Angles are in degrees, measured counter-clockwise on screen from the
/// positive x axis (so 90 degrees points up).
class ArcShape : public Shape {
public:
    ArcShape() = default;
    ArcShape(f64 x, f64 y, f64 w, f64 h, f64 startDeg, f64 extentDeg, ArcType type)
        : frame_{x, y, w, h}, start_(startDeg), extent_(extentDeg), type_(type) {}

    void setArc(f64 x, f64 y, f64 w, f64 h, f64 startDeg, f64 extentDeg, ArcType type) {
        frame_ = {x, y, w, h};
        start_ = startDeg;
        extent_ = extentDeg;
        type_ = type;
    }

    const RectD& frame() const { return frame_; }
    f64 angleStart() const { return start_; }
    f64 angleExtent() const { return extent_; }
    ArcType arcType() const { return type_; }

    RectD bounds() const override { return frame_; }
    std::unique_ptr<PathIterator> pathIterator(const AffineTransform* at = nullptr) const override;

private:
    RectD frame_;
    f64 start_ = 0;
    f64 extent_ = 0;
    ArcType type_ = ArcType::Open;
};

/// @brief A general outline built from move/line/quad/cubic/close segments.
class PathShape : public Shape {
public:
    explicit PathShape(WindingRule rule = WindingRule::NonZero) : rule_(rule) {}

    /// @brief Copy the outline of another shape, optionally transformed.
    explicit PathShape(const Shape& src, const AffineTransform* at = nullptr);

    PathShape& moveTo(f64 x, f64 y);
    PathShape& lineTo(f64 x, f64 y);
    PathShape& quadTo(f64 cx, f64 cy, f64 x, f64 y);
    PathShape& cubicTo(f64 c1x, f64 c1y, f64 c2x, f64 c2y, f64 x, f64 y);
    PathShape& closePath();

    /// @brief Append every segment of a shape (its winding rule is ignored).
    void append(const Shape& s, const AffineTransform* at = nullptr);

    void reset() { types_.clear(); coords_.clear(); }

    WindingRule windingRule() const { return rule_; }
    void setWindingRule(WindingRule rule) { rule_ = rule; }

    bool isEmpty() const { return types_.empty(); }
    size_t segmentCount() const { return types_.size(); }
    const std::vector<SegmentType>& segmentTypes() const { return types_; }
    const std::vector<f64>& coords() const { return coords_; }

    /// @brief True when the outline is a single axis-aligned rectangle.
    /// @param out Receives the rectangle when non-null.
    bool isRect(RectD* out = nullptr) const;

    RectD bounds() const override;
    std::unique_ptr<PathIterator> pathIterator(const AffineTransform* at = nullptr) const override;

    bool operator==(const PathShape& o) const {
        return rule_ == o.rule_ && types_ == o.types_ && coords_ == o.coords_;
    }
    bool operator!=(const PathShape& o) const { return !(*this == o); }

private:
    WindingRule rule_;
    std::vector<SegmentType> types_;
    std::vector<f64> coords_;
};

/// @brief Outline of a polygon or polyline through n points.
/// @param close Whether to close the outline back to the first point.
PathShape makePolygon(const PointD* pts, i32 n, bool close);

}
