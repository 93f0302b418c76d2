#include "etch/shape.hpp"
#include <cmath>
#include <utility>

namespace etch {

namespace {

// Cubic control distance for a quarter ellipse.
constexpr f64 kKappa = 0.5522847498307933;
constexpr f64 kPi = 3.14159265358979323846;

class SegmentIterator : public PathIterator {
public:
    SegmentIterator(std::vector<SegmentType> types, std::vector<f64> coords,
                    WindingRule rule, const AffineTransform* at)
        : types_(std::move(types)), coords_(std::move(coords)), rule_(rule) {
        if (at) {
            transform_ = *at;
            hasTransform_ = true;
        }
    }

    WindingRule windingRule() const override { return rule_; }

    bool isDone() const override { return index_ >= types_.size(); }

    SegmentType currentSegment(f64 coords[6]) const override {
        SegmentType type = types_[index_];
        int n = segmentPointCount(type);
        for (int i = 0; i < 2 * n; ++i) {
            coords[i] = coords_[coordIndex_ + i];
        }
        if (hasTransform_ && n > 0) {
            transform_.transform(coords, coords, n);
        }
        return type;
    }

    void next() override {
        if (isDone()) return;
        coordIndex_ += 2 * size_t(segmentPointCount(types_[index_]));
        ++index_;
    }

private:
    std::vector<SegmentType> types_;
    std::vector<f64> coords_;
    WindingRule rule_;
    AffineTransform transform_;
    bool hasTransform_ = false;
    size_t index_ = 0;
    size_t coordIndex_ = 0;
};

std::unique_ptr<PathIterator> iteratorFor(const PathShape& p, const AffineTransform* at) {
    return std::make_unique<SegmentIterator>(p.segmentTypes(), p.coords(), p.windingRule(), at);
}

void appendArcSegments(PathShape& p, f64 cx, f64 cy, f64 rx, f64 ry,
                       f64 startRad, f64 extentRad, int pieces) {
    f64 step = extentRad / pieces;
    f64 k = 4.0 / 3.0 * std::tan(step / 4);
    for (int i = 0; i < pieces; ++i) {
        f64 a0 = startRad + step * i;
        f64 a1 = a0 + step;
        f64 c0 = std::cos(a0), s0 = std::sin(a0);
        f64 c1 = std::cos(a1), s1 = std::sin(a1);
        f64 u1 = c0 - k * s0, v1 = s0 + k * c0;
        f64 u2 = c1 + k * s1, v2 = s1 - k * c1;
        p.cubicTo(cx + u1 * rx, cy - v1 * ry,
                  cx + u2 * rx, cy - v2 * ry,
                  cx + c1 * rx, cy - s1 * ry);
    }
}

}

int segmentPointCount(SegmentType type) {
    switch (type) {
        case SegmentType::MoveTo:
        case SegmentType::LineTo:
            return 1;
        case SegmentType::QuadTo:
            return 2;
        case SegmentType::CubicTo:
            return 3;
        case SegmentType::Close:
            return 0;
    }
    return -1;
}

// --- LineShape ---

RectD LineShape::bounds() const {
    return RectD::MakeLTRB(std::min(p1_.x, p2_.x), std::min(p1_.y, p2_.y),
                           std::max(p1_.x, p2_.x), std::max(p1_.y, p2_.y));
}

std::unique_ptr<PathIterator> LineShape::pathIterator(const AffineTransform* at) const {
    PathShape p;
    p.moveTo(p1_.x, p1_.y).lineTo(p2_.x, p2_.y);
    return iteratorFor(p, at);
}

// --- RectShape ---

std::unique_ptr<PathIterator> RectShape::pathIterator(const AffineTransform* at) const {
    PathShape p;
    if (rect_.w >= 0 && rect_.h >= 0) {
        p.moveTo(rect_.x, rect_.y)
         .lineTo(rect_.right(), rect_.y)
         .lineTo(rect_.right(), rect_.bottom())
         .lineTo(rect_.x, rect_.bottom())
         .closePath();
    }
    return iteratorFor(p, at);
}

// --- EllipseShape ---

std::unique_ptr<PathIterator> EllipseShape::pathIterator(const AffineTransform* at) const {
    PathShape p;
    if (frame_.w >= 0 && frame_.h >= 0) {
        f64 cx = frame_.centerX(), cy = frame_.centerY();
        f64 rx = frame_.w / 2, ry = frame_.h / 2;
        f64 kx = kKappa * rx, ky = kKappa * ry;
        p.moveTo(cx + rx, cy)
         .cubicTo(cx + rx, cy + ky, cx + kx, cy + ry, cx, cy + ry)
         .cubicTo(cx - kx, cy + ry, cx - rx, cy + ky, cx - rx, cy)
         .cubicTo(cx - rx, cy - ky, cx - kx, cy - ry, cx, cy - ry)
         .cubicTo(cx + kx, cy - ry, cx + rx, cy - ky, cx + rx, cy)
         .closePath();
    }
    return iteratorFor(p, at);
}

// --- RoundRectShape ---

std::unique_ptr<PathIterator> RoundRectShape::pathIterator(const AffineTransform* at) const {
    PathShape p;
    if (rect_.w >= 0 && rect_.h >= 0) {
        f64 x = rect_.x, y = rect_.y, r = rect_.right(), b = rect_.bottom();
        f64 rx = std::min(std::fabs(arcW_), rect_.w) / 2;
        f64 ry = std::min(std::fabs(arcH_), rect_.h) / 2;
        f64 kx = kKappa * rx, ky = kKappa * ry;
        p.moveTo(x + rx, y)
         .lineTo(r - rx, y)
         .cubicTo(r - rx + kx, y, r, y + ry - ky, r, y + ry)
         .lineTo(r, b - ry)
         .cubicTo(r, b - ry + ky, r - rx + kx, b, r - rx, b)
         .lineTo(x + rx, b)
         .cubicTo(x + rx - kx, b, x, b - ry + ky, x, b - ry)
         .lineTo(x, y + ry)
         .cubicTo(x, y + ry - ky, x + rx - kx, y, x + rx, y)
         .closePath();
    }
    return iteratorFor(p, at);
}

// --- ArcShape ---

std::unique_ptr<PathIterator> ArcShape::pathIterator(const AffineTransform* at) const {
    PathShape p;
    if (frame_.w >= 0 && frame_.h >= 0) {
        f64 cx = frame_.centerX(), cy = frame_.centerY();
        f64 rx = frame_.w / 2, ry = frame_.h / 2;
        f64 extent = std::max(-360.0, std::min(360.0, extent_));
        f64 startRad = start_ * kPi / 180;
        f64 extentRad = extent * kPi / 180;
        int pieces = int(std::ceil(std::fabs(extent) / 90 - 1e-9));

        f64 sx = cx + std::cos(startRad) * rx;
        f64 sy = cy - std::sin(startRad) * ry;
        if (type_ == ArcType::Pie) {
            p.moveTo(cx, cy).lineTo(sx, sy);
        } else {
            p.moveTo(sx, sy);
        }
        if (pieces > 0) {
            appendArcSegments(p, cx, cy, rx, ry, startRad, extentRad, pieces);
        }
        if (type_ != ArcType::Open) {
            p.closePath();
        }
    }
    return iteratorFor(p, at);
}

// --- PathShape ---

PathShape::PathShape(const Shape& src, const AffineTransform* at)
    : rule_(WindingRule::NonZero) {
    auto it = src.pathIterator(at);
    rule_ = it->windingRule();
    f64 c[6];
    for (; !it->isDone(); it->next()) {
        SegmentType type = it->currentSegment(c);
        int n = segmentPointCount(type);
        if (n < 0) continue;
        types_.push_back(type);
        coords_.insert(coords_.end(), c, c + 2 * n);
    }
}

PathShape& PathShape::moveTo(f64 x, f64 y) {
    types_.push_back(SegmentType::MoveTo);
    coords_.insert(coords_.end(), {x, y});
    return *this;
}

PathShape& PathShape::lineTo(f64 x, f64 y) {
    types_.push_back(SegmentType::LineTo);
    coords_.insert(coords_.end(), {x, y});
    return *this;
}

PathShape& PathShape::quadTo(f64 cx, f64 cy, f64 x, f64 y) {
    types_.push_back(SegmentType::QuadTo);
    coords_.insert(coords_.end(), {cx, cy, x, y});
    return *this;
}

PathShape& PathShape::cubicTo(f64 c1x, f64 c1y, f64 c2x, f64 c2y, f64 x, f64 y) {
    types_.push_back(SegmentType::CubicTo);
    coords_.insert(coords_.end(), {c1x, c1y, c2x, c2y, x, y});
    return *this;
}

PathShape& PathShape::closePath() {
    if (!types_.empty() && types_.back() != SegmentType::Close) {
        types_.push_back(SegmentType::Close);
    }
    return *this;
}

void PathShape::append(const Shape& s, const AffineTransform* at) {
    PathShape other(s, at);
    types_.insert(types_.end(), other.types_.begin(), other.types_.end());
    coords_.insert(coords_.end(), other.coords_.begin(), other.coords_.end());
}

bool PathShape::isRect(RectD* out) const {
    // move + 3 or 4 lines + close, with alternating axis-aligned edges
    size_t n = types_.size();
    if (n < 5 || n > 6) return false;
    if (types_[0] != SegmentType::MoveTo || types_[n - 1] != SegmentType::Close) return false;
    for (size_t i = 1; i + 1 < n; ++i) {
        if (types_[i] != SegmentType::LineTo) return false;
    }
    if (n == 6 && (coords_[8] != coords_[0] || coords_[9] != coords_[1])) return false;
    bool firstHorizontal = coords_[1] == coords_[3];
    for (size_t i = 0; i < 4; ++i) {
        size_t j = (i + 1) % 4;
        f64 x0 = coords_[2 * i], y0 = coords_[2 * i + 1];
        f64 x1 = coords_[2 * j], y1 = coords_[2 * j + 1];
        bool horizontal = ((i % 2) == 0) == firstHorizontal;
        if (horizontal ? (y0 != y1) : (x0 != x1)) return false;
    }
    if (out) {
        f64 l = std::min(coords_[0], coords_[4]);
        f64 r = std::max(coords_[0], coords_[4]);
        f64 t = std::min(coords_[1], coords_[5]);
        f64 b = std::max(coords_[1], coords_[5]);
        *out = RectD::MakeLTRB(l, t, r, b);
    }
    return true;
}

RectD PathShape::bounds() const {
    if (coords_.empty()) return {};
    f64 l = coords_[0], t = coords_[1], r = l, b = t;
    for (size_t i = 2; i + 1 < coords_.size(); i += 2) {
        l = std::min(l, coords_[i]);
        r = std::max(r, coords_[i]);
        t = std::min(t, coords_[i + 1]);
        b = std::max(b, coords_[i + 1]);
    }
    return RectD::MakeLTRB(l, t, r, b);
}

std::unique_ptr<PathIterator> PathShape::pathIterator(const AffineTransform* at) const {
    return iteratorFor(*this, at);
}

PathShape makePolygon(const PointD* pts, i32 n, bool close) {
    PathShape p;
    if (!pts || n < 1) return p;
    p.moveTo(pts[0].x, pts[0].y);
    for (i32 i = 1; i < n; ++i) {
        p.lineTo(pts[i].x, pts[i].y);
    }
    if (close) {
        p.closePath();
    }
    return p;
}

}
