#include "etch/path.hpp"
#include <algorithm>

namespace etch {

Path& Path::moveTo(f32 x, f32 y) {
    verbs_.push_back(PathVerb::Move);
    points_.push_back({x, y});
    return *this;
}

Path& Path::lineTo(f32 x, f32 y) {
    verbs_.push_back(PathVerb::Line);
    points_.push_back({x, y});
    return *this;
}

Path& Path::quadTo(f32 cx, f32 cy, f32 x, f32 y) {
    verbs_.push_back(PathVerb::Quad);
    points_.push_back({cx, cy});
    points_.push_back({x, y});
    return *this;
}

Path& Path::cubicTo(f32 c1x, f32 c1y, f32 c2x, f32 c2y, f32 x, f32 y) {
    verbs_.push_back(PathVerb::Cubic);
    points_.push_back({c1x, c1y});
    points_.push_back({c2x, c2y});
    points_.push_back({x, y});
    return *this;
}

Path& Path::close() {
    verbs_.push_back(PathVerb::Close);
    return *this;
}

Rect Path::bounds() const {
    if (points_.empty()) return {};
    f32 l = points_[0].x, t = points_[0].y, r = l, b = t;
    for (const Point& p : points_) {
        l = std::min(l, p.x);
        t = std::min(t, p.y);
        r = std::max(r, p.x);
        b = std::max(b, p.y);
    }
    return Rect::MakeLTRB(l, t, r, b);
}

Path Path::transformed(const Matrix& m) const {
    Path out(*this);
    for (Point& p : out.points_) {
        p = m.mapPoint(p);
    }
    return out;
}

}
