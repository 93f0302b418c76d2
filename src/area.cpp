#include "etch/area.hpp"
#include <algorithm>
#include <cmath>

namespace etch {

namespace {

struct Edge {
    f64 x0, y0, x1, y1;  // y0 < y1
    int dir;             // +1 downward in source order, -1 upward
    int owner;           // 0 = first shape, 1 = second

    f64 xAt(f64 y) const {
        return x0 + (y - y0) * (x1 - x0) / (y1 - y0);
    }
};

struct Flattener {
    std::vector<Edge>* edges;
    int owner;
    f64 tolerance;
    PointD start;
    PointD current;
    bool open = false;

    void addLine(PointD a, PointD b) {
        if (a.y == b.y) return;
        if (a.y < b.y) {
            edges->push_back({a.x, a.y, b.x, b.y, 1, owner});
        } else {
            edges->push_back({b.x, b.y, a.x, a.y, -1, owner});
        }
    }

    void lineTo(PointD p) {
        addLine(current, p);
        current = p;
    }

    void cubicTo(PointD c1, PointD c2, PointD p, int depth) {
        // Subdivide until both control points sit within tolerance of the chord.
        f64 dx = p.x - current.x, dy = p.y - current.y;
        f64 len = std::sqrt(dx * dx + dy * dy);
        f64 d1, d2;
        if (len > 1e-12) {
            d1 = std::fabs((c1.x - current.x) * dy - (c1.y - current.y) * dx) / len;
            d2 = std::fabs((c2.x - current.x) * dy - (c2.y - current.y) * dx) / len;
        } else {
            d1 = std::hypot(c1.x - current.x, c1.y - current.y);
            d2 = std::hypot(c2.x - current.x, c2.y - current.y);
        }
        if ((d1 <= tolerance && d2 <= tolerance) || depth >= 16) {
            lineTo(p);
            return;
        }
        PointD p0 = current;
        PointD a{(p0.x + c1.x) / 2, (p0.y + c1.y) / 2};
        PointD m{(c1.x + c2.x) / 2, (c1.y + c2.y) / 2};
        PointD c{(c2.x + p.x) / 2, (c2.y + p.y) / 2};
        PointD b{(a.x + m.x) / 2, (a.y + m.y) / 2};
        PointD d{(m.x + c.x) / 2, (m.y + c.y) / 2};
        PointD mid{(b.x + d.x) / 2, (b.y + d.y) / 2};
        cubicTo(a, b, mid, depth + 1);
        cubicTo(d, c, p, depth + 1);
    }

    void closeSubpath() {
        if (open) {
            addLine(current, start);
            current = start;
            open = false;
        }
    }
};

WindingRule flattenShape(const Shape& s, int owner, f64 tolerance, std::vector<Edge>* edges) {
    auto it = s.pathIterator();
    Flattener f{edges, owner, tolerance, {}, {}};
    f64 c[6];
    for (; !it->isDone(); it->next()) {
        switch (it->currentSegment(c)) {
            case SegmentType::MoveTo:
                f.closeSubpath();
                f.start = f.current = {c[0], c[1]};
                f.open = true;
                break;
            case SegmentType::LineTo:
                f.lineTo({c[0], c[1]});
                f.open = true;
                break;
            case SegmentType::QuadTo: {
                PointD p0 = f.current;
                PointD q{c[0], c[1]};
                PointD p{c[2], c[3]};
                PointD c1{p0.x + 2.0 / 3.0 * (q.x - p0.x), p0.y + 2.0 / 3.0 * (q.y - p0.y)};
                PointD c2{p.x + 2.0 / 3.0 * (q.x - p.x), p.y + 2.0 / 3.0 * (q.y - p.y)};
                f.cubicTo(c1, c2, p, 0);
                f.open = true;
                break;
            }
            case SegmentType::CubicTo:
                f.cubicTo({c[0], c[1]}, {c[2], c[3]}, {c[4], c[5]}, 0);
                f.open = true;
                break;
            case SegmentType::Close:
                f.closeSubpath();
                break;
        }
    }
    f.closeSubpath();
    return it->windingRule();
}

struct Span {
    f64 left;
    f64 right;
    const Edge* leftEdge;
    const Edge* rightEdge;
};

// Interior spans of one shape along the horizontal line y = ym.
std::vector<Span> spansAt(const std::vector<Edge>& edges, int owner, WindingRule rule, f64 ym) {
    struct Crossing {
        f64 x;
        const Edge* edge;
    };
    std::vector<Crossing> xs;
    for (const auto& e : edges) {
        if (e.owner == owner && e.y0 <= ym && ym < e.y1) {
            xs.push_back({e.xAt(ym), &e});
        }
    }
    std::sort(xs.begin(), xs.end(),
              [](const Crossing& a, const Crossing& b) { return a.x < b.x; });

    std::vector<Span> spans;
    int winding = 0;
    bool inside = false;
    const Edge* enter = nullptr;
    f64 enterX = 0;
    for (const auto& c : xs) {
        winding += c.edge->dir;
        bool nowInside = rule == WindingRule::NonZero ? winding != 0 : (winding & 1) != 0;
        if (nowInside && !inside) {
            enter = c.edge;
            enterX = c.x;
        } else if (!nowInside && inside) {
            if (c.x > enterX) {
                spans.push_back({enterX, c.x, enter, c.edge});
            }
        }
        inside = nowInside;
    }
    return spans;
}

bool edgesCross(const Edge& a, const Edge& b, f64* y) {
    f64 top = std::max(a.y0, b.y0);
    f64 bottom = std::min(a.y1, b.y1);
    if (top >= bottom) return false;
    f64 da = a.xAt(top) - b.xAt(top);
    f64 db = a.xAt(bottom) - b.xAt(bottom);
    if ((da < 0 && db > 0) || (da > 0 && db < 0)) {
        *y = top + (bottom - top) * da / (da - db);
        return true;
    }
    return false;
}

PathShape rectPath(const RectD& r) {
    PathShape p;
    if (r.isEmpty()) return p;
    p.moveTo(r.x, r.y)
     .lineTo(r.right(), r.y)
     .lineTo(r.right(), r.bottom())
     .lineTo(r.x, r.bottom())
     .closePath();
    return p;
}

}

PathShape intersectShapes(const Shape& a, const Shape& b, f64 flatness) {
    if (!a.bounds().intersects(b.bounds())) {
        return PathShape();
    }

    PathShape pa(a);
    PathShape pb(b);
    RectD ra, rb;
    if (pa.isRect(&ra) && pb.isRect(&rb)) {
        return rectPath(ra.intersection(rb));
    }

    std::vector<Edge> edges;
    WindingRule ruleA = flattenShape(pa, 0, flatness, &edges);
    WindingRule ruleB = flattenShape(pb, 1, flatness, &edges);

    std::vector<f64> ys;
    ys.reserve(edges.size() * 2);
    for (const auto& e : edges) {
        ys.push_back(e.y0);
        ys.push_back(e.y1);
    }
    for (size_t i = 0; i < edges.size(); ++i) {
        for (size_t j = i + 1; j < edges.size(); ++j) {
            f64 y;
            if (edgesCross(edges[i], edges[j], &y)) {
                ys.push_back(y);
            }
        }
    }
    std::sort(ys.begin(), ys.end());
    ys.erase(std::unique(ys.begin(), ys.end()), ys.end());

    PathShape result;
    for (size_t i = 0; i + 1 < ys.size(); ++i) {
        f64 y0 = ys[i], y1 = ys[i + 1];
        if (y1 <= y0) continue;
        f64 ym = (y0 + y1) / 2;
        std::vector<Span> sa = spansAt(edges, 0, ruleA, ym);
        if (sa.empty()) continue;
        std::vector<Span> sb = spansAt(edges, 1, ruleB, ym);

        size_t ia = 0, ib = 0;
        while (ia < sa.size() && ib < sb.size()) {
            const Span& u = sa[ia];
            const Span& v = sb[ib];
            const Edge* le = u.left >= v.left ? u.leftEdge : v.leftEdge;
            const Edge* re = u.right <= v.right ? u.rightEdge : v.rightEdge;
            if (std::max(u.left, v.left) < std::min(u.right, v.right)) {
                result.moveTo(le->xAt(y0), y0)
                      .lineTo(re->xAt(y0), y0)
                      .lineTo(re->xAt(y1), y1)
                      .lineTo(le->xAt(y1), y1)
                      .closePath();
            }
            if (u.right < v.right) {
                ++ia;
            } else {
                ++ib;
            }
        }
    }
    return result;
}

}
