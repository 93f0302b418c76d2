#include "etch/matrix.hpp"
#include <algorithm>
#include <cmath>

namespace etch {

namespace {

constexpr f64 kPi = 3.14159265358979323846;

// sin/cos of multiples of 90 degrees come back as tiny non-zero values.
f32 snapToZero(f64 v) {
    return std::fabs(v) < 1e-7 ? 0.0f : static_cast<f32>(v);
}

}

Matrix Matrix::MakeAll(f32 scaleX, f32 skewX, f32 transX,
                       f32 skewY, f32 scaleY, f32 transY,
                       f32 persp0, f32 persp1, f32 persp2) {
    Matrix m;
    m.m_[kScaleX] = scaleX;
    m.m_[kSkewX] = skewX;
    m.m_[kTransX] = transX;
    m.m_[kSkewY] = skewY;
    m.m_[kScaleY] = scaleY;
    m.m_[kTransY] = transY;
    m.m_[kPersp0] = persp0;
    m.m_[kPersp1] = persp1;
    m.m_[kPersp2] = persp2;
    return m;
}

Matrix Matrix::MakeTranslate(f32 dx, f32 dy) {
    return MakeAll(1, 0, dx, 0, 1, dy);
}

Matrix Matrix::MakeScale(f32 sx, f32 sy) {
    return MakeAll(sx, 0, 0, 0, sy, 0);
}

Matrix Matrix::MakeRotate(f32 degrees) {
    f64 rad = static_cast<f64>(degrees) * kPi / 180.0;
    f32 s = snapToZero(std::sin(rad));
    f32 c = snapToZero(std::cos(rad));
    return MakeAll(c, -s, 0, s, c, 0);
}

Matrix Matrix::MakeSkew(f32 kx, f32 ky) {
    return MakeAll(1, kx, 0, ky, 1, 0);
}

Matrix Matrix::Concat(const Matrix& a, const Matrix& b) {
    Matrix r;
    for (int row = 0; row < 3; ++row) {
        for (int col = 0; col < 3; ++col) {
            r.m_[row * 3 + col] = a.m_[row * 3 + 0] * b.m_[0 * 3 + col]
                                + a.m_[row * 3 + 1] * b.m_[1 * 3 + col]
                                + a.m_[row * 3 + 2] * b.m_[2 * 3 + col];
        }
    }
    return r;
}

bool Matrix::isIdentity() const {
    return *this == Matrix();
}

Matrix& Matrix::preConcat(const Matrix& other) {
    *this = Concat(*this, other);
    return *this;
}

Point Matrix::mapPoint(Point p) const {
    f32 x = m_[kScaleX] * p.x + m_[kSkewX] * p.y + m_[kTransX];
    f32 y = m_[kSkewY] * p.x + m_[kScaleY] * p.y + m_[kTransY];
    f32 w = m_[kPersp0] * p.x + m_[kPersp1] * p.y + m_[kPersp2];
    if (w != 0 && w != 1) {
        x /= w;
        y /= w;
    }
    return {x, y};
}

Rect Matrix::mapRect(const Rect& r) const {
    Point corners[4] = {
        mapPoint({r.x, r.y}),
        mapPoint({r.right(), r.y}),
        mapPoint({r.right(), r.bottom()}),
        mapPoint({r.x, r.bottom()}),
    };
    f32 l = corners[0].x, t = corners[0].y, rr = corners[0].x, b = corners[0].y;
    for (const Point& p : corners) {
        l = std::min(l, p.x);
        t = std::min(t, p.y);
        rr = std::max(rr, p.x);
        b = std::max(b, p.y);
    }
    return Rect::MakeLTRB(l, t, rr, b);
}

bool Matrix::operator==(const Matrix& o) const {
    return std::equal(m_, m_ + 9, o.m_);
}

}
