#include "etch/affine_transform.hpp"
#include <cmath>

namespace etch {

namespace {

// sin/cos of multiples of pi/2 come back as ~1e-16 instead of 0.
constexpr f64 kTrigSnap = 1e-15;

void sinCos(f64 theta, f64* s, f64* c) {
    *s = std::sin(theta);
    *c = std::cos(theta);
    if (std::fabs(*s) < kTrigSnap) *s = 0;
    if (std::fabs(*c) < kTrigSnap) *c = 0;
}

}

RectI enclosingRect(const RectD& r) {
    i32 l = i32(std::floor(r.x));
    i32 t = i32(std::floor(r.y));
    i32 rr = i32(std::ceil(r.right()));
    i32 b = i32(std::ceil(r.bottom()));
    return {l, t, rr - l, b - t};
}

AffineTransform AffineTransform::MakeTranslate(f64 tx, f64 ty) {
    return AffineTransform(1, 0, tx, 0, 1, ty);
}

AffineTransform AffineTransform::MakeScale(f64 sx, f64 sy) {
    return AffineTransform(sx, 0, 0, 0, sy, 0);
}

AffineTransform AffineTransform::MakeRotate(f64 theta) {
    f64 s, c;
    sinCos(theta, &s, &c);
    return AffineTransform(c, -s, 0, s, c, 0);
}

AffineTransform AffineTransform::MakeRotate(f64 theta, f64 anchorX, f64 anchorY) {
    AffineTransform t = MakeTranslate(anchorX, anchorY);
    t.rotate(theta);
    t.translate(-anchorX, -anchorY);
    return t;
}

AffineTransform AffineTransform::MakeShear(f64 shx, f64 shy) {
    return AffineTransform(1, shx, 0, shy, 1, 0);
}

bool AffineTransform::isIdentity() const {
    return sx_ == 1 && shx_ == 0 && tx_ == 0 && shy_ == 0 && sy_ == 1 && ty_ == 0;
}

void AffineTransform::translate(f64 tx, f64 ty) {
    tx_ += sx_ * tx + shx_ * ty;
    ty_ += shy_ * tx + sy_ * ty;
}

void AffineTransform::rotate(f64 theta) {
    concatenate(MakeRotate(theta));
}

void AffineTransform::rotate(f64 theta, f64 anchorX, f64 anchorY) {
    translate(anchorX, anchorY);
    rotate(theta);
    translate(-anchorX, -anchorY);
}

void AffineTransform::scale(f64 sx, f64 sy) {
    sx_ *= sx;
    shy_ *= sx;
    shx_ *= sy;
    sy_ *= sy;
}

void AffineTransform::shear(f64 shx, f64 shy) {
    concatenate(MakeShear(shx, shy));
}

void AffineTransform::concatenate(const AffineTransform& o) {
    f64 sx = sx_ * o.sx_ + shx_ * o.shy_;
    f64 shx = sx_ * o.shx_ + shx_ * o.sy_;
    f64 tx = sx_ * o.tx_ + shx_ * o.ty_ + tx_;
    f64 shy = shy_ * o.sx_ + sy_ * o.shy_;
    f64 sy = shy_ * o.shx_ + sy_ * o.sy_;
    f64 ty = shy_ * o.tx_ + sy_ * o.ty_ + ty_;
    *this = AffineTransform(sx, shx, tx, shy, sy, ty);
}

void AffineTransform::preConcatenate(const AffineTransform& o) {
    AffineTransform result = o;
    result.concatenate(*this);
    *this = result;
}

std::optional<AffineTransform> AffineTransform::createInverse() const {
    f64 det = determinant();
    if (det == 0 || !std::isfinite(det)) {
        return std::nullopt;
    }
    return AffineTransform( sy_ / det, -shx_ / det, (shx_ * ty_ - sy_ * tx_) / det,
                           -shy_ / det,  sx_ / det, (shy_ * tx_ - sx_ * ty_) / det);
}

PointD AffineTransform::transform(PointD p) const {
    return {sx_ * p.x + shx_ * p.y + tx_, shy_ * p.x + sy_ * p.y + ty_};
}

PointD AffineTransform::deltaTransform(PointD p) const {
    return {sx_ * p.x + shx_ * p.y, shy_ * p.x + sy_ * p.y};
}

void AffineTransform::transform(const f64* src, f64* dst, int n) const {
    for (int i = 0; i < n; ++i) {
        f64 x = src[2 * i];
        f64 y = src[2 * i + 1];
        dst[2 * i] = sx_ * x + shx_ * y + tx_;
        dst[2 * i + 1] = shy_ * x + sy_ * y + ty_;
    }
}

RectD AffineTransform::transformBounds(const RectD& r) const {
    f64 pts[8] = {r.x, r.y, r.right(), r.y, r.right(), r.bottom(), r.x, r.bottom()};
    transform(pts, pts, 4);
    f64 l = pts[0], t = pts[1], rr = pts[0], b = pts[1];
    for (int i = 1; i < 4; ++i) {
        l = std::min(l, pts[2 * i]);
        rr = std::max(rr, pts[2 * i]);
        t = std::min(t, pts[2 * i + 1]);
        b = std::max(b, pts[2 * i + 1]);
    }
    return RectD::MakeLTRB(l, t, rr, b);
}

bool AffineTransform::operator==(const AffineTransform& o) const {
    return sx_ == o.sx_ && shx_ == o.shx_ && tx_ == o.tx_ &&
           shy_ == o.shy_ && sy_ == o.sy_ && ty_ == o.ty_;
}

}
