#include "etch/transform_tracker.hpp"

namespace etch {

namespace {
constexpr f64 kRadToDeg = 180.0 / 3.14159265358979323846;
}

void TransformTracker::translate(f64 tx, f64 ty) {
    transform_.translate(tx, ty);
    canvas_->translate(f32(tx), f32(ty));
}

void TransformTracker::rotate(f64 theta) {
    transform_.rotate(theta);
    canvas_->rotate(f32(theta * kRadToDeg));
}

void TransformTracker::rotate(f64 theta, f64 x, f64 y) {
    translate(x, y);
    rotate(theta);
    translate(-x, -y);
}

void TransformTracker::scale(f64 sx, f64 sy) {
    transform_.scale(sx, sy);
    canvas_->scale(f32(sx), f32(sy));
}

void TransformTracker::shear(f64 shx, f64 shy) {
    transform_.shear(shx, shy);
    canvas_->skew(f32(shx), f32(shy));
}

void TransformTracker::concatenate(const AffineTransform& t) {
    AffineTransform combined = transform_;
    combined.concatenate(t);
    setTransform(combined);
}

void TransformTracker::setTransform(const AffineTransform& t) {
    transform_ = t;
    reapply();
}

void TransformTracker::reapply() {
    canvas_->setMatrix(ToMatrix(transform_));
}

Matrix TransformTracker::ToMatrix(const AffineTransform& t) {
    return Matrix::MakeAll(f32(t.scaleX()), f32(t.shearX()), f32(t.translateX()),
                           f32(t.shearY()), f32(t.scaleY()), f32(t.translateY()));
}

}
