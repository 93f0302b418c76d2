#pragma once

#include "etch/affine_transform.hpp"
#include "etch/canvas.hpp"

namespace etch {

/// @brief Keeps a user-space transform and a canvas matrix in step.
///
/// Every mutation updates the retained AffineTransform and issues the
/// equivalent call on the canvas, so transform() never has to query the
/// backend.
class TransformTracker {
public:
    explicit TransformTracker(Canvas* canvas) : canvas_(canvas) {}

    const AffineTransform& transform() const { return transform_; }

    void translate(f64 tx, f64 ty);
    void rotate(f64 theta);
    /// translate(x, y), rotate(theta), translate(-x, -y).
    void rotate(f64 theta, f64 x, f64 y);
    void scale(f64 sx, f64 sy);
    void shear(f64 shx, f64 shy);

    /// @brief Append t (t applies to coordinates first).
    void concatenate(const AffineTransform& t);

    /// @brief Replace the transform and set the canvas matrix to match.
    void setTransform(const AffineTransform& t);

    /// @brief Push the retained transform to the canvas again (after a restore).
    void reapply();

    static Matrix ToMatrix(const AffineTransform& t);

private:
    Canvas* canvas_;
    AffineTransform transform_;
};

}
