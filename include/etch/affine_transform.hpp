#pragma once

/**
 * @file affine_transform.hpp
 * @brief Double-precision 2D affine transform used for user-space state.
 */

#include "etch/geometry.hpp"
#include <optional>

namespace etch {

/// @brief A 2D affine transform.
///
/// Maps (x, y) to (scaleX*x + shearX*y + translateX,
///                 shearY*x + scaleY*y + translateY).
/// The mutating operations (translate, rotate, scale, shear, concatenate)
/// all post-multiply: the new operation is applied to coordinates before
/// the existing transform, matching the order of drawing-API calls.
class AffineTransform {
public:
    /// @brief Identity transform.
    AffineTransform() = default;

    AffineTransform(f64 scaleX, f64 shearX, f64 translateX,
                    f64 shearY, f64 scaleY, f64 translateY)
        : sx_(scaleX), shx_(shearX), tx_(translateX),
          shy_(shearY), sy_(scaleY), ty_(translateY) {}

    static AffineTransform MakeTranslate(f64 tx, f64 ty);
    static AffineTransform MakeScale(f64 sx, f64 sy);
    static AffineTransform MakeRotate(f64 theta);
    static AffineTransform MakeRotate(f64 theta, f64 anchorX, f64 anchorY);
    static AffineTransform MakeShear(f64 shx, f64 shy);

    f64 scaleX() const { return sx_; }
    f64 shearX() const { return shx_; }
    f64 translateX() const { return tx_; }
    f64 shearY() const { return shy_; }
    f64 scaleY() const { return sy_; }
    f64 translateY() const { return ty_; }

    bool isIdentity() const;
    f64 determinant() const { return sx_ * sy_ - shx_ * shy_; }

    void setToIdentity() { *this = AffineTransform(); }

    void translate(f64 tx, f64 ty);
    /// @param theta Angle in radians; positive angles rotate +x toward +y.
    void rotate(f64 theta);
    void rotate(f64 theta, f64 anchorX, f64 anchorY);
    void scale(f64 sx, f64 sy);
    void shear(f64 shx, f64 shy);

    /// @brief this = this x other (other applies first).
    void concatenate(const AffineTransform& other);

    /// @brief this = other x this (other applies last).
    void preConcatenate(const AffineTransform& other);

    /// @brief The inverse, or nullopt when the determinant is zero or not finite.
    std::optional<AffineTransform> createInverse() const;

    PointD transform(PointD p) const;
    PointD deltaTransform(PointD p) const;

    /// @brief Transform n interleaved (x, y) pairs; src and dst may alias.
    void transform(const f64* src, f64* dst, int n) const;

    /// @brief Bounding box of the transformed corners of r.
    RectD transformBounds(const RectD& r) const;

    bool operator==(const AffineTransform& o) const;
    bool operator!=(const AffineTransform& o) const { return !(*this == o); }

private:
    f64 sx_ = 1, shx_ = 0, tx_ = 0;
    f64 shy_ = 0, sy_ = 1, ty_ = 0;
};

}
