#pragma once

/**
 * @file matrix.hpp
 * @brief Backend 3x3 matrix in single precision.
 */

#include "etch/types.hpp"

namespace etch {

/// @brief Row-major 3x3 matrix as consumed by a backend Canvas.
///
/// Element order: scaleX, skewX, transX, skewY, scaleY, transY, persp0,
/// persp1, persp2. Concatenation follows the canvas convention: preConcat(m)
/// makes m apply to coordinates before the existing matrix.
class Matrix {
public:
    enum Index {
        kScaleX = 0, kSkewX = 1, kTransX = 2,
        kSkewY = 3, kScaleY = 4, kTransY = 5,
        kPersp0 = 6, kPersp1 = 7, kPersp2 = 8
    };

    Matrix() = default;

    static Matrix MakeAll(f32 scaleX, f32 skewX, f32 transX,
                          f32 skewY, f32 scaleY, f32 transY,
                          f32 persp0 = 0, f32 persp1 = 0, f32 persp2 = 1);
    static Matrix MakeTranslate(f32 dx, f32 dy);
    static Matrix MakeScale(f32 sx, f32 sy);
    /// @param degrees Clockwise on a y-down device.
    static Matrix MakeRotate(f32 degrees);
    static Matrix MakeSkew(f32 kx, f32 ky);

    /// @brief a x b (b applies first).
    static Matrix Concat(const Matrix& a, const Matrix& b);

    f32 get(int index) const { return m_[index]; }
    f32 operator[](int index) const { return m_[index]; }

    bool isIdentity() const;

    Matrix& preConcat(const Matrix& other);

    Point mapPoint(Point p) const;

    /// @brief Bounding box of the four mapped corners.
    Rect mapRect(const Rect& r) const;

    bool operator==(const Matrix& o) const;
    bool operator!=(const Matrix& o) const { return !(*this == o); }

private:
    f32 m_[9] = {1, 0, 0, 0, 1, 0, 0, 0, 1};
};

}
