#pragma once

/**
 * @file area.hpp
 * @brief Region intersection of two shapes.
 */

#include "etch/shape.hpp"

namespace etch {

/// @brief Default curve flattening tolerance, in the shapes' own units.
constexpr f64 kDefaultFlatness = 0.1;

/// @brief Region covered by both a and b, each filled with its own winding rule.
///
/// Curves are flattened to within `flatness`. Two axis-aligned rectangles
/// intersect to a rectangle; anything else yields a union of horizontal
/// trapezoids with non-zero winding. Disjoint inputs yield an empty path.
PathShape intersectShapes(const Shape& a, const Shape& b, f64 flatness = kDefaultFlatness);

}
