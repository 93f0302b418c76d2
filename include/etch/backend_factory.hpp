#pragma once

/**
 * @file backend_factory.hpp
 * @brief Construction of immutable backend objects (shaders, effects, typefaces).
 */

#include "etch/types.hpp"
#include "etch/paint.hpp"
#include "etch/typeface.hpp"
#include <memory>
#include <string>
#include <vector>

namespace etch {

/// @brief Builds the immutable objects a Paint or Font refers to.
///
/// Shader and typeface construction is the expensive part of a backend, so
/// callers are expected to construct once and reuse the returned handles.
class BackendFactory {
public:
    virtual ~BackendFactory() = default;

    virtual std::shared_ptr<const Shader> makeColorShader(Color color) = 0;

    /// @param positions Stop positions in [0, 1]; empty for evenly spaced colors.
    virtual std::shared_ptr<const Shader> makeLinearGradient(
        Point start, Point end,
        const std::vector<Color>& colors, const std::vector<f32>& positions,
        TileMode mode) = 0;

    virtual std::shared_ptr<const Shader> makeRadialGradient(
        Point center, f32 radius,
        const std::vector<Color>& colors, const std::vector<f32>& positions,
        TileMode mode) = 0;

    virtual std::shared_ptr<const Shader> makeTwoPointConicalGradient(
        Point start, f32 startRadius, Point end, f32 endRadius,
        const std::vector<Color>& colors, const std::vector<f32>& positions,
        TileMode mode) = 0;

    /// @brief Build a dash effect.
    /// @throws std::invalid_argument if the interval array is malformed.
    virtual std::shared_ptr<const PathEffect> makeDashPathEffect(
        const std::vector<f32>& intervals, f32 phase) = 0;

    /// @brief Resolve a physical family name and style to a typeface. Never null.
    virtual std::shared_ptr<const Typeface> makeTypeface(const std::string& family,
                                                         FontStyle style) = 0;

    /// @brief The stock factory: plain shader descriptions and fontconfig/stb_truetype typefaces.
    static std::shared_ptr<BackendFactory> MakeDefault();
};

}
