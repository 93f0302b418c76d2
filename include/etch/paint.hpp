#pragma once

/**
 * @file paint.hpp
 * @brief Backend paint state, shaders and path effects.
 */

#include "etch/types.hpp"
#include <memory>
#include <vector>

namespace etch {

enum class PaintMode : u8 {
    Fill,
    Stroke
};

enum class StrokeCap : u8 {
    Butt,
    Round,
    Square
};

enum class StrokeJoin : u8 {
    Miter,
    Round,
    Bevel
};

/// @brief Porter-Duff blend modes.
enum class BlendMode : u8 {
    Clear,
    Src,
    Dst,
    SrcOver,
    DstOver,
    SrcIn,
    DstIn,
    SrcOut,
    DstOut,
    SrcATop,
    DstATop,
    Xor
};

/// @brief Gradient behavior outside the [0, 1] stop range.
enum class TileMode : u8 {
    Clamp,
    Repeat,
    Mirror
};

/// @brief Immutable description of a backend shader.
struct Shader {
    enum class Kind : u8 {
        Color,
        LinearGradient,
        RadialGradient,
        TwoPointConicalGradient
    };

    Kind kind = Kind::Color;
    Color color;                  ///< Color shaders only.
    Point start;                  ///< Linear start, radial center, conical start center.
    Point end;                    ///< Linear end, conical end center.
    f32 startRadius = 0;          ///< Radial radius, conical start radius.
    f32 endRadius = 0;            ///< Conical end radius.
    std::vector<Color> colors;    ///< Gradient colors.
    std::vector<f32> positions;   ///< Stop positions; empty means evenly spaced.
    TileMode tileMode = TileMode::Clamp;
};

/// @brief Immutable dash pattern applied to stroked geometry.
struct PathEffect {
    std::vector<f32> intervals;  ///< Alternating on/off lengths, even count.
    f32 phase = 0;
};

/// @brief Mutable backend drawing state passed with every draw call.
class Paint {
public:
    Paint& setMode(PaintMode mode) { mode_ = mode; return *this; }
    PaintMode mode() const { return mode_; }

    Paint& setColor(Color c) { color_ = c; return *this; }
    Color color() const { return color_; }

    Paint& setShader(std::shared_ptr<const Shader> shader) { shader_ = std::move(shader); return *this; }
    const std::shared_ptr<const Shader>& shader() const { return shader_; }

    Paint& setStrokeWidth(f32 w) { strokeWidth_ = w; return *this; }
    f32 strokeWidth() const { return strokeWidth_; }

    Paint& setStrokeCap(StrokeCap cap) { cap_ = cap; return *this; }
    StrokeCap strokeCap() const { return cap_; }

    Paint& setStrokeJoin(StrokeJoin join) { join_ = join; return *this; }
    StrokeJoin strokeJoin() const { return join_; }

    Paint& setStrokeMiter(f32 miter) { miter_ = miter; return *this; }
    f32 strokeMiter() const { return miter_; }

    Paint& setPathEffect(std::shared_ptr<const PathEffect> effect) { pathEffect_ = std::move(effect); return *this; }
    const std::shared_ptr<const PathEffect>& pathEffect() const { return pathEffect_; }

    Paint& setBlendMode(BlendMode mode) { blendMode_ = mode; return *this; }
    BlendMode blendMode() const { return blendMode_; }

    /// @brief Global alpha in [0, 1], applied on top of the shader.
    Paint& setAlphaf(f32 alpha) { alpha_ = alpha; return *this; }
    f32 alphaf() const { return alpha_; }

    Paint& setAntiAlias(bool aa) { antiAlias_ = aa; return *this; }
    bool isAntiAlias() const { return antiAlias_; }

private:
    PaintMode mode_ = PaintMode::Fill;
    Color color_ = {0, 0, 0, 255};
    std::shared_ptr<const Shader> shader_;
    f32 strokeWidth_ = 0;
    StrokeCap cap_ = StrokeCap::Butt;
    StrokeJoin join_ = StrokeJoin::Miter;
    f32 miter_ = 4;
    std::shared_ptr<const PathEffect> pathEffect_;
    BlendMode blendMode_ = BlendMode::SrcOver;
    f32 alpha_ = 1;
    bool antiAlias_ = false;
};

}
