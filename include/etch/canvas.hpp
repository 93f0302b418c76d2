#pragma once

/**
 * @file canvas.hpp
 * @brief Backend drawing surface interface.
 */

#include "etch/types.hpp"
#include "etch/matrix.hpp"
#include "etch/paint.hpp"
#include "etch/path.hpp"
#include "etch/typeface.hpp"
#include <memory>
#include <string_view>

namespace etch {

class Image;

/// @brief A backend canvas with its own matrix and clip stack.
///
/// The only clip primitive is clipPath(), which intersects. There is no way
/// to read back or widen the clip other than restoring to an earlier save.
/// Draw calls take geometry in the canvas's current (local) coordinates.
class Canvas {
public:
    virtual ~Canvas() = default;

    /// @name Matrix and clip stack
    /// @{

    /// @brief Push the current matrix and clip.
    /// @return The save count before this call; pass it to restoreToCount().
    virtual i32 save() = 0;

    /// @brief Pop saved states until saveCount() equals count (minimum 1).
    virtual void restoreToCount(i32 count) = 0;

    /// @brief Depth of the state stack; 1 when nothing has been saved.
    virtual i32 saveCount() const = 0;

    virtual void setMatrix(const Matrix& m) = 0;
    virtual void translate(f32 dx, f32 dy) = 0;
    virtual void rotate(f32 degrees) = 0;
    virtual void scale(f32 sx, f32 sy) = 0;
    virtual void skew(f32 kx, f32 ky) = 0;

    /// @brief Pre-concatenate m onto the current matrix.
    virtual void concat(const Matrix& m) = 0;

    /// @brief Intersect the current clip with a path in local coordinates.
    virtual void clipPath(const Path& path, bool antiAlias) = 0;

    /// @}

    /// @name Drawing
    /// @{

    virtual void drawLine(f32 x0, f32 y0, f32 x1, f32 y1, const Paint& paint) = 0;
    virtual void drawRect(const Rect& r, const Paint& paint) = 0;
    virtual void drawOval(const Rect& oval, const Paint& paint) = 0;
    virtual void drawPath(const Path& path, const Paint& paint) = 0;

    /// @brief Draw the `src` region of an image scaled into `dst`.
    /// @param paint Optional paint (alpha, blend mode); null for defaults.
    virtual void drawImageRect(const std::shared_ptr<Image>& image,
                               const Rect& src, const Rect& dst,
                               const Paint* paint) = 0;

    /// @brief Draw UTF-8 text with its baseline origin at (x, y).
    virtual void drawString(std::string_view text, f32 x, f32 y,
                            const Font& font, const Paint& paint) = 0;

    /// @}
};

/// @brief Scope guard for a canvas save.
///
/// Saves on construction and restores to the recorded mark when destroyed,
/// unless restore() was already called. Guards sharing one canvas must be
/// destroyed in reverse order of construction.
class AutoCanvasRestore {
public:
    explicit AutoCanvasRestore(Canvas* canvas);
    ~AutoCanvasRestore();

    AutoCanvasRestore(const AutoCanvasRestore&) = delete;
    AutoCanvasRestore& operator=(const AutoCanvasRestore&) = delete;

    /// @brief Restore to the mark, discarding everything applied since, and save again.
    void reset();

    /// @brief Restore to the mark now; later calls and the destructor do nothing.
    void restore();

    /// @brief The save count this guard restores to.
    i32 mark() const { return mark_; }

    bool active() const { return canvas_ != nullptr; }

private:
    Canvas* canvas_;
    i32 mark_ = 0;
};

}
