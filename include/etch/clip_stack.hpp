#pragma once

#include "etch/canvas.hpp"
#include "etch/shape.hpp"
#include "etch/transform_tracker.hpp"
#include <optional>

namespace etch {

/// @brief Replaceable and narrowable clipping over an intersect-only canvas.
///
/// The retained clip is kept in device space. Construction saves the canvas
/// and keeps that save as the baseline: setClip() restores to it and saves
/// again, which drops every backend clip applied since; clip() pushes one
/// more intersective clip. Destruction (or release()) restores the canvas to
/// the save count it had before construction.
class ClipStack {
public:
    ClipStack(Canvas* canvas, TransformTracker* tracker);

    ClipStack(const ClipStack&) = delete;
    ClipStack& operator=(const ClipStack&) = delete;

    /// @brief Replace the clip; nullptr removes it.
    void setClip(const Shape* shape);

    /// @brief Replace the clip with a device-space clip taken as is.
    ///
    /// Used by derived contexts: the clip survives a transform that cannot
    /// be inverted and is not rounded through user space.
    void adoptClip(const std::optional<PathShape>& deviceClip);

    /// @brief Intersect the clip with a shape given in user space.
    ///
    /// A line clips to its bounds. With no current clip this is setClip().
    /// When the shape's device bounds miss the current clip bounds the clip
    /// becomes an empty rectangle.
    void clip(const Shape& shape);

    /// @brief The clip in user space, or nullopt if there is none or the
    /// transform cannot be inverted.
    std::optional<PathShape> userClip() const;

    /// @brief The clip in device space, or nullopt if there is none.
    const std::optional<PathShape>& deviceClip() const { return clip_; }

    bool hasClip() const { return clip_.has_value(); }

    void setAntiAlias(bool aa) { antiAlias_ = aa; }

    /// @brief Save count this stack restores to when released.
    i32 baselineCount() const { return baseline_.mark(); }

    /// @brief Restore the canvas to its state before construction. Idempotent.
    void release() { baseline_.restore(); }
    bool released() const { return !baseline_.active(); }

private:
    Canvas* canvas_;
    TransformTracker* tracker_;
    AutoCanvasRestore baseline_;
    std::optional<PathShape> clip_;
    bool antiAlias_ = true;
};

}
