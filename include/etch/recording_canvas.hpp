#pragma once

/**
 * @file recording_canvas.hpp
 * @brief Canvas implementation that records into a Recording.
 */

#include "etch/canvas.hpp"
#include "etch/recording.hpp"
#include <memory>
#include <vector>

namespace etch {

/// @brief A Canvas that keeps its own matrix/clip stack and records every call.
///
/// The clip is tracked as device-space bounds only. Draw calls whose device
/// bounds miss the clip bounds, or any draw while the clip is empty, are
/// rejected: counted but not recorded.
class RecordingCanvas : public Canvas {
public:
    RecordingCanvas(i32 width, i32 height);

    i32 save() override;
    void restoreToCount(i32 count) override;
    i32 saveCount() const override { return static_cast<i32>(stack_.size()) + 1; }

    void setMatrix(const Matrix& m) override;
    void translate(f32 dx, f32 dy) override;
    void rotate(f32 degrees) override;
    void scale(f32 sx, f32 sy) override;
    void skew(f32 kx, f32 ky) override;
    void concat(const Matrix& m) override;
    void clipPath(const Path& path, bool antiAlias) override;

    void drawLine(f32 x0, f32 y0, f32 x1, f32 y1, const Paint& paint) override;
    void drawRect(const Rect& r, const Paint& paint) override;
    void drawOval(const Rect& oval, const Paint& paint) override;
    void drawPath(const Path& path, const Paint& paint) override;
    void drawImageRect(const std::shared_ptr<Image>& image,
                       const Rect& src, const Rect& dst,
                       const Paint* paint) override;
    void drawString(std::string_view text, f32 x, f32 y,
                    const Font& font, const Paint& paint) override;

    i32 width() const { return width_; }
    i32 height() const { return height_; }

    const Matrix& totalMatrix() const { return current_.matrix; }

    /// @brief Device-space bounds of the current clip; empty when nothing can be drawn.
    Rect deviceClipBounds() const { return current_.clip; }
    bool isClipEmpty() const { return current_.clip.isEmpty(); }

    /// @brief Draw calls dropped by the clip test since construction.
    u32 rejectedDrawCount() const { return rejected_; }

    /// @brief Operations recorded since the last finishRecording().
    size_t opCount() const { return recorder_.opCount(); }

    /// @brief Hand over everything recorded so far and start a new recording.
    ///
    /// The matrix/clip stack is not reset, so a later recording starts in the
    /// middle of whatever saves are still open.
    std::unique_ptr<Recording> finishRecording();

private:
    struct State {
        Matrix matrix;
        Rect clip;
    };

    /// @param outset Extra local-space margin for stroked geometry.
    bool quickReject(const Rect& localBounds, f32 outset);
    static f32 strokeOutset(const Paint& paint);

    Recorder recorder_;
    std::vector<State> stack_;
    State current_;
    i32 width_;
    i32 height_;
    u32 rejected_ = 0;
};

}
