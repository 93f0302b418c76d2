#pragma once

/**
 * @file surface.hpp
 * @brief Top-level drawing target owning a backend canvas.
 */

#include "etch/types.hpp"
#include "etch/recording_canvas.hpp"
#include "etch/recording.hpp"
#include <memory>

namespace etch {

/// @brief Top-level drawing target.
///
/// A Surface owns a RecordingCanvas. The canvas is handed out as a
/// shared_ptr so that graphics contexts drawing on it can keep it alive.
class Surface {
public:
    /// @brief Create a recording-only surface.
    /// @param w Width in pixels.
    /// @param h Height in pixels.
    /// @return Unique pointer to the new Surface, or nullptr if either size is not positive.
    static std::unique_ptr<Surface> MakeRecording(i32 w, i32 h);

    ~Surface();

    /// @brief Get the Canvas used for drawing on this surface.
    RecordingCanvas* canvas() const { return canvas_.get(); }

    /// @brief Shared handle to the same canvas.
    const std::shared_ptr<RecordingCanvas>& sharedCanvas() const { return canvas_; }

    i32 width() const { return canvas_->width(); }
    i32 height() const { return canvas_->height(); }

    /// @brief Take ownership of everything recorded so far.
    /// @return Unique pointer to the Recording.
    std::unique_ptr<Recording> takeRecording();

private:
    explicit Surface(std::shared_ptr<RecordingCanvas> canvas);

    std::shared_ptr<RecordingCanvas> canvas_;
};

}
