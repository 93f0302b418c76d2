#include "etch/surface.hpp"
#include "etch/log.hpp"

namespace etch {

Surface::Surface(std::shared_ptr<RecordingCanvas> canvas)
    : canvas_(std::move(canvas)) {
}

Surface::~Surface() = default;

std::unique_ptr<Surface> Surface::MakeRecording(i32 w, i32 h) {
    if (w <= 0 || h <= 0) {
        logError("surface: invalid size %dx%d", w, h);
        return nullptr;
    }
    return std::unique_ptr<Surface>(new Surface(std::make_shared<RecordingCanvas>(w, h)));
}

std::unique_ptr<Recording> Surface::takeRecording() {
    return canvas_->finishRecording();
}

}
