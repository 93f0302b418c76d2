#include "etch/canvas.hpp"

namespace etch {

AutoCanvasRestore::AutoCanvasRestore(Canvas* canvas) : canvas_(canvas) {
    if (canvas_) {
        mark_ = canvas_->save();
    }
}

AutoCanvasRestore::~AutoCanvasRestore() {
    restore();
}

void AutoCanvasRestore::reset() {
    if (!canvas_) return;
    canvas_->restoreToCount(mark_);
    mark_ = canvas_->save();
}

void AutoCanvasRestore::restore() {
    if (!canvas_) return;
    canvas_->restoreToCount(mark_);
    canvas_ = nullptr;
}

}
