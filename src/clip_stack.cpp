#include "etch/clip_stack.hpp"
#include "etch/area.hpp"
#include "etch/log.hpp"
#include "etch/path_builder.hpp"

namespace etch {

ClipStack::ClipStack(Canvas* canvas, TransformTracker* tracker)
    : canvas_(canvas), tracker_(tracker), baseline_(canvas) {
}

void ClipStack::setClip(const Shape* shape) {
    if (released()) {
        logWarning("clip: setClip after release ignored");
        return;
    }
    baseline_.reset();
    // Restoring also reverts the canvas matrix.
    tracker_->reapply();

    if (!shape) {
        clip_.reset();
        return;
    }
    clip_.emplace(*shape, &tracker_->transform());
    canvas_->clipPath(PathBuilder::Build(*shape), antiAlias_);
}

void ClipStack::adoptClip(const std::optional<PathShape>& deviceClip) {
    if (released()) {
        logWarning("clip: adoptClip after release ignored");
        return;
    }
    baseline_.reset();
    clip_ = deviceClip;
    if (clip_) {
        canvas_->setMatrix(Matrix());
        canvas_->clipPath(PathBuilder::Build(*clip_), antiAlias_);
    }
    tracker_->reapply();
}

void ClipStack::clip(const Shape& shape) {
    if (const auto* line = dynamic_cast<const LineShape*>(&shape)) {
        RectShape bounds(line->bounds());
        clip(bounds);
        return;
    }
    if (!clip_) {
        setClip(&shape);
        return;
    }
    if (released()) {
        logWarning("clip: clip after release ignored");
        return;
    }

    PathShape device(shape, &tracker_->transform());
    if (!device.bounds().intersects(clip_->bounds())) {
        RectShape empty;
        setClip(&empty);
        return;
    }
    clip_ = intersectShapes(device, *clip_);
    canvas_->clipPath(PathBuilder::Build(shape), antiAlias_);
}

std::optional<PathShape> ClipStack::userClip() const {
    if (!clip_) return std::nullopt;
    std::optional<AffineTransform> inverse = tracker_->transform().createInverse();
    if (!inverse) {
        logDebug("clip: transform not invertible, reporting no clip");
        return std::nullopt;
    }
    return PathShape(*clip_, &*inverse);
}

}
