#include "etch/stroke_translator.hpp"
#include "etch/log.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace etch {

StrokeTranslator::StrokeTranslator(std::shared_ptr<BackendFactory> factory)
    : factory_(std::move(factory)) {
}

StrokeCap StrokeTranslator::ToCap(LineCap cap) {
    switch (cap) {
        case LineCap::Butt: return StrokeCap::Butt;
        case LineCap::Round: return StrokeCap::Round;
        case LineCap::Square: return StrokeCap::Square;
    }
    throw std::invalid_argument("Unrecognised cap code: " + std::to_string(static_cast<int>(cap)));
}

StrokeJoin StrokeTranslator::ToJoin(LineJoin join) {
    switch (join) {
        case LineJoin::Miter: return StrokeJoin::Miter;
        case LineJoin::Round: return StrokeJoin::Round;
        case LineJoin::Bevel: return StrokeJoin::Bevel;
    }
    throw std::invalid_argument("Unrecognised join code: " + std::to_string(static_cast<int>(join)));
}

void StrokeTranslator::validate(const StrokeSpec& spec) const {
    if (!(spec.width >= 0) || !std::isfinite(spec.width)) {
        throw std::invalid_argument("stroke width must be a finite value >= 0");
    }
    if (!(spec.miterLimit >= 1)) {
        throw std::invalid_argument("miter limit must be >= 1");
    }
    ToCap(spec.cap);
    ToJoin(spec.join);
}

bool StrokeTranslator::apply(const StrokeSpec& spec, Paint& paint) {
    if (spec == current_) {
        return false;
    }
    reset(spec, paint);
    return true;
}

void StrokeTranslator::reset(const StrokeSpec& spec, Paint& paint) {
    validate(spec);
    install(spec, paint);
    current_ = spec;
}

void StrokeTranslator::install(const StrokeSpec& spec, Paint& paint) {
    paint.setStrokeWidth(std::max(spec.width, kMinStrokeWidth));
    paint.setStrokeCap(ToCap(spec.cap));
    paint.setStrokeJoin(ToJoin(spec.join));
    paint.setStrokeMiter(spec.miterLimit);

    if (spec.dash.empty()) {
        paint.setPathEffect(nullptr);
        return;
    }

    // An odd pattern repeats with on and off swapped.
    std::vector<f32> intervals = spec.dash;
    if (intervals.size() % 2 != 0) {
        intervals.insert(intervals.end(), spec.dash.begin(), spec.dash.end());
    }
    try {
        paint.setPathEffect(factory_->makeDashPathEffect(intervals, spec.dashPhase));
    } catch (const std::invalid_argument& e) {
        logWarning("stroke: dash rejected (%s), drawing solid", e.what());
        paint.setPathEffect(nullptr);
    }
}

}
