#include "etch/recording_canvas.hpp"
#include "etch/image.hpp"
#include <algorithm>

namespace etch {

namespace {

Rect intersect(const Rect& a, const Rect& b) {
    f32 l = std::max(a.x, b.x);
    f32 t = std::max(a.y, b.y);
    f32 r = std::min(a.right(), b.right());
    f32 bt = std::min(a.bottom(), b.bottom());
    if (!(r > l && bt > t)) return {};
    return Rect::MakeLTRB(l, t, r, bt);
}

Rect outsetRect(const Rect& r, f32 d) {
    return {r.x - d, r.y - d, r.w + 2 * d, r.h + 2 * d};
}

}

RecordingCanvas::RecordingCanvas(i32 width, i32 height)
    : width_(width), height_(height) {
    current_.clip = {0, 0, f32(width), f32(height)};
}

i32 RecordingCanvas::save() {
    i32 before = saveCount();
    stack_.push_back(current_);
    recorder_.save();
    return before;
}

void RecordingCanvas::restoreToCount(i32 count) {
    count = std::max(count, 1);
    while (saveCount() > count) {
        current_ = stack_.back();
        stack_.pop_back();
        recorder_.restore();
    }
}

void RecordingCanvas::setMatrix(const Matrix& m) {
    current_.matrix = m;
    recorder_.setMatrix(m);
}

void RecordingCanvas::translate(f32 dx, f32 dy) {
    concat(Matrix::MakeTranslate(dx, dy));
}

void RecordingCanvas::rotate(f32 degrees) {
    concat(Matrix::MakeRotate(degrees));
}

void RecordingCanvas::scale(f32 sx, f32 sy) {
    concat(Matrix::MakeScale(sx, sy));
}

void RecordingCanvas::skew(f32 kx, f32 ky) {
    concat(Matrix::MakeSkew(kx, ky));
}

void RecordingCanvas::concat(const Matrix& m) {
    current_.matrix.preConcat(m);
    recorder_.concat(m);
}

void RecordingCanvas::clipPath(const Path& path, bool antiAlias) {
    Rect device = path.isEmpty() ? Rect{} : current_.matrix.mapRect(path.bounds());
    current_.clip = intersect(current_.clip, device);
    recorder_.clipPath(path, antiAlias);
}

f32 RecordingCanvas::strokeOutset(const Paint& paint) {
    if (paint.mode() != PaintMode::Stroke) return 0;
    // Hairlines still cover a pixel.
    return std::max(paint.strokeWidth() / 2, 0.5f);
}

bool RecordingCanvas::quickReject(const Rect& localBounds, f32 outset) {
    if (current_.clip.isEmpty()) {
        ++rejected_;
        return true;
    }
    Rect device = current_.matrix.mapRect(outsetRect(localBounds, outset));
    const Rect& clip = current_.clip;
    bool overlaps = device.x < clip.right() && clip.x < device.right() &&
                    device.y < clip.bottom() && clip.y < device.bottom();
    if (!overlaps) {
        ++rejected_;
        return true;
    }
    return false;
}

void RecordingCanvas::drawLine(f32 x0, f32 y0, f32 x1, f32 y1, const Paint& paint) {
    Rect bounds = Rect::MakeLTRB(std::min(x0, x1), std::min(y0, y1),
                                 std::max(x0, x1), std::max(y0, y1));
    if (quickReject(bounds, std::max(paint.strokeWidth() / 2, 0.5f))) return;
    recorder_.drawLine({x0, y0}, {x1, y1}, paint);
}

void RecordingCanvas::drawRect(const Rect& r, const Paint& paint) {
    if (quickReject(r, strokeOutset(paint))) return;
    recorder_.drawRect(r, paint);
}

void RecordingCanvas::drawOval(const Rect& oval, const Paint& paint) {
    if (quickReject(oval, strokeOutset(paint))) return;
    recorder_.drawOval(oval, paint);
}

void RecordingCanvas::drawPath(const Path& path, const Paint& paint) {
    if (path.isEmpty()) return;
    if (quickReject(path.bounds(), strokeOutset(paint))) return;
    recorder_.drawPath(path, paint);
}

void RecordingCanvas::drawImageRect(const std::shared_ptr<Image>& image,
                                    const Rect& src, const Rect& dst,
                                    const Paint* paint) {
    if (!image) return;
    if (quickReject(dst, 0)) return;
    recorder_.drawImageRect(image, src, dst, paint);
}

void RecordingCanvas::drawString(std::string_view text, f32 x, f32 y,
                                 const Font& font, const Paint& paint) {
    if (text.empty()) return;
    f32 advance = font.measureText(text);
    if (advance > 0) {
        FontMetricsData m = font.metrics();
        Rect bounds = {x, y + m.ascent, advance, m.descent - m.ascent};
        if (quickReject(bounds, 1)) return;
    } else if (current_.clip.isEmpty()) {
        ++rejected_;
        return;
    }
    recorder_.drawString({x, y}, text, font, paint);
}

std::unique_ptr<Recording> RecordingCanvas::finishRecording() {
    return recorder_.finish();
}

}
