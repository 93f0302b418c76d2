#include "etch/canvas_player.hpp"
#include <string_view>

namespace etch {

CanvasPlayer::CanvasPlayer(Canvas* canvas) : canvas_(canvas) {}

void CanvasPlayer::play(const Recording& recording) {
    AutoCanvasRestore guard(canvas_);
    recording.accept(*this);
}

void CanvasPlayer::visitSave() {
    canvas_->save();
}

void CanvasPlayer::visitRestore() {
    canvas_->restoreToCount(canvas_->saveCount() - 1);
}

void CanvasPlayer::visitSetMatrix(const Matrix& m) {
    canvas_->setMatrix(m);
}

void CanvasPlayer::visitConcat(const Matrix& m) {
    canvas_->concat(m);
}

void CanvasPlayer::visitClipPath(const Path& path, bool antiAlias) {
    canvas_->clipPath(path, antiAlias);
}

void CanvasPlayer::visitDrawLine(Point p0, Point p1, const Paint& paint) {
    canvas_->drawLine(p0.x, p0.y, p1.x, p1.y, paint);
}

void CanvasPlayer::visitDrawRect(const Rect& r, const Paint& paint) {
    canvas_->drawRect(r, paint);
}

void CanvasPlayer::visitDrawOval(const Rect& r, const Paint& paint) {
    canvas_->drawOval(r, paint);
}

void CanvasPlayer::visitDrawPath(const Path& path, const Paint& paint) {
    canvas_->drawPath(path, paint);
}

void CanvasPlayer::visitDrawImageRect(const std::shared_ptr<Image>& image,
                                      const Rect& src, const Rect& dst,
                                      const Paint* paint) {
    canvas_->drawImageRect(image, src, dst, paint);
}

void CanvasPlayer::visitDrawString(Point pos, const char* text, u32 len,
                                   const Font& font, const Paint& paint) {
    canvas_->drawString(std::string_view(text, len), pos.x, pos.y, font, paint);
}

}
