#pragma once
#include "etch/draw_op_visitor.hpp"
#include "etch/canvas.hpp"
#include "etch/recording.hpp"

namespace etch {

/// Replays a Recording onto another Canvas.
class CanvasPlayer : public DrawOpVisitor {
    Canvas* canvas_;
public:
    explicit CanvasPlayer(Canvas* canvas);

    /// Replay every op, then restore the target to its save count before the call.
    void play(const Recording& recording);

    void visitSave() override;
    void visitRestore() override;
    void visitSetMatrix(const Matrix& m) override;
    void visitConcat(const Matrix& m) override;
    void visitClipPath(const Path& path, bool antiAlias) override;
    void visitDrawLine(Point p0, Point p1, const Paint& paint) override;
    void visitDrawRect(const Rect& r, const Paint& paint) override;
    void visitDrawOval(const Rect& r, const Paint& paint) override;
    void visitDrawPath(const Path& path, const Paint& paint) override;
    void visitDrawImageRect(const std::shared_ptr<Image>& image,
                            const Rect& src, const Rect& dst,
                            const Paint* paint) override;
    void visitDrawString(Point pos, const char* text, u32 len,
                         const Font& font, const Paint& paint) override;
};

}
