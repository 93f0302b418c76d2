#pragma once

/**
 * @file draw_op_visitor.hpp
 * @brief Visitor interface for traversing recorded canvas operations.
 */

#include "etch/types.hpp"
#include "etch/matrix.hpp"
#include "etch/paint.hpp"
#include "etch/path.hpp"
#include "etch/typeface.hpp"
#include <memory>

namespace etch {

class Image;

/// @brief Visitor interface for traversing recorded canvas operations.
///
/// Implement this interface to process commands dispatched by
/// Recording::accept().
class DrawOpVisitor {
public:
    virtual ~DrawOpVisitor() = default;

    virtual void visitSave() = 0;
    virtual void visitRestore() = 0;
    virtual void visitSetMatrix(const Matrix& m) = 0;
    virtual void visitConcat(const Matrix& m) = 0;

    /// @brief Visit a clip intersection.
    /// @param path Clip outline in the local coordinates at record time.
    /// @param antiAlias Whether the clip edge is anti-aliased.
    virtual void visitClipPath(const Path& path, bool antiAlias) = 0;

    virtual void visitDrawLine(Point p0, Point p1, const Paint& paint) = 0;
    virtual void visitDrawRect(const Rect& r, const Paint& paint) = 0;
    virtual void visitDrawOval(const Rect& r, const Paint& paint) = 0;
    virtual void visitDrawPath(const Path& path, const Paint& paint) = 0;

    /// @brief Visit an image draw.
    /// @param image The image (owned by the Recording).
    /// @param src Source region in image pixels.
    /// @param dst Destination rectangle.
    /// @param paint Paint, or nullptr if none was given.
    virtual void visitDrawImageRect(const std::shared_ptr<Image>& image,
                                    const Rect& src, const Rect& dst,
                                    const Paint* paint) = 0;

    /// @brief Visit a text draw.
    /// @param pos Baseline origin.
    /// @param text UTF-8 text (not necessarily null-terminated at len).
    /// @param len Length of the text in bytes.
    virtual void visitDrawString(Point pos, const char* text, u32 len,
                                 const Font& font, const Paint& paint) = 0;
};

}
