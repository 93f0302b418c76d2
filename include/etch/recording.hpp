#pragma once

/**
 * @file recording.hpp
 * @brief Recorded canvas operations, arena allocator, recording, and recorder.
 */

#include "etch/types.hpp"
#include "etch/matrix.hpp"
#include "etch/paint.hpp"
#include "etch/path.hpp"
#include "etch/typeface.hpp"
#include <string_view>
#include <vector>
#include <memory>
#include <cstring>

namespace etch {

// Forward declarations
class DrawOpVisitor;
class Image;

/// @brief Recorded operation type tag.
struct DrawOp {
    /// @brief Operation type enumeration.
    enum class Type : u8 {
        Save,           ///< Push matrix and clip.
        Restore,        ///< Pop one saved state.
        SetMatrix,      ///< Replace the matrix.
        Concat,         ///< Pre-concatenate onto the matrix.
        ClipPath,       ///< Intersect the clip with a path.
        DrawLine,       ///< Stroke a line segment.
        DrawRect,       ///< Draw a rectangle.
        DrawOval,       ///< Draw an oval inscribed in a rectangle.
        DrawPath,       ///< Draw a path.
        DrawImageRect,  ///< Draw part of an image scaled into a rectangle.
        DrawString      ///< Draw text.
    };
};

/// @brief Arena allocator for variable-length op data (text).
class DrawOpArena {
public:
    /// @brief Construct an arena with the given initial capacity.
    /// @param initialCapacity Initial byte capacity (default 4096).
    explicit DrawOpArena(size_t initialCapacity = 4096);

    /// @brief Allocate raw storage.
    /// @param bytes Number of bytes to allocate.
    /// @return Byte offset into the arena.
    u32 allocate(size_t bytes);

    /// @brief Store a string in the arena.
    /// @param str The string to store.
    /// @return Byte offset to the stored string.
    u32 storeString(std::string_view str);

    /// @brief Retrieve a stored string by offset.
    /// @param offset Byte offset returned by storeString().
    /// @return Pointer to the null-terminated string.
    const char* getString(u32 offset) const;

    /// @brief Reset the arena, discarding all stored data.
    void reset();

    size_t size() const { return data_.size(); }

private:
    std::vector<u8> data_;
};

/// @brief Compact recorded operation.
///
/// Paints, paths, fonts and images live in side tables of the Recording and
/// are referenced by index.
struct CompactDrawOp {
    DrawOp::Type type;      ///< Operation type.
    u8 flags;               ///< ClipPath: anti-alias. DrawImageRect: has paint.
    u8 padding[2];          ///< Alignment padding.
    u32 paintIndex;         ///< Index into Recording::paints() for draw ops.

    /// @brief Union of per-operation data variants.
    union Data {
        struct { f32 m[9]; } matrix;                             ///< SetMatrix / Concat.
        struct { u32 pathIndex; } path;                          ///< ClipPath / DrawPath.
        struct { Point p0; Point p1; } line;                     ///< DrawLine.
        struct { Rect rect; } rect;                              ///< DrawRect / DrawOval.
        struct { Rect src; Rect dst; u32 imageIndex; } image;    ///< DrawImageRect.
        struct { Point pos; u32 offset; u32 len; u32 fontIndex; } text;  ///< DrawString.

        Data() : matrix{} {}
    } data;                 ///< Per-operation payload.

    static constexpr u8 kAntiAliasFlag = 1;
    static constexpr u8 kHasPaintFlag = 2;
};

/// @brief Immutable command buffer containing recorded operations.
///
/// Created by Recorder::finish(). Operations are traversed in original
/// order via accept().
class Recording {
public:
    Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena,
              std::vector<Paint> paints, std::vector<Path> paths,
              std::vector<Font> fonts, std::vector<std::shared_ptr<Image>> images);

    /// @brief Get the list of recorded operations.
    const std::vector<CompactDrawOp>& ops() const { return ops_; }
    /// @brief Get the data arena.
    const DrawOpArena& arena() const { return arena_; }
    const std::vector<Paint>& paints() const { return paints_; }
    const std::vector<Path>& paths() const { return paths_; }
    const std::vector<Font>& fonts() const { return fonts_; }
    /// @brief Get the list of referenced images.
    const std::vector<std::shared_ptr<Image>>& images() const { return images_; }

    /// @brief Get an image by index.
    /// @param index Index into the images list.
    /// @return Pointer to the Image, or nullptr if out of range.
    const Image* getImage(u32 index) const;

    /// @brief Number of recorded operations of one type.
    size_t countOps(DrawOp::Type type) const;

    /// @brief Number of recorded draw operations (everything except state ops).
    size_t countDraws() const;

    /// @brief Matrix stored in a SetMatrix or Concat op.
    static Matrix matrixOf(const CompactDrawOp& op);

    /// @brief Traverse operations in recording order.
    /// @param visitor The visitor to receive each operation.
    void accept(DrawOpVisitor& visitor) const;

private:
    void dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const;

    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
    std::vector<Paint> paints_;
    std::vector<Path> paths_;
    std::vector<Font> fonts_;
    std::vector<std::shared_ptr<Image>> images_;
};

/// @brief Records canvas operations into a compact command buffer.
///
/// Call the recording methods to accumulate operations, then finish() to
/// produce an immutable Recording.
class Recorder {
public:
    /// @brief Reset the recorder, discarding all accumulated operations.
    void reset();

    void save();
    void restore();
    void setMatrix(const Matrix& m);
    void concat(const Matrix& m);
    void clipPath(const Path& path, bool antiAlias);

    void drawLine(Point p0, Point p1, const Paint& paint);
    void drawRect(const Rect& r, const Paint& paint);
    void drawOval(const Rect& r, const Paint& paint);
    void drawPath(const Path& path, const Paint& paint);
    void drawImageRect(std::shared_ptr<Image> image, const Rect& src, const Rect& dst,
                       const Paint* paint);
    void drawString(Point p, std::string_view text, const Font& font, const Paint& paint);

    /// @brief Number of operations recorded since the last reset.
    size_t opCount() const { return ops_.size(); }

    /// @brief Finish recording and produce an immutable Recording.
    /// @return Unique pointer to the completed Recording; the recorder is left empty.
    std::unique_ptr<Recording> finish();

private:
    CompactDrawOp makeOp(DrawOp::Type type);
    u32 addPaint(const Paint& paint);

    std::vector<CompactDrawOp> ops_;
    DrawOpArena arena_;
    std::vector<Paint> paints_;
    std::vector<Path> paths_;
    std::vector<Font> fonts_;
    std::vector<std::shared_ptr<Image>> images_;
};

}
