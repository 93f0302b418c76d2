#include "etch/recording.hpp"
#include "etch/draw_op_visitor.hpp"
#include "etch/image.hpp"

namespace etch {

// --- DrawOpArena ---

DrawOpArena::DrawOpArena(size_t initialCapacity) {
    data_.reserve(initialCapacity);
}

u32 DrawOpArena::allocate(size_t bytes) {
    u32 offset = static_cast<u32>(data_.size());
    data_.resize(data_.size() + bytes);
    return offset;
}

u32 DrawOpArena::storeString(std::string_view str) {
    u32 offset = allocate(str.size() + 1);
    if (!str.empty()) {
        std::memcpy(data_.data() + offset, str.data(), str.size());
    }
    data_[offset + str.size()] = '\0';
    return offset;
}

const char* DrawOpArena::getString(u32 offset) const {
    return reinterpret_cast<const char*>(data_.data() + offset);
}

void DrawOpArena::reset() {
    data_.clear();
}

// --- Recording ---

Recording::Recording(std::vector<CompactDrawOp> ops, DrawOpArena arena,
                     std::vector<Paint> paints, std::vector<Path> paths,
                     std::vector<Font> fonts, std::vector<std::shared_ptr<Image>> images)
    : ops_(std::move(ops)), arena_(std::move(arena)),
      paints_(std::move(paints)), paths_(std::move(paths)),
      fonts_(std::move(fonts)), images_(std::move(images)) {
}

const Image* Recording::getImage(u32 index) const {
    if (index < images_.size()) {
        return images_[index].get();
    }
    return nullptr;
}

size_t Recording::countOps(DrawOp::Type type) const {
    size_t n = 0;
    for (const auto& op : ops_) {
        if (op.type == type) ++n;
    }
    return n;
}

size_t Recording::countDraws() const {
    size_t n = 0;
    for (const auto& op : ops_) {
        switch (op.type) {
            case DrawOp::Type::Save:
            case DrawOp::Type::Restore:
            case DrawOp::Type::SetMatrix:
            case DrawOp::Type::Concat:
            case DrawOp::Type::ClipPath:
                break;
            default:
                ++n;
                break;
        }
    }
    return n;
}

Matrix Recording::matrixOf(const CompactDrawOp& op) {
    const f32* m = op.data.matrix.m;
    return Matrix::MakeAll(m[0], m[1], m[2], m[3], m[4], m[5], m[6], m[7], m[8]);
}

void Recording::dispatchOp(const CompactDrawOp& op, DrawOpVisitor& visitor) const {
    switch (op.type) {
        case DrawOp::Type::Save:
            visitor.visitSave();
            break;
        case DrawOp::Type::Restore:
            visitor.visitRestore();
            break;
        case DrawOp::Type::SetMatrix:
            visitor.visitSetMatrix(matrixOf(op));
            break;
        case DrawOp::Type::Concat:
            visitor.visitConcat(matrixOf(op));
            break;
        case DrawOp::Type::ClipPath:
            visitor.visitClipPath(paths_[op.data.path.pathIndex],
                                  (op.flags & CompactDrawOp::kAntiAliasFlag) != 0);
            break;
        case DrawOp::Type::DrawLine:
            visitor.visitDrawLine(op.data.line.p0, op.data.line.p1, paints_[op.paintIndex]);
            break;
        case DrawOp::Type::DrawRect:
            visitor.visitDrawRect(op.data.rect.rect, paints_[op.paintIndex]);
            break;
        case DrawOp::Type::DrawOval:
            visitor.visitDrawOval(op.data.rect.rect, paints_[op.paintIndex]);
            break;
        case DrawOp::Type::DrawPath:
            visitor.visitDrawPath(paths_[op.data.path.pathIndex], paints_[op.paintIndex]);
            break;
        case DrawOp::Type::DrawImageRect:
            visitor.visitDrawImageRect(
                images_[op.data.image.imageIndex],
                op.data.image.src, op.data.image.dst,
                (op.flags & CompactDrawOp::kHasPaintFlag) ? &paints_[op.paintIndex] : nullptr);
            break;
        case DrawOp::Type::DrawString:
            visitor.visitDrawString(
                op.data.text.pos,
                arena_.getString(op.data.text.offset),
                op.data.text.len,
                fonts_[op.data.text.fontIndex],
                paints_[op.paintIndex]);
            break;
    }
}

void Recording::accept(DrawOpVisitor& visitor) const {
    for (const auto& op : ops_) {
        dispatchOp(op, visitor);
    }
}

// --- Recorder ---

void Recorder::reset() {
    ops_.clear();
    arena_.reset();
    paints_.clear();
    paths_.clear();
    fonts_.clear();
    images_.clear();
}

CompactDrawOp Recorder::makeOp(DrawOp::Type type) {
    CompactDrawOp op{};
    op.type = type;
    return op;
}

u32 Recorder::addPaint(const Paint& paint) {
    paints_.push_back(paint);
    return static_cast<u32>(paints_.size() - 1);
}

void Recorder::save() {
    ops_.push_back(makeOp(DrawOp::Type::Save));
}

void Recorder::restore() {
    ops_.push_back(makeOp(DrawOp::Type::Restore));
}

void Recorder::setMatrix(const Matrix& m) {
    CompactDrawOp op = makeOp(DrawOp::Type::SetMatrix);
    for (int i = 0; i < 9; ++i) op.data.matrix.m[i] = m[i];
    ops_.push_back(op);
}

void Recorder::concat(const Matrix& m) {
    CompactDrawOp op = makeOp(DrawOp::Type::Concat);
    for (int i = 0; i < 9; ++i) op.data.matrix.m[i] = m[i];
    ops_.push_back(op);
}

void Recorder::clipPath(const Path& path, bool antiAlias) {
    CompactDrawOp op = makeOp(DrawOp::Type::ClipPath);
    op.flags = antiAlias ? CompactDrawOp::kAntiAliasFlag : 0;
    op.data.path.pathIndex = static_cast<u32>(paths_.size());
    paths_.push_back(path);
    ops_.push_back(op);
}

void Recorder::drawLine(Point p0, Point p1, const Paint& paint) {
    CompactDrawOp op = makeOp(DrawOp::Type::DrawLine);
    op.paintIndex = addPaint(paint);
    op.data.line.p0 = p0;
    op.data.line.p1 = p1;
    ops_.push_back(op);
}

void Recorder::drawRect(const Rect& r, const Paint& paint) {
    CompactDrawOp op = makeOp(DrawOp::Type::DrawRect);
    op.paintIndex = addPaint(paint);
    op.data.rect.rect = r;
    ops_.push_back(op);
}

void Recorder::drawOval(const Rect& r, const Paint& paint) {
    CompactDrawOp op = makeOp(DrawOp::Type::DrawOval);
    op.paintIndex = addPaint(paint);
    op.data.rect.rect = r;
    ops_.push_back(op);
}

void Recorder::drawPath(const Path& path, const Paint& paint) {
    CompactDrawOp op = makeOp(DrawOp::Type::DrawPath);
    op.paintIndex = addPaint(paint);
    op.data.path.pathIndex = static_cast<u32>(paths_.size());
    paths_.push_back(path);
    ops_.push_back(op);
}

void Recorder::drawImageRect(std::shared_ptr<Image> image, const Rect& src, const Rect& dst,
                             const Paint* paint) {
    CompactDrawOp op = makeOp(DrawOp::Type::DrawImageRect);
    if (paint) {
        op.flags = CompactDrawOp::kHasPaintFlag;
        op.paintIndex = addPaint(*paint);
    }
    op.data.image.src = src;
    op.data.image.dst = dst;
    op.data.image.imageIndex = static_cast<u32>(images_.size());
    images_.push_back(std::move(image));
    ops_.push_back(op);
}

void Recorder::drawString(Point p, std::string_view text, const Font& font, const Paint& paint) {
    CompactDrawOp op = makeOp(DrawOp::Type::DrawString);
    op.paintIndex = addPaint(paint);
    op.data.text.pos = p;
    op.data.text.offset = arena_.storeString(text);
    op.data.text.len = static_cast<u32>(text.size());
    op.data.text.fontIndex = static_cast<u32>(fonts_.size());
    fonts_.push_back(font);
    ops_.push_back(op);
}

std::unique_ptr<Recording> Recorder::finish() {
    auto recording = std::make_unique<Recording>(std::move(ops_), std::move(arena_),
                                                 std::move(paints_), std::move(paths_),
                                                 std::move(fonts_), std::move(images_));
    reset();
    return recording;
}

}
