#include "etch/path_builder.hpp"
#include "etch/errors.hpp"

namespace etch {

Path PathBuilder::Build(const Shape& shape, const AffineTransform* at) {
    auto it = shape.pathIterator(at);
    return Build(*it);
}

Path PathBuilder::Build(PathIterator& it) {
    Path p;
    f64 c[6];
    while (!it.isDone()) {
        SegmentType type = it.currentSegment(c);
        switch (type) {
            case SegmentType::MoveTo:
                p.moveTo(f32(c[0]), f32(c[1]));
                break;
            case SegmentType::LineTo:
                p.lineTo(f32(c[0]), f32(c[1]));
                break;
            case SegmentType::QuadTo:
                p.quadTo(f32(c[0]), f32(c[1]), f32(c[2]), f32(c[3]));
                break;
            case SegmentType::CubicTo:
                p.cubicTo(f32(c[0]), f32(c[1]), f32(c[2]), f32(c[3]), f32(c[4]), f32(c[5]));
                break;
            case SegmentType::Close:
                p.close();
                break;
            default:
                throw UnsupportedSegmentError(static_cast<int>(type));
        }
        it.next();
    }
    return p;
}

}
