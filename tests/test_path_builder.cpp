#include <gtest/gtest.h>
#include <etch/errors.hpp>
#include <etch/path_builder.hpp>

#include <vector>

using namespace etch;

namespace {

// Emits one segment of a kind no shape produces.
class BogusIterator : public PathIterator {
public:
    WindingRule windingRule() const override { return WindingRule::NonZero; }
    bool isDone() const override { return done_; }
    SegmentType currentSegment(f64 coords[6]) const override {
        coords[0] = coords[1] = 0;
        return static_cast<SegmentType>(7);
    }
    void next() override { done_ = true; }

private:
    bool done_ = false;
};

}

// --- Segment replay ---

TEST(PathBuilder, ReplaysEverySegmentKind) {
    PathShape s;
    s.moveTo(0, 0).lineTo(10, 0).quadTo(15, 5, 10, 10).cubicTo(8, 12, 2, 12, 0, 10).closePath();
    Path p = PathBuilder::Build(s);

    std::vector<PathVerb> expected = {
        PathVerb::Move, PathVerb::Line, PathVerb::Quad, PathVerb::Cubic, PathVerb::Close
    };
    EXPECT_EQ(p.verbs(), expected);
    ASSERT_EQ(p.countPoints(), 7u);
    EXPECT_EQ(p.points()[2], (Point{15, 5}));
    EXPECT_EQ(p.points()[6], (Point{0, 10}));
}

TEST(PathBuilder, NarrowsToSinglePrecision) {
    PathShape s;
    s.moveTo(0.1, 1.0 / 3.0);
    Path p = PathBuilder::Build(s);
    EXPECT_EQ(p.points()[0].x, 0.1f);
    EXPECT_EQ(p.points()[0].y, static_cast<f32>(1.0 / 3.0));
}

TEST(PathBuilder, AppliesTransform) {
    AffineTransform t = AffineTransform::MakeTranslate(5, 5);
    Path p = PathBuilder::Build(RectShape(0, 0, 10, 10), &t);
    EXPECT_EQ(p.bounds(), (Rect{5, 5, 10, 10}));
}

TEST(PathBuilder, FillModeLeftAtDefault) {
    PathShape s(WindingRule::EvenOdd);
    s.moveTo(0, 0).lineTo(1, 1);
    EXPECT_EQ(PathBuilder::Build(s).fillMode(), PathFillMode::Winding);
}

TEST(PathBuilder, EmptyShapeGivesEmptyPath) {
    EXPECT_TRUE(PathBuilder::Build(RectShape(0, 0, -1, -1)).isEmpty());
}

// --- Winding rules ---

TEST(PathBuilder, FillModeFor) {
    EXPECT_EQ(PathBuilder::FillModeFor(WindingRule::NonZero), PathFillMode::Winding);
    EXPECT_EQ(PathBuilder::FillModeFor(WindingRule::EvenOdd), PathFillMode::EvenOdd);
}

// --- Unknown segments ---

TEST(PathBuilder, UnknownSegmentThrows) {
    BogusIterator it;
    try {
        PathBuilder::Build(it);
        FAIL() << "expected UnsupportedSegmentError";
    } catch (const UnsupportedSegmentError& e) {
        EXPECT_EQ(e.segmentType(), 7);
    }
}
