#include <gtest/gtest.h>
#include <etch/composite.hpp>
#include <etch/errors.hpp>
#include <etch/paint_translator.hpp>

#include "test_support.hpp"

#include <stdexcept>

using namespace etch;

namespace {

const Color kRed{255, 0, 0, 255};
const Color kBlue{0, 0, 255, 255};

LinearGradient redToBlue() {
    LinearGradient g;
    g.start = {0, 0};
    g.end = {100, 0};
    g.fractions = {0, 1};
    g.colors = {kRed, kBlue};
    return g;
}

}

// --- Solid colors ---

TEST(PaintTranslator, InitialSpecIsBlack) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    EXPECT_EQ(paints.current(), PaintSpec(Color{0, 0, 0, 255}));
}

TEST(PaintTranslator, ColorSetsShaderAndPaintColor) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;

    EXPECT_TRUE(paints.apply(kRed, paint));
    EXPECT_EQ(paint.color(), kRed);
    ASSERT_NE(paint.shader(), nullptr);
    EXPECT_EQ(paint.shader()->kind, Shader::Kind::Color);
    EXPECT_EQ(paint.shader()->color, kRed);
    EXPECT_EQ(factory->colorShaders, 1);
}

TEST(PaintTranslator, EqualSpecBuildsNothing) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;

    paints.apply(redToBlue(), paint);
    int built = factory->shaderCount();
    auto shader = paint.shader();

    EXPECT_FALSE(paints.apply(redToBlue(), paint));
    EXPECT_EQ(factory->shaderCount(), built);
    EXPECT_EQ(paint.shader(), shader);
}

// --- Linear gradients ---

TEST(PaintTranslator, EvenTwoStopGradientOmitsPositions) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;
    paints.apply(redToBlue(), paint);

    const Shader& s = *paint.shader();
    EXPECT_EQ(s.kind, Shader::Kind::LinearGradient);
    EXPECT_TRUE(s.positions.empty());
    EXPECT_EQ(s.end, (Point{100, 0}));
    EXPECT_EQ(s.tileMode, TileMode::Clamp);
}

TEST(PaintTranslator, MultiStopGradientKeepsFractions) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;

    LinearGradient g = redToBlue();
    g.fractions = {0, 0.25f, 1};
    g.colors = {kRed, kBlue, kRed};
    g.cycle = CycleMethod::Repeat;
    paints.apply(g, paint);

    const Shader& s = *paint.shader();
    EXPECT_EQ(s.positions, g.fractions);
    EXPECT_EQ(s.colors.size(), 3u);
    EXPECT_EQ(s.tileMode, TileMode::Repeat);
}

TEST(PaintTranslator, CycleMethods) {
    EXPECT_EQ(PaintTranslator::ToTileMode(CycleMethod::NoCycle), TileMode::Clamp);
    EXPECT_EQ(PaintTranslator::ToTileMode(CycleMethod::Repeat), TileMode::Repeat);
    EXPECT_EQ(PaintTranslator::ToTileMode(CycleMethod::Reflect), TileMode::Mirror);
}

TEST(PaintTranslator, MalformedStopsRejected) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;

    LinearGradient one = redToBlue();
    one.fractions = {0};
    one.colors = {kRed};
    EXPECT_THROW(paints.apply(one, paint), std::invalid_argument);

    LinearGradient mismatched = redToBlue();
    mismatched.fractions = {0, 0.5f, 1};
    EXPECT_THROW(paints.apply(mismatched, paint), std::invalid_argument);

    // A rejected spec does not become current.
    EXPECT_EQ(paints.current(), PaintSpec(Color{0, 0, 0, 255}));
}

// --- Radial gradients ---

TEST(PaintTranslator, CenteredRadial) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;

    RadialGradient g;
    g.center = {50, 50};
    g.focus = {50, 50};
    g.radius = 25;
    g.fractions = {0, 1};
    g.colors = {kRed, kBlue};
    g.cycle = CycleMethod::Reflect;
    paints.apply(g, paint);

    EXPECT_EQ(factory->radialGradients, 1);
    EXPECT_EQ(factory->conicalGradients, 0);
    const Shader& s = *paint.shader();
    EXPECT_EQ(s.start, (Point{50, 50}));
    EXPECT_FLOAT_EQ(s.startRadius, 25.0f);
    EXPECT_EQ(s.tileMode, TileMode::Mirror);
}

TEST(PaintTranslator, OffCenterFocusIsConical) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;

    RadialGradient g;
    g.center = {50, 50};
    g.focus = {40, 45};
    g.radius = 25;
    g.fractions = {0, 1};
    g.colors = {kRed, kBlue};
    paints.apply(g, paint);

    EXPECT_EQ(factory->conicalGradients, 1);
    const Shader& s = *paint.shader();
    EXPECT_EQ(s.kind, Shader::Kind::TwoPointConicalGradient);
    EXPECT_EQ(s.start, (Point{40, 45}));
    EXPECT_FLOAT_EQ(s.startRadius, 0.0f);
    EXPECT_EQ(s.end, (Point{50, 50}));
    EXPECT_FLOAT_EQ(s.endRadius, 25.0f);
}

// --- Two-color gradients ---

TEST(PaintTranslator, TwoColorGradient) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;

    paints.apply(TwoColorGradient{{0, 0}, kRed, {0, 10}, kBlue, true}, paint);
    const Shader& s = *paint.shader();
    EXPECT_EQ(s.kind, Shader::Kind::LinearGradient);
    EXPECT_EQ(s.colors, (std::vector<Color>{kRed, kBlue}));
    EXPECT_TRUE(s.positions.empty());
    EXPECT_EQ(s.tileMode, TileMode::Mirror);

    paints.apply(TwoColorGradient{{0, 0}, kRed, {0, 10}, kBlue, false}, paint);
    EXPECT_EQ(paint.shader()->tileMode, TileMode::Clamp);
    EXPECT_EQ(factory->linearGradients, 2);
}

TEST(PaintTranslator, GradientKeepsPaintColor) {
    auto factory = std::make_shared<test::CountingFactory>();
    PaintTranslator paints(factory);
    Paint paint;
    paints.apply(kRed, paint);
    paints.apply(redToBlue(), paint);
    EXPECT_EQ(paint.color(), kRed);
}

// --- Default factory ---

TEST(DefaultFactory, GradientValidation) {
    auto factory = BackendFactory::MakeDefault();
    EXPECT_THROW(factory->makeLinearGradient({0, 0}, {1, 1}, {kRed}, {}, TileMode::Clamp),
                 std::invalid_argument);
    EXPECT_THROW(factory->makeRadialGradient({0, 0}, 5, {kRed, kBlue}, {0.5f}, TileMode::Clamp),
                 std::invalid_argument);
    auto ok = factory->makeLinearGradient({0, 0}, {1, 1}, {kRed, kBlue}, {}, TileMode::Repeat);
    ASSERT_NE(ok, nullptr);
    EXPECT_EQ(ok->tileMode, TileMode::Repeat);
}

TEST(DefaultFactory, DashValidation) {
    auto factory = BackendFactory::MakeDefault();
    EXPECT_THROW(factory->makeDashPathEffect({5}, 0), std::invalid_argument);
    EXPECT_THROW(factory->makeDashPathEffect({5, 2, 1}, 0), std::invalid_argument);
    EXPECT_THROW(factory->makeDashPathEffect({5, -2}, 0), std::invalid_argument);
    EXPECT_THROW(factory->makeDashPathEffect({0, 0}, 0), std::invalid_argument);

    auto effect = factory->makeDashPathEffect({4, 2}, 1);
    ASSERT_NE(effect, nullptr);
    EXPECT_EQ(effect->intervals, (std::vector<f32>{4, 2}));
    EXPECT_FLOAT_EQ(effect->phase, 1.0f);
}

// --- Composite ---

TEST(Composite, DefaultIsSrcOverOpaque) {
    Composite c;
    EXPECT_EQ(c.rule, CompositeRule::SrcOver);
    EXPECT_FLOAT_EQ(c.alpha, 1.0f);
}

TEST(Composite, EveryRuleMapsToBlendMode) {
    EXPECT_EQ(toBlendMode(CompositeRule::Clear), BlendMode::Clear);
    EXPECT_EQ(toBlendMode(CompositeRule::Src), BlendMode::Src);
    EXPECT_EQ(toBlendMode(CompositeRule::Dst), BlendMode::Dst);
    EXPECT_EQ(toBlendMode(CompositeRule::SrcOver), BlendMode::SrcOver);
    EXPECT_EQ(toBlendMode(CompositeRule::DstOver), BlendMode::DstOver);
    EXPECT_EQ(toBlendMode(CompositeRule::SrcIn), BlendMode::SrcIn);
    EXPECT_EQ(toBlendMode(CompositeRule::DstIn), BlendMode::DstIn);
    EXPECT_EQ(toBlendMode(CompositeRule::SrcOut), BlendMode::SrcOut);
    EXPECT_EQ(toBlendMode(CompositeRule::DstOut), BlendMode::DstOut);
    EXPECT_EQ(toBlendMode(CompositeRule::SrcAtop), BlendMode::SrcATop);
    EXPECT_EQ(toBlendMode(CompositeRule::DstAtop), BlendMode::DstATop);
    EXPECT_EQ(toBlendMode(CompositeRule::Xor), BlendMode::Xor);
}

TEST(Composite, UnknownRuleThrows) {
    EXPECT_THROW(toBlendMode(static_cast<CompositeRule>(42)), UnsupportedCompositeRuleError);
    EXPECT_THROW(Composite::Make(static_cast<CompositeRule>(0)), UnsupportedCompositeRuleError);
}

TEST(Composite, AlphaOutOfRange) {
    EXPECT_THROW(Composite::Make(CompositeRule::SrcOver, 1.5f), std::invalid_argument);
    EXPECT_THROW(Composite::Make(CompositeRule::SrcOver, -0.1f), std::invalid_argument);
    Composite c = Composite::Make(CompositeRule::Xor, 0.25f);
    EXPECT_EQ(c, (Composite{CompositeRule::Xor, 0.25f}));
}
