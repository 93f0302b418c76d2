#include <gtest/gtest.h>
#include <etch/rendering_hints.hpp>

#include <stdexcept>

using namespace etch;

// --- Compatibility ---

TEST(RenderingHints, SwitchKeysAcceptOnOffDefault) {
    for (HintKey key : {HintKey::Antialiasing, HintKey::TextAntialiasing,
                        HintKey::FractionalMetrics}) {
        EXPECT_TRUE(RenderingHints::IsCompatible(key, HintValue::On));
        EXPECT_TRUE(RenderingHints::IsCompatible(key, HintValue::Off));
        EXPECT_TRUE(RenderingHints::IsCompatible(key, HintValue::Default));
        EXPECT_FALSE(RenderingHints::IsCompatible(key, HintValue::Quality));
    }
}

TEST(RenderingHints, ValueSetsPerKey) {
    EXPECT_TRUE(RenderingHints::IsCompatible(HintKey::Rendering, HintValue::Speed));
    EXPECT_FALSE(RenderingHints::IsCompatible(HintKey::Rendering, HintValue::Pure));
    EXPECT_TRUE(RenderingHints::IsCompatible(HintKey::StrokeControl, HintValue::Pure));
    EXPECT_TRUE(RenderingHints::IsCompatible(HintKey::Interpolation, HintValue::Bicubic));
    EXPECT_FALSE(RenderingHints::IsCompatible(HintKey::Interpolation, HintValue::Default));
}

TEST(RenderingHints, FontMappingNeedsFunction) {
    FontMapping mapping = [](const std::string& f) { return f; };
    EXPECT_TRUE(RenderingHints::IsCompatible(HintKey::FontMapping, mapping));
    EXPECT_TRUE(RenderingHints::IsCompatible(HintKey::FontMapping, FontMapping()));
    EXPECT_FALSE(RenderingHints::IsCompatible(HintKey::FontMapping, HintValue::On));
    EXPECT_FALSE(RenderingHints::IsCompatible(HintKey::Antialiasing, mapping));
}

// --- Map operations ---

TEST(RenderingHints, SetGetRemove) {
    RenderingHints hints;
    EXPECT_TRUE(hints.empty());
    EXPECT_EQ(hints.get(HintKey::Rendering), nullptr);

    hints.set(HintKey::Rendering, HintValue::Quality);
    ASSERT_NE(hints.get(HintKey::Rendering), nullptr);
    EXPECT_EQ(std::get<HintValue>(*hints.get(HintKey::Rendering)), HintValue::Quality);
    EXPECT_TRUE(hints.contains(HintKey::Rendering));
    EXPECT_EQ(hints.size(), 1u);

    hints.remove(HintKey::Rendering);
    EXPECT_FALSE(hints.contains(HintKey::Rendering));
}

TEST(RenderingHints, IncompatibleSetThrows) {
    RenderingHints hints;
    EXPECT_THROW(hints.set(HintKey::Antialiasing, HintValue::Bilinear), std::invalid_argument);
    EXPECT_THROW(hints.set(HintKey::FontMapping, HintValue::On), std::invalid_argument);
    EXPECT_TRUE(hints.empty());
}

TEST(RenderingHints, MergeOverwrites) {
    RenderingHints a;
    a.set(HintKey::Antialiasing, HintValue::On);
    a.set(HintKey::Rendering, HintValue::Speed);

    RenderingHints b;
    b.set(HintKey::Antialiasing, HintValue::Off);
    b.set(HintKey::Interpolation, HintValue::Bilinear);

    a.merge(b);
    EXPECT_EQ(a.size(), 3u);
    EXPECT_EQ(std::get<HintValue>(*a.get(HintKey::Antialiasing)), HintValue::Off);
    EXPECT_EQ(std::get<HintValue>(*a.get(HintKey::Rendering)), HintValue::Speed);
}

// --- Derived settings ---

TEST(RenderingHints, AntialiasingDefaultsOn) {
    RenderingHints hints;
    EXPECT_TRUE(hints.antialiasing());
    hints.set(HintKey::Antialiasing, HintValue::Default);
    EXPECT_TRUE(hints.antialiasing());
    hints.set(HintKey::Antialiasing, HintValue::Off);
    EXPECT_FALSE(hints.antialiasing());
}

TEST(RenderingHints, FontMappingAccessor) {
    RenderingHints hints;
    EXPECT_FALSE(static_cast<bool>(hints.fontMapping()));

    hints.set(HintKey::FontMapping, FontMapping([](const std::string&) {
        return std::string("Arial");
    }));
    FontMapping m = hints.fontMapping();
    ASSERT_TRUE(static_cast<bool>(m));
    EXPECT_EQ(m("Dialog"), "Arial");

    hints.clear();
    EXPECT_FALSE(static_cast<bool>(hints.fontMapping()));
}
