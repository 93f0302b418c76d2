#pragma once

#include <etch/backend_factory.hpp>
#include <etch/canvas.hpp>
#include <etch/image.hpp>

#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace etch {
namespace test {

// --- Typeface with metrics proportional to size ---

class FixedTypeface : public Typeface {
public:
    FixedTypeface(std::string family, FontStyle style)
        : Typeface(std::move(family), style) {}

    FontMetricsData metrics(f32 size) const override {
        return {-0.75f * size, 0.25f * size, 0.125f * size};
    }

    // Every byte advances by half the size.
    f32 measureText(std::string_view text, f32 size) const override {
        return 0.5f * size * static_cast<f32>(text.size());
    }
};

// --- Factory counting every construction ---

class CountingFactory : public BackendFactory {
public:
    int colorShaders = 0;
    int linearGradients = 0;
    int radialGradients = 0;
    int conicalGradients = 0;
    int dashEffects = 0;
    int rejectedDashes = 0;
    int typefaces = 0;
    std::vector<std::string> typefaceFamilies;

    int shaderCount() const {
        return colorShaders + linearGradients + radialGradients + conicalGradients;
    }

    std::shared_ptr<const Shader> makeColorShader(Color color) override {
        ++colorShaders;
        auto s = std::make_shared<Shader>();
        s->kind = Shader::Kind::Color;
        s->color = color;
        return s;
    }

    std::shared_ptr<const Shader> makeLinearGradient(
        Point start, Point end,
        const std::vector<Color>& colors, const std::vector<f32>& positions,
        TileMode mode) override {
        ++linearGradients;
        auto s = std::make_shared<Shader>();
        s->kind = Shader::Kind::LinearGradient;
        s->start = start;
        s->end = end;
        s->colors = colors;
        s->positions = positions;
        s->tileMode = mode;
        return s;
    }

    std::shared_ptr<const Shader> makeRadialGradient(
        Point center, f32 radius,
        const std::vector<Color>& colors, const std::vector<f32>& positions,
        TileMode mode) override {
        ++radialGradients;
        auto s = std::make_shared<Shader>();
        s->kind = Shader::Kind::RadialGradient;
        s->start = center;
        s->startRadius = radius;
        s->colors = colors;
        s->positions = positions;
        s->tileMode = mode;
        return s;
    }

    std::shared_ptr<const Shader> makeTwoPointConicalGradient(
        Point start, f32 startRadius, Point end, f32 endRadius,
        const std::vector<Color>& colors, const std::vector<f32>& positions,
        TileMode mode) override {
        ++conicalGradients;
        auto s = std::make_shared<Shader>();
        s->kind = Shader::Kind::TwoPointConicalGradient;
        s->start = start;
        s->startRadius = startRadius;
        s->end = end;
        s->endRadius = endRadius;
        s->colors = colors;
        s->positions = positions;
        s->tileMode = mode;
        return s;
    }

    // Rejects negative intervals and all-zero patterns.
    std::shared_ptr<const PathEffect> makeDashPathEffect(
        const std::vector<f32>& intervals, f32 phase) override {
        bool anyOn = false;
        for (f32 v : intervals) {
            if (v < 0) {
                ++rejectedDashes;
                throw std::invalid_argument("negative dash interval");
            }
            anyOn = anyOn || v > 0;
        }
        if (!anyOn) {
            ++rejectedDashes;
            throw std::invalid_argument("all-zero dash pattern");
        }
        ++dashEffects;
        auto e = std::make_shared<PathEffect>();
        e->intervals = intervals;
        e->phase = phase;
        return e;
    }

    std::shared_ptr<const Typeface> makeTypeface(const std::string& family,
                                                 FontStyle style) override {
        ++typefaces;
        typefaceFamilies.push_back(family);
        return std::make_shared<FixedTypeface>(family, style);
    }
};

// --- Canvas that logs every call ---

class CallLogCanvas : public Canvas {
public:
    std::vector<std::string> calls;
    int draws = 0;
    i32 depth = 1;
    Matrix matrix;

    i32 save() override {
        calls.push_back("save");
        return depth++;
    }
    void restoreToCount(i32 count) override {
        calls.push_back("restoreToCount " + std::to_string(count));
        if (count < 1) count = 1;
        if (count < depth) depth = count;
    }
    i32 saveCount() const override { return depth; }

    void setMatrix(const Matrix& m) override {
        calls.push_back("setMatrix");
        matrix = m;
    }
    void translate(f32, f32) override { calls.push_back("translate"); }
    void rotate(f32) override { calls.push_back("rotate"); }
    void scale(f32, f32) override { calls.push_back("scale"); }
    void skew(f32, f32) override { calls.push_back("skew"); }
    void concat(const Matrix&) override { calls.push_back("concat"); }
    void clipPath(const Path&, bool) override { calls.push_back("clipPath"); }

    void drawLine(f32, f32, f32, f32, const Paint& paint) override { logDraw("drawLine", paint); }
    void drawRect(const Rect&, const Paint& paint) override { logDraw("drawRect", paint); }
    void drawOval(const Rect&, const Paint& paint) override { logDraw("drawOval", paint); }
    void drawPath(const Path&, const Paint& paint) override { logDraw("drawPath", paint); }
    void drawImageRect(const std::shared_ptr<Image>&, const Rect&, const Rect&,
                       const Paint*) override {
        calls.push_back("drawImageRect");
        ++draws;
    }
    void drawString(std::string_view, f32, f32, const Font&, const Paint& paint) override {
        logDraw("drawString", paint);
    }

    // Paint of the most recent draw.
    Paint lastPaint;

    int count(const std::string& name) const {
        int n = 0;
        for (const auto& c : calls) {
            if (c == name) ++n;
        }
        return n;
    }

private:
    void logDraw(const char* name, const Paint& paint) {
        calls.push_back(name);
        lastPaint = paint;
        ++draws;
    }
};

}
}
