#include "etch/backend_factory.hpp"
#include "etch/log.hpp"
#include "font_loader.hpp"
#include <stdexcept>

namespace etch {

namespace {

std::shared_ptr<Shader> makeGradient(Shader::Kind kind,
                                     const std::vector<Color>& colors,
                                     const std::vector<f32>& positions,
                                     TileMode mode) {
    if (colors.size() < 2) {
        throw std::invalid_argument("gradient needs at least two colors");
    }
    if (!positions.empty() && positions.size() != colors.size()) {
        throw std::invalid_argument("gradient positions must match colors");
    }
    auto shader = std::make_shared<Shader>();
    shader->kind = kind;
    shader->colors = colors;
    shader->positions = positions;
    shader->tileMode = mode;
    return shader;
}

/// Shader and effect descriptions plus system typefaces.
class DefaultBackendFactory : public BackendFactory {
public:
    std::shared_ptr<const Shader> makeColorShader(Color color) override {
        auto shader = std::make_shared<Shader>();
        shader->kind = Shader::Kind::Color;
        shader->color = color;
        return shader;
    }

    std::shared_ptr<const Shader> makeLinearGradient(
            Point start, Point end,
            const std::vector<Color>& colors, const std::vector<f32>& positions,
            TileMode mode) override {
        auto shader = makeGradient(Shader::Kind::LinearGradient, colors, positions, mode);
        shader->start = start;
        shader->end = end;
        return shader;
    }

    std::shared_ptr<const Shader> makeRadialGradient(
            Point center, f32 radius,
            const std::vector<Color>& colors, const std::vector<f32>& positions,
            TileMode mode) override {
        auto shader = makeGradient(Shader::Kind::RadialGradient, colors, positions, mode);
        shader->start = center;
        shader->startRadius = radius;
        return shader;
    }

    std::shared_ptr<const Shader> makeTwoPointConicalGradient(
            Point start, f32 startRadius, Point end, f32 endRadius,
            const std::vector<Color>& colors, const std::vector<f32>& positions,
            TileMode mode) override {
        auto shader = makeGradient(Shader::Kind::TwoPointConicalGradient, colors, positions, mode);
        shader->start = start;
        shader->startRadius = startRadius;
        shader->end = end;
        shader->endRadius = endRadius;
        return shader;
    }

    std::shared_ptr<const PathEffect> makeDashPathEffect(
            const std::vector<f32>& intervals, f32 phase) override {
        if (intervals.size() < 2 || intervals.size() % 2 != 0) {
            throw std::invalid_argument("dash intervals need a positive even count");
        }
        bool anyOn = false;
        for (f32 v : intervals) {
            if (!(v >= 0)) {
                throw std::invalid_argument("dash interval is negative");
            }
            anyOn = anyOn || v > 0;
        }
        if (!anyOn) {
            throw std::invalid_argument("dash intervals are all zero");
        }
        auto effect = std::make_shared<PathEffect>();
        effect->intervals = intervals;
        effect->phase = phase;
        return effect;
    }

    std::shared_ptr<const Typeface> makeTypeface(const std::string& family,
                                                 FontStyle style) override {
        return loadSystemTypeface(family, style);
    }
};

}

std::shared_ptr<BackendFactory> BackendFactory::MakeDefault() {
    return std::make_shared<DefaultBackendFactory>();
}

}
