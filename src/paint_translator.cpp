#include "etch/paint_translator.hpp"
#include "etch/log.hpp"
#include <stdexcept>

namespace etch {

namespace {

Point toPoint(PointD p) {
    return {f32(p.x), f32(p.y)};
}

void checkStops(const std::vector<f32>& fractions, const std::vector<Color>& colors) {
    if (colors.size() < 2) {
        throw std::invalid_argument("gradient needs at least two colors");
    }
    if (fractions.size() != colors.size()) {
        throw std::invalid_argument("gradient fractions and colors differ in length");
    }
}

// Evenly spaced two-stop gradients go to the backend without positions.
std::vector<f32> positionsFor(const std::vector<f32>& fractions) {
    if (fractions.size() == 2 && fractions[0] == 0 && fractions[1] == 1) {
        return {};
    }
    return fractions;
}

}

PaintTranslator::PaintTranslator(std::shared_ptr<BackendFactory> factory, PaintSpec initial)
    : factory_(std::move(factory)), current_(std::move(initial)) {
}

TileMode PaintTranslator::ToTileMode(CycleMethod method) {
    switch (method) {
        case CycleMethod::NoCycle: return TileMode::Clamp;
        case CycleMethod::Repeat: return TileMode::Repeat;
        case CycleMethod::Reflect: return TileMode::Mirror;
    }
    return TileMode::Clamp;
}

std::shared_ptr<const Shader> PaintTranslator::makeShader(const PaintSpec& spec) {
    struct Visitor {
        BackendFactory& factory;

        std::shared_ptr<const Shader> operator()(const Color& c) const {
            return factory.makeColorShader(c);
        }

        std::shared_ptr<const Shader> operator()(const LinearGradient& g) const {
            checkStops(g.fractions, g.colors);
            return factory.makeLinearGradient(toPoint(g.start), toPoint(g.end), g.colors,
                                              positionsFor(g.fractions), ToTileMode(g.cycle));
        }

        std::shared_ptr<const Shader> operator()(const RadialGradient& g) const {
            checkStops(g.fractions, g.colors);
            if (g.focus == g.center) {
                return factory.makeRadialGradient(toPoint(g.center), g.radius, g.colors,
                                                  g.fractions, ToTileMode(g.cycle));
            }
            // An off-center focus is a zero-radius start circle.
            return factory.makeTwoPointConicalGradient(toPoint(g.focus), 0,
                                                       toPoint(g.center), g.radius,
                                                       g.colors, g.fractions,
                                                       ToTileMode(g.cycle));
        }

        std::shared_ptr<const Shader> operator()(const TwoColorGradient& g) const {
            return factory.makeLinearGradient(toPoint(g.p1), toPoint(g.p2), {g.c1, g.c2}, {},
                                              g.cyclic ? TileMode::Mirror : TileMode::Clamp);
        }
    };
    return std::visit(Visitor{*factory_}, spec);
}

bool PaintTranslator::apply(const PaintSpec& spec, Paint& paint) {
    if (spec == current_) {
        return false;
    }
    std::shared_ptr<const Shader> shader = makeShader(spec);
    if (const Color* c = std::get_if<Color>(&spec)) {
        paint.setColor(*c);
    }
    paint.setShader(std::move(shader));
    current_ = spec;
    logDebug("paint: installed shader for paint kind %zu", spec.index());
    return true;
}

}
