#include "etch/composite.hpp"
#include "etch/errors.hpp"
#include <stdexcept>

namespace etch {

BlendMode toBlendMode(CompositeRule rule) {
    switch (rule) {
        case CompositeRule::Clear: return BlendMode::Clear;
        case CompositeRule::Src: return BlendMode::Src;
        case CompositeRule::SrcOver: return BlendMode::SrcOver;
        case CompositeRule::DstOver: return BlendMode::DstOver;
        case CompositeRule::SrcIn: return BlendMode::SrcIn;
        case CompositeRule::DstIn: return BlendMode::DstIn;
        case CompositeRule::SrcOut: return BlendMode::SrcOut;
        case CompositeRule::DstOut: return BlendMode::DstOut;
        case CompositeRule::Dst: return BlendMode::Dst;
        case CompositeRule::SrcAtop: return BlendMode::SrcATop;
        case CompositeRule::DstAtop: return BlendMode::DstATop;
        case CompositeRule::Xor: return BlendMode::Xor;
    }
    throw UnsupportedCompositeRuleError(static_cast<int>(rule));
}

Composite Composite::Make(CompositeRule rule, f32 alpha) {
    if (!(alpha >= 0 && alpha <= 1)) {
        throw std::invalid_argument("composite alpha must be in [0, 1]");
    }
    toBlendMode(rule);
    return Composite{rule, alpha};
}

}
