#pragma once

#include "etch/paint.hpp"

namespace etch {

/// @brief Porter-Duff compositing rules. Values are stable.
enum class CompositeRule : int {
    Clear = 1,
    Src = 2,
    SrcOver = 3,
    DstOver = 4,
    SrcIn = 5,
    DstIn = 6,
    SrcOut = 7,
    DstOut = 8,
    Dst = 9,
    SrcAtop = 10,
    DstAtop = 11,
    Xor = 12
};

/// @brief A compositing rule with an extra alpha in [0, 1].
struct Composite {
    CompositeRule rule = CompositeRule::SrcOver;
    f32 alpha = 1;

    /// @throws std::invalid_argument if alpha is outside [0, 1].
    /// @throws UnsupportedCompositeRuleError if rule is not a CompositeRule value.
    static Composite Make(CompositeRule rule, f32 alpha = 1);
};

inline bool operator==(const Composite& a, const Composite& b) {
    return a.rule == b.rule && a.alpha == b.alpha;
}
inline bool operator!=(const Composite& a, const Composite& b) { return !(a == b); }

/// @brief Backend blend mode for a rule.
/// @throws UnsupportedCompositeRuleError for values outside CompositeRule.
BlendMode toBlendMode(CompositeRule rule);

}
