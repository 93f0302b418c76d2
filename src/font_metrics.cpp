#include "etch/font_metrics.hpp"

namespace etch {

FontMetrics::FontMetrics(FontSpec spec, Font font)
    : spec_(std::move(spec)), font_(std::move(font)), data_(font_.metrics()) {
}

i32 FontMetrics::ascent() const {
    return static_cast<i32>(-data_.ascent);
}

i32 FontMetrics::descent() const {
    return static_cast<i32>(data_.descent);
}

i32 FontMetrics::leading() const {
    return static_cast<i32>(data_.leading);
}

i32 FontMetrics::height() const {
    return ascent() + descent() + leading();
}

i32 FontMetrics::charWidth(char ch) const {
    return static_cast<i32>(font_.measureText(std::string_view(&ch, 1)));
}

i32 FontMetrics::stringWidth(std::string_view text) const {
    return static_cast<i32>(font_.measureText(text));
}

}
