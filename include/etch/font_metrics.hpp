#pragma once

#include "etch/typeface.hpp"
#include "etch/typeface_cache.hpp"
#include <string_view>

namespace etch {

/// @brief Integer font measurements taken from a resolved backend font.
///
/// Values are truncated toward zero; ascent and descent are both positive.
class FontMetrics {
public:
    FontMetrics(FontSpec spec, Font font);

    const FontSpec& fontSpec() const { return spec_; }
    const Font& font() const { return font_; }

    i32 ascent() const;
    i32 descent() const;
    i32 leading() const;
    /// ascent + descent + leading.
    i32 height() const;

    i32 charWidth(char ch) const;
    i32 stringWidth(std::string_view text) const;

    /// @brief Advance of the text without truncation.
    f32 advance(std::string_view text) const { return font_.measureText(text); }

private:
    FontSpec spec_;
    Font font_;
    FontMetricsData data_;
};

}
