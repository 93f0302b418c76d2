#pragma once

#include "etch/typeface.hpp"
#include <memory>
#include <string>

namespace etch {

/// Locate a font file for (family, style) with fontconfig and load it with
/// stb_truetype. Never returns null: a face that cannot be located or parsed
/// comes back empty, with zero metrics and zero advances.
std::shared_ptr<const Typeface> loadSystemTypeface(const std::string& family, FontStyle style);

}
