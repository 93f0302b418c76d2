#pragma once

#include "etch/typeface_cache.hpp"
#include <optional>
#include <string>
#include <vector>

namespace etch {

/// @brief A piece of text with optional font and color overrides.
struct TextRun {
    std::string text;
    std::optional<FontSpec> font;
    std::optional<Color> color;

    bool hasAttributes() const { return font.has_value() || color.has_value(); }
};

/// @brief Text made of runs, each of which may carry its own font and color.
class AttributedString {
public:
    AttributedString() = default;
    explicit AttributedString(std::string text) { append(std::move(text)); }

    AttributedString& append(std::string text,
                             std::optional<FontSpec> font = std::nullopt,
                             std::optional<Color> color = std::nullopt) {
        runs_.push_back({std::move(text), std::move(font), std::move(color)});
        return *this;
    }

    const std::vector<TextRun>& runs() const { return runs_; }
    bool empty() const { return runs_.empty(); }

    /// @brief True if any run carries a font or color.
    bool hasAttributes() const {
        for (const TextRun& run : runs_) {
            if (run.hasAttributes()) return true;
        }
        return false;
    }

    /// @brief All run texts concatenated.
    std::string plainText() const {
        std::string out;
        for (const TextRun& run : runs_) out += run.text;
        return out;
    }

private:
    std::vector<TextRun> runs_;
};

}
