#pragma once

/**
 * @file typeface.hpp
 * @brief Backend typeface handle and sized font.
 */

#include "etch/types.hpp"
#include <memory>
#include <string>
#include <string_view>

namespace etch {

/// @brief Style bits of a font request.
enum class FontStyle : u8 {
    Plain = 0,
    Bold = 1,
    Italic = 2,
    BoldItalic = 3
};

/// @brief Vertical metrics of a font at a given size, in pixels.
///
/// Ascent is negative (above the baseline), descent positive.
struct FontMetricsData {
    f32 ascent = 0;
    f32 descent = 0;
    f32 leading = 0;
};

/// @brief Immutable, shareable backend typeface.
class Typeface {
public:
    virtual ~Typeface() = default;

    Typeface(const Typeface&) = delete;
    Typeface& operator=(const Typeface&) = delete;

    /// @brief Family name the typeface was requested with.
    const std::string& familyName() const { return family_; }
    FontStyle style() const { return style_; }

    /// @brief Vertical metrics when rendered at `size` pixels.
    virtual FontMetricsData metrics(f32 size) const = 0;

    /// @brief Horizontal advance of UTF-8 text at `size` pixels.
    virtual f32 measureText(std::string_view text, f32 size) const = 0;

protected:
    Typeface(std::string family, FontStyle style)
        : family_(std::move(family)), style_(style) {}

private:
    std::string family_;
    FontStyle style_;
};

/// @brief A typeface at a specific size.
class Font {
public:
    Font() = default;
    Font(std::shared_ptr<const Typeface> typeface, f32 size)
        : typeface_(std::move(typeface)), size_(size) {}

    const std::shared_ptr<const Typeface>& typeface() const { return typeface_; }
    f32 size() const { return size_; }

    FontMetricsData metrics() const {
        return typeface_ ? typeface_->metrics(size_) : FontMetricsData{};
    }

    f32 measureText(std::string_view text) const {
        return typeface_ ? typeface_->measureText(text, size_) : 0;
    }

private:
    std::shared_ptr<const Typeface> typeface_;
    f32 size_ = 12;
};

}
