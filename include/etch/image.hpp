#pragma once

#include "etch/types.hpp"
#include <memory>
#include <vector>

namespace etch {

/// @brief Pixel format of image storage.
enum class PixelFormat : u8 {
    RGBA8888,  ///< Red-Green-Blue-Alpha, 8 bits each.
    BGRA8888,  ///< Blue-Green-Red-Alpha, 8 bits each.
};

/// @brief Dimensions and format of an image.
struct ImageInfo {
    i32 width = 0;
    i32 height = 0;
    PixelFormat format = PixelFormat::RGBA8888;

    i32 bytesPerPixel() const { return 4; }
    i32 minRowBytes() const { return width * 4; }
    bool valid() const { return width > 0 && height > 0; }

    static ImageInfo Make(i32 w, i32 h, PixelFormat fmt = PixelFormat::RGBA8888) {
        ImageInfo info;
        info.width = w;
        info.height = h;
        info.format = fmt;
        return info;
    }
};

/**
 * Image - An immutable block of pixels that can be drawn with
 * Canvas::drawImageRect().
 *
 * Images own a tightly packed copy of their pixels and are shared by
 * shared_ptr between the caller and any recording that references them.
 */
class Image {
public:
    // Copy pixels from a caller buffer with the given row stride.
    static std::shared_ptr<Image> MakeRasterCopy(const ImageInfo& info, const void* pixels,
                                                 size_t rowBytes);

    // An image of one color.
    static std::shared_ptr<Image> MakeFilled(i32 width, i32 height, Color c);

    i32 width() const { return info_.width; }
    i32 height() const { return info_.height; }
    PixelFormat format() const { return info_.format; }
    const ImageInfo& info() const { return info_; }

    const u8* pixels() const { return pixels_.data(); }
    size_t rowBytes() const { return static_cast<size_t>(info_.minRowBytes()); }

    /// @brief (0, 0, width, height).
    Rect bounds() const { return {0, 0, f32(info_.width), f32(info_.height)}; }

    // Stable identity used for backend caches.
    u64 uniqueId() const { return id_; }

private:
    static u64 nextImageId();

    Image(const ImageInfo& info, std::vector<u8> pixels);

    u64 id_ = 0;
    ImageInfo info_;
    std::vector<u8> pixels_;
};

}
