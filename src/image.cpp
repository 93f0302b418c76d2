#include "etch/image.hpp"
#include <cstring>
#include <atomic>

namespace etch {

namespace {
std::atomic<u64> gNextImageId{1};
}

u64 Image::nextImageId() {
    return gNextImageId.fetch_add(1, std::memory_order_relaxed);
}

Image::Image(const ImageInfo& info, std::vector<u8> pixels)
    : id_(nextImageId()),
      info_(info),
      pixels_(std::move(pixels)) {
}

std::shared_ptr<Image> Image::MakeRasterCopy(const ImageInfo& info, const void* pixels,
                                             size_t rowBytes) {
    if (!info.valid() || !pixels) return nullptr;
    size_t packed = static_cast<size_t>(info.minRowBytes());
    if (rowBytes < packed) return nullptr;

    std::vector<u8> copy(packed * info.height);
    const u8* src = static_cast<const u8*>(pixels);
    for (i32 y = 0; y < info.height; ++y) {
        std::memcpy(copy.data() + y * packed, src + y * rowBytes, packed);
    }
    return std::shared_ptr<Image>(new Image(info, std::move(copy)));
}

std::shared_ptr<Image> Image::MakeFilled(i32 width, i32 height, Color c) {
    ImageInfo info = ImageInfo::Make(width, height);
    if (!info.valid()) return nullptr;

    std::vector<u8> pixels(static_cast<size_t>(info.minRowBytes()) * height);
    for (size_t i = 0; i < pixels.size(); i += 4) {
        pixels[i + 0] = c.r;
        pixels[i + 1] = c.g;
        pixels[i + 2] = c.b;
        pixels[i + 3] = c.a;
    }
    return std::shared_ptr<Image>(new Image(info, std::move(pixels)));
}

}
