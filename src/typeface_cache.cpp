#include "etch/typeface_cache.hpp"
#include "etch/log.hpp"

namespace etch {

std::shared_ptr<TypefaceCache> TypefaceCache::Global() {
    static std::shared_ptr<TypefaceCache> instance = std::make_shared<TypefaceCache>();
    return instance;
}

std::string TypefaceCache::MapFamily(const std::string& family, const FontMapping& mapping) {
    return mapping ? mapping(family) : family;
}

std::shared_ptr<const Typeface> TypefaceCache::resolve(const std::string& family, FontStyle style,
                                                       BackendFactory& factory,
                                                       const FontMapping& mapping) {
    Key key{MapFamily(family, mapping), style};

    // Held across construction so each key is built exactly once.
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = faces_.find(key);
    if (it != faces_.end()) {
        return it->second;
    }
    logDebug("typeface: building '%s' style %d", key.family.c_str(), static_cast<int>(style));
    std::shared_ptr<const Typeface> face = factory.makeTypeface(key.family, style);
    faces_.emplace(std::move(key), face);
    return face;
}

bool TypefaceCache::contains(const std::string& family, FontStyle style) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return faces_.count(Key{family, style}) != 0;
}

size_t TypefaceCache::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return faces_.size();
}

}
