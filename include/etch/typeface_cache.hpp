#pragma once

/**
 * @file typeface_cache.hpp
 * @brief Font requests and the shared cache of resolved typefaces.
 */

#include "etch/backend_factory.hpp"
#include "etch/typeface.hpp"
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace etch {

/// @brief Maps a logical family name (e.g. "SansSerif") to a physical one.
using FontMapping = std::function<std::string(const std::string&)>;

/// @brief A font request: family, style and point size.
struct FontSpec {
    std::string family = "SansSerif";
    FontStyle style = FontStyle::Plain;
    f32 size = 12;
};

inline bool operator==(const FontSpec& a, const FontSpec& b) {
    return a.family == b.family && a.style == b.style && a.size == b.size;
}
inline bool operator!=(const FontSpec& a, const FontSpec& b) { return !(a == b); }

/// @brief Thread-safe cache from (family, style) to a backend typeface.
///
/// Entries are built on first request and kept for the cache's lifetime.
/// A cache is meant to serve a single backend; the factory passed to
/// resolve() is only used on a miss.
class TypefaceCache {
public:
    TypefaceCache() = default;

    TypefaceCache(const TypefaceCache&) = delete;
    TypefaceCache& operator=(const TypefaceCache&) = delete;

    /// @brief The process-wide instance used when no cache is injected.
    static std::shared_ptr<TypefaceCache> Global();

    /// @brief Apply the mapping (identity when empty).
    static std::string MapFamily(const std::string& family, const FontMapping& mapping);

    /// @brief Resolve a family and style, building the typeface on a miss.
    /// @param mapping Optional logical-to-physical family mapping; the cache
    ///        key uses the mapped name.
    std::shared_ptr<const Typeface> resolve(const std::string& family, FontStyle style,
                                            BackendFactory& factory,
                                            const FontMapping& mapping = {});

    /// @brief True if (physical family, style) has been resolved before.
    bool contains(const std::string& family, FontStyle style) const;

    size_t size() const;

private:
    struct Key {
        std::string family;
        FontStyle style;

        bool operator==(const Key& o) const { return style == o.style && family == o.family; }
    };

    struct KeyHash {
        size_t operator()(const Key& k) const {
            return std::hash<std::string>()(k.family) * 31 + static_cast<size_t>(k.style);
        }
    };

    mutable std::mutex mutex_;
    std::unordered_map<Key, std::shared_ptr<const Typeface>, KeyHash> faces_;
};

}
