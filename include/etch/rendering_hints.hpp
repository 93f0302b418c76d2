#pragma once

/**
 * @file rendering_hints.hpp
 * @brief Typed rendering-hint keys and the hint map a context carries.
 */

#include "etch/typeface_cache.hpp"
#include <cstddef>
#include <map>
#include <variant>

namespace etch {

/// @brief Rendering hint keys.
enum class HintKey : u8 {
    Antialiasing,
    TextAntialiasing,
    Rendering,
    StrokeControl,
    Interpolation,
    FractionalMetrics,
    FontMapping      ///< Value is a FontMapping (an empty one means none).
};

/// @brief Enumerated hint values; each key accepts a subset.
enum class HintValue : u8 {
    Default,
    On,
    Off,
    Speed,
    Quality,
    Normalize,
    Pure,
    NearestNeighbor,
    Bilinear,
    Bicubic
};

using HintEntry = std::variant<HintValue, FontMapping>;

/// @brief An ordered map of rendering hints with per-key value checking.
class RenderingHints {
public:
    /// @brief True if value is acceptable for key.
    ///
    /// Antialiasing, TextAntialiasing, FractionalMetrics: Default, On, Off.
    /// Rendering: Default, Speed, Quality. StrokeControl: Default, Normalize,
    /// Pure. Interpolation: NearestNeighbor, Bilinear, Bicubic. FontMapping:
    /// a FontMapping, possibly empty.
    static bool IsCompatible(HintKey key, const HintEntry& value);

    /// @throws std::invalid_argument if the value does not fit the key.
    void set(HintKey key, HintEntry value);

    /// @brief The value for key, or nullptr if unset.
    const HintEntry* get(HintKey key) const;

    void remove(HintKey key) { entries_.erase(key); }
    void clear() { entries_.clear(); }
    bool contains(HintKey key) const { return entries_.count(key) != 0; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /// @brief Copy every entry of other into this map, overwriting.
    void merge(const RenderingHints& other);

    /// @brief The configured font mapping; empty when unset.
    FontMapping fontMapping() const;

    /// @brief Whether geometry should be anti-aliased. Unset or Default means on.
    bool antialiasing() const;

    const std::map<HintKey, HintEntry>& entries() const { return entries_; }

private:
    std::map<HintKey, HintEntry> entries_;
};

}
