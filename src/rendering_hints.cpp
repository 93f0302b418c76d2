#include "etch/rendering_hints.hpp"
#include <stdexcept>
#include <string>

namespace etch {

bool RenderingHints::IsCompatible(HintKey key, const HintEntry& value) {
    if (key == HintKey::FontMapping) {
        return std::holds_alternative<FontMapping>(value);
    }
    const HintValue* v = std::get_if<HintValue>(&value);
    if (!v) return false;

    switch (key) {
        case HintKey::Antialiasing:
        case HintKey::TextAntialiasing:
        case HintKey::FractionalMetrics:
            return *v == HintValue::Default || *v == HintValue::On || *v == HintValue::Off;
        case HintKey::Rendering:
            return *v == HintValue::Default || *v == HintValue::Speed || *v == HintValue::Quality;
        case HintKey::StrokeControl:
            return *v == HintValue::Default || *v == HintValue::Normalize || *v == HintValue::Pure;
        case HintKey::Interpolation:
            return *v == HintValue::NearestNeighbor || *v == HintValue::Bilinear ||
                   *v == HintValue::Bicubic;
        case HintKey::FontMapping:
            break;
    }
    return false;
}

void RenderingHints::set(HintKey key, HintEntry value) {
    if (!IsCompatible(key, value)) {
        throw std::invalid_argument("rendering hint value incompatible with key " +
                                    std::to_string(static_cast<int>(key)));
    }
    entries_[key] = std::move(value);
}

const HintEntry* RenderingHints::get(HintKey key) const {
    auto it = entries_.find(key);
    return it == entries_.end() ? nullptr : &it->second;
}

void RenderingHints::merge(const RenderingHints& other) {
    for (const auto& entry : other.entries_) {
        entries_[entry.first] = entry.second;
    }
}

FontMapping RenderingHints::fontMapping() const {
    const HintEntry* e = get(HintKey::FontMapping);
    if (!e) return {};
    const FontMapping* f = std::get_if<FontMapping>(e);
    return f ? *f : FontMapping{};
}

bool RenderingHints::antialiasing() const {
    const HintEntry* e = get(HintKey::Antialiasing);
    if (!e) return true;
    const HintValue* v = std::get_if<HintValue>(e);
    return !v || *v != HintValue::Off;
}

}
