#pragma once

#include "etch/backend_factory.hpp"
#include "etch/paint.hpp"
#include "etch/stroke.hpp"
#include <memory>

namespace etch {

/// @brief Copies StrokeSpec attributes onto a backend Paint.
class StrokeTranslator {
public:
    /// Narrowest stroke the backend is asked to draw.
    static constexpr f32 kMinStrokeWidth = 0.1f;

    explicit StrokeTranslator(std::shared_ptr<BackendFactory> factory);

    /// @brief Apply spec to paint unless it equals the current spec.
    ///
    /// A dash pattern the backend refuses leaves the stroke solid and logs a
    /// warning.
    /// @return false when nothing changed.
    /// @throws std::invalid_argument for a negative or non-finite width, a
    ///         miter limit below 1, or a cap/join outside its enumeration.
    bool apply(const StrokeSpec& spec, Paint& paint);

    /// @brief Apply spec even if it equals the current one.
    void reset(const StrokeSpec& spec, Paint& paint);

    const StrokeSpec& current() const { return current_; }

    static StrokeCap ToCap(LineCap cap);
    static StrokeJoin ToJoin(LineJoin join);

private:
    void validate(const StrokeSpec& spec) const;
    void install(const StrokeSpec& spec, Paint& paint);

    std::shared_ptr<BackendFactory> factory_;
    StrokeSpec current_;
};

}
