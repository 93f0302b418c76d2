#pragma once

#include "etch/backend_factory.hpp"
#include "etch/paint.hpp"
#include "etch/paint_spec.hpp"
#include <memory>

namespace etch {

/// @brief Turns PaintSpec values into shaders on a backend Paint.
///
/// Remembers the last spec applied; applying an equal spec again builds
/// nothing and leaves the paint untouched.
class PaintTranslator {
public:
    explicit PaintTranslator(std::shared_ptr<BackendFactory> factory,
                             PaintSpec initial = Color{0, 0, 0, 255});

    /// @brief Install the shader for spec on paint.
    /// @return false when spec equals the current spec (nothing was done).
    /// @throws std::invalid_argument for a gradient with fewer than two colors
    ///         or mismatched fraction and color counts.
    bool apply(const PaintSpec& spec, Paint& paint);

    const PaintSpec& current() const { return current_; }

    /// @brief Build the backend shader for a spec.
    std::shared_ptr<const Shader> makeShader(const PaintSpec& spec);

    static TileMode ToTileMode(CycleMethod method);

private:
    std::shared_ptr<BackendFactory> factory_;
    PaintSpec current_;
};

}
