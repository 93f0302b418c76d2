#pragma once

/**
 * @file graphics.hpp
 * @brief Immediate-mode graphics context drawing onto a backend Canvas.
 */

#include "etch/attributed_string.hpp"
#include "etch/backend_factory.hpp"
#include "etch/canvas.hpp"
#include "etch/clip_stack.hpp"
#include "etch/composite.hpp"
#include "etch/font_metrics.hpp"
#include "etch/image.hpp"
#include "etch/paint_translator.hpp"
#include "etch/rendering_hints.hpp"
#include "etch/shape.hpp"
#include "etch/stroke_translator.hpp"
#include "etch/surface.hpp"
#include "etch/transform_tracker.hpp"
#include "etch/typeface_cache.hpp"
#include <memory>
#include <optional>
#include <string_view>

namespace etch {

/**
 * Graphics - the drawing context callers talk to.
 *
 * Holds the current paint, stroke, font, transform, clip, composite and
 * background, and mirrors every change onto the backend canvas as it
 * happens. Shapes and coordinates are in user space.
 *
 * Contexts obtained from create() share the canvas with their parent and
 * must be disposed (or destroyed) before the parent and before any sibling
 * created earlier. Disposal restores the canvas to the save count it had
 * when the context was made.
 *
 * A context is not safe for concurrent use. The typeface cache is the only
 * state shared between contexts.
 */
class Graphics {
public:
    /// @brief A context drawing onto a new recording surface.
    /// @throws std::invalid_argument if either size is not positive.
    Graphics(i32 width, i32 height,
             std::shared_ptr<BackendFactory> factory = BackendFactory::MakeDefault(),
             std::shared_ptr<TypefaceCache> typefaces = TypefaceCache::Global());

    /// @brief A context drawing onto an existing canvas.
    /// @throws std::invalid_argument if canvas, factory or typefaces is null.
    explicit Graphics(std::shared_ptr<Canvas> canvas,
                      std::shared_ptr<BackendFactory> factory = BackendFactory::MakeDefault(),
                      std::shared_ptr<TypefaceCache> typefaces = TypefaceCache::Global());

    /// @brief Calls dispose().
    ~Graphics();

    Graphics(const Graphics&) = delete;
    Graphics& operator=(const Graphics&) = delete;

    /// @brief The surface this context (or its root) created, or nullptr
    /// when drawing onto a caller-supplied canvas.
    Surface* surface() const { return surface_.get(); }
    Canvas* canvas() const { return canvas_.get(); }

    /// @name Shapes
    /// @{
    void draw(const Shape& shape);
    void fill(const Shape& shape);

    void drawLine(i32 x1, i32 y1, i32 x2, i32 y2);
    void drawRect(i32 x, i32 y, i32 width, i32 height);
    void fillRect(i32 x, i32 y, i32 width, i32 height);
    /// Fill with the background color, then put the paint back.
    void clearRect(i32 x, i32 y, i32 width, i32 height);
    void drawRoundRect(i32 x, i32 y, i32 width, i32 height, i32 arcWidth, i32 arcHeight);
    void fillRoundRect(i32 x, i32 y, i32 width, i32 height, i32 arcWidth, i32 arcHeight);
    void drawOval(i32 x, i32 y, i32 width, i32 height);
    void fillOval(i32 x, i32 y, i32 width, i32 height);
    /// Angles in degrees, counter-clockwise from 3 o'clock.
    void drawArc(i32 x, i32 y, i32 width, i32 height, i32 startAngle, i32 arcAngle);
    void fillArc(i32 x, i32 y, i32 width, i32 height, i32 startAngle, i32 arcAngle);

    /// @throws std::invalid_argument if a coordinate array is null and count > 0.
    void drawPolyline(const i32* xPoints, const i32* yPoints, i32 count);
    void drawPolygon(const i32* xPoints, const i32* yPoints, i32 count);
    void fillPolygon(const i32* xPoints, const i32* yPoints, i32 count);

    /// @brief Outline through the points; empty for count < 1.
    /// @throws std::invalid_argument if a coordinate array is null and count > 0.
    static PathShape createPolygon(const i32* xPoints, const i32* yPoints, i32 count, bool close);

    /// @brief True if a device-space rectangle touches the transformed shape.
    ///
    /// With onStroke the shape's bounds, grown by half the stroke width, stand
    /// in for the stroked outline.
    bool hit(const RectI& rect, const Shape& shape, bool onStroke) const;
    /// @}

    /// @name Text
    /// @{
    void drawString(std::string_view text, f32 x, f32 y);
    /// @throws std::invalid_argument if text is null.
    void drawString(const char* text, f32 x, f32 y);
    void drawString(const AttributedString& text, f32 x, f32 y);
    /// @}

    /// @name Images
    /// A null image draws nothing. All variants return true.
    /// @{
    bool drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y);
    bool drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y, i32 width, i32 height);
    bool drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y, Color background);
    bool drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y, i32 width, i32 height,
                   Color background);
    /// Source rectangle (sx1, sy1)-(sx2, sy2) scaled into (dx1, dy1)-(dx2, dy2).
    bool drawImage(const std::shared_ptr<Image>& image,
                   i32 dx1, i32 dy1, i32 dx2, i32 dy2,
                   i32 sx1, i32 sy1, i32 sx2, i32 sy2);
    bool drawImage(const std::shared_ptr<Image>& image,
                   i32 dx1, i32 dy1, i32 dx2, i32 dy2,
                   i32 sx1, i32 sy1, i32 sx2, i32 sy2, Color background);
    /// Draw at the origin under transform(xform); the transform is restored afterwards.
    bool drawImage(const std::shared_ptr<Image>& image, const AffineTransform& xform);
    /// @}

    /// @name Paint, stroke, composite
    /// @{
    void setPaint(const PaintSpec& paint);
    /// nullptr leaves the paint unchanged.
    void setPaint(const PaintSpec* paint);
    const PaintSpec& getPaint() const { return paints_.current(); }

    void setColor(Color c);
    Color getColor() const { return color_; }

    void setBackground(Color c);
    Color getBackground() const { return background_; }

    void setStroke(const StrokeSpec& stroke);
    const StrokeSpec& getStroke() const { return strokes_.current(); }

    void setComposite(const Composite& composite);
    const Composite& getComposite() const { return composite_; }
    /// @}

    /// @name Fonts
    /// @{
    void setFont(const FontSpec& font);
    const FontSpec& getFont() const { return font_; }
    FontMetrics getFontMetrics() const;
    FontMetrics getFontMetrics(const FontSpec& font);
    /// @}

    /// @name Rendering hints
    /// @{
    /// @throws std::invalid_argument if the value does not fit the key.
    void setRenderingHint(HintKey key, HintEntry value);
    /// nullptr if unset.
    const HintEntry* getRenderingHint(HintKey key) const { return hints_.get(key); }
    void setRenderingHints(const RenderingHints& hints);
    void addRenderingHints(const RenderingHints& hints);
    RenderingHints getRenderingHints() const { return hints_; }
    /// @}

    /// @name Transform
    /// @{
    void translate(f64 tx, f64 ty);
    void rotate(f64 theta);
    void rotate(f64 theta, f64 x, f64 y);
    void scale(f64 sx, f64 sy);
    void shear(f64 shx, f64 shy);
    void transform(const AffineTransform& t);
    void setTransform(const AffineTransform& t);
    /// A copy; changing it does not affect the context.
    AffineTransform getTransform() const { return tracker_.transform(); }
    /// @}

    /// @name Clip
    /// @{
    /// User-space clip, or nullopt for none (or a non-invertible transform).
    std::optional<PathShape> getClip() const { return clips_.userClip(); }
    std::optional<RectI> getClipBounds() const;
    void setClip(const Shape* shape);
    void setClip(const Shape& shape) { setClip(&shape); }
    void setClip(i32 x, i32 y, i32 width, i32 height);
    void clip(const Shape& shape);
    void clipRect(i32 x, i32 y, i32 width, i32 height);
    /// @}

    /// @name Derived contexts
    /// @{
    /// A context sharing this canvas, starting from a copy of this state.
    std::unique_ptr<Graphics> create();
    /// create(), translated to (x, y) and clipped to (0, 0, width, height).
    std::unique_ptr<Graphics> create(i32 x, i32 y, i32 width, i32 height);

    /// Restore the canvas to its save count before this context existed.
    /// Later calls do nothing.
    void dispose();
    bool isDisposed() const { return clips_.released(); }
    /// @}

private:
    void init();
    void applyHints();
    Paint imagePaint() const;
    void fillWith(const PaintSpec& paint, i32 x, i32 y, i32 width, i32 height);

    std::shared_ptr<Surface> surface_;
    std::shared_ptr<Canvas> canvas_;
    std::shared_ptr<BackendFactory> factory_;
    std::shared_ptr<TypefaceCache> typefaces_;

    TransformTracker tracker_{canvas_.get()};
    ClipStack clips_{canvas_.get(), &tracker_};
    PaintTranslator paints_{factory_};
    StrokeTranslator strokes_{factory_};

    Paint paint_;
    Color color_ = {0, 0, 0, 255};
    Color background_ = {0, 0, 0, 255};
    Composite composite_;
    FontSpec font_;
    Font backendFont_;
    RenderingHints hints_;
};

}
