#include "etch/graphics.hpp"
#include "etch/area.hpp"
#include "etch/log.hpp"
#include "etch/path_builder.hpp"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace etch {

namespace {

template <typename T>
std::shared_ptr<T> requireNonNull(std::shared_ptr<T> p, const char* name) {
    if (!p) {
        throw std::invalid_argument(std::string("Null '") + name + "' argument.");
    }
    return p;
}

std::shared_ptr<Surface> makeSurface(i32 width, i32 height) {
    std::shared_ptr<Surface> surface = Surface::MakeRecording(width, height);
    if (!surface) {
        throw std::invalid_argument("graphics size must be positive");
    }
    return surface;
}

void checkPoints(const i32* xPoints, const i32* yPoints, i32 count) {
    if (count > 0 && (!xPoints || !yPoints)) {
        throw std::invalid_argument("Null point array argument.");
    }
}

}

Graphics::Graphics(i32 width, i32 height,
                   std::shared_ptr<BackendFactory> factory,
                   std::shared_ptr<TypefaceCache> typefaces)
    : surface_(makeSurface(width, height)),
      canvas_(surface_->sharedCanvas()),
      factory_(requireNonNull(std::move(factory), "factory")),
      typefaces_(requireNonNull(std::move(typefaces), "typefaces")) {
    logDebug("Graphics(%d, %d)", width, height);
    init();
}

Graphics::Graphics(std::shared_ptr<Canvas> canvas,
                   std::shared_ptr<BackendFactory> factory,
                   std::shared_ptr<TypefaceCache> typefaces)
    : canvas_(requireNonNull(std::move(canvas), "canvas")),
      factory_(requireNonNull(std::move(factory), "factory")),
      typefaces_(requireNonNull(std::move(typefaces), "typefaces")) {
    logDebug("Graphics(Canvas)");
    init();
}

Graphics::~Graphics() {
    dispose();
}

void Graphics::init() {
    paint_.setColor(color_);
    strokes_.reset(StrokeSpec{}, paint_);
    paint_.setBlendMode(toBlendMode(composite_.rule));
    paint_.setAlphaf(composite_.alpha);
    applyHints();
    setFont(FontSpec{});
    logDebug("baseline save count %d", clips_.baselineCount());
}

void Graphics::applyHints() {
    bool aa = hints_.antialiasing();
    paint_.setAntiAlias(aa);
    clips_.setAntiAlias(aa);
}

// --- Shapes ---

void Graphics::draw(const Shape& shape) {
    logDebug("draw(Shape)");
    paint_.setMode(PaintMode::Stroke);
    if (const auto* line = dynamic_cast<const LineShape*>(&shape)) {
        PointD a = line->p1();
        PointD b = line->p2();
        canvas_->drawLine(f32(a.x), f32(a.y), f32(b.x), f32(b.y), paint_);
    } else if (const auto* rect = dynamic_cast<const RectShape*>(&shape)) {
        const RectD& r = rect->rect();
        if (r.w <= 0 || r.h <= 0) {
            return;
        }
        canvas_->drawRect({f32(r.x), f32(r.y), f32(r.w), f32(r.h)}, paint_);
    } else if (const auto* oval = dynamic_cast<const EllipseShape*>(&shape)) {
        const RectD& f = oval->frame();
        canvas_->drawOval({f32(f.x), f32(f.y), f32(f.w), f32(f.h)}, paint_);
    } else {
        canvas_->drawPath(PathBuilder::Build(shape), paint_);
    }
}

void Graphics::fill(const Shape& shape) {
    logDebug("fill(Shape)");
    paint_.setMode(PaintMode::Fill);
    if (const auto* rect = dynamic_cast<const RectShape*>(&shape)) {
        const RectD& r = rect->rect();
        if (r.w <= 0 || r.h <= 0) {
            return;
        }
        canvas_->drawRect({f32(r.x), f32(r.y), f32(r.w), f32(r.h)}, paint_);
    } else if (const auto* oval = dynamic_cast<const EllipseShape*>(&shape)) {
        const RectD& f = oval->frame();
        canvas_->drawOval({f32(f.x), f32(f.y), f32(f.w), f32(f.h)}, paint_);
    } else {
        auto it = shape.pathIterator();
        WindingRule rule = it->windingRule();
        Path path = PathBuilder::Build(*it);
        path.setFillMode(PathBuilder::FillModeFor(rule));
        canvas_->drawPath(path, paint_);
    }
}

void Graphics::drawLine(i32 x1, i32 y1, i32 x2, i32 y2) {
    logDebug("drawLine(%d, %d, %d, %d)", x1, y1, x2, y2);
    draw(LineShape(x1, y1, x2, y2));
}

void Graphics::drawRect(i32 x, i32 y, i32 width, i32 height) {
    logDebug("drawRect(%d, %d, %d, %d)", x, y, width, height);
    draw(RectShape(x, y, width, height));
}

void Graphics::fillRect(i32 x, i32 y, i32 width, i32 height) {
    logDebug("fillRect(%d, %d, %d, %d)", x, y, width, height);
    fill(RectShape(x, y, width, height));
}

void Graphics::fillWith(const PaintSpec& paint, i32 x, i32 y, i32 width, i32 height) {
    PaintSpec saved = getPaint();
    Color savedColor = color_;
    setPaint(paint);
    fillRect(x, y, width, height);
    setPaint(saved);
    color_ = savedColor;
}

void Graphics::clearRect(i32 x, i32 y, i32 width, i32 height) {
    logDebug("clearRect(%d, %d, %d, %d)", x, y, width, height);
    fillWith(background_, x, y, width, height);
}

void Graphics::drawRoundRect(i32 x, i32 y, i32 width, i32 height, i32 arcWidth, i32 arcHeight) {
    logDebug("drawRoundRect(%d, %d, %d, %d, %d, %d)", x, y, width, height, arcWidth, arcHeight);
    draw(RoundRectShape(x, y, width, height, arcWidth, arcHeight));
}

void Graphics::fillRoundRect(i32 x, i32 y, i32 width, i32 height, i32 arcWidth, i32 arcHeight) {
    logDebug("fillRoundRect(%d, %d, %d, %d, %d, %d)", x, y, width, height, arcWidth, arcHeight);
    fill(RoundRectShape(x, y, width, height, arcWidth, arcHeight));
}

void Graphics::drawOval(i32 x, i32 y, i32 width, i32 height) {
    logDebug("drawOval(%d, %d, %d, %d)", x, y, width, height);
    draw(EllipseShape(x, y, width, height));
}

void Graphics::fillOval(i32 x, i32 y, i32 width, i32 height) {
    logDebug("fillOval(%d, %d, %d, %d)", x, y, width, height);
    fill(EllipseShape(x, y, width, height));
}

void Graphics::drawArc(i32 x, i32 y, i32 width, i32 height, i32 startAngle, i32 arcAngle) {
    logDebug("drawArc(%d, %d, %d, %d, %d, %d)", x, y, width, height, startAngle, arcAngle);
    draw(ArcShape(x, y, width, height, startAngle, arcAngle, ArcType::Open));
}

void Graphics::fillArc(i32 x, i32 y, i32 width, i32 height, i32 startAngle, i32 arcAngle) {
    logDebug("fillArc(%d, %d, %d, %d, %d, %d)", x, y, width, height, startAngle, arcAngle);
    fill(ArcShape(x, y, width, height, startAngle, arcAngle, ArcType::Open));
}

PathShape Graphics::createPolygon(const i32* xPoints, const i32* yPoints, i32 count, bool close) {
    checkPoints(xPoints, yPoints, count);
    std::vector<PointD> pts;
    for (i32 i = 0; i < count; ++i) {
        pts.push_back({f64(xPoints[i]), f64(yPoints[i])});
    }
    return makePolygon(pts.data(), count, close);
}

void Graphics::drawPolyline(const i32* xPoints, const i32* yPoints, i32 count) {
    logDebug("drawPolyline(%d points)", count);
    draw(createPolygon(xPoints, yPoints, count, false));
}

void Graphics::drawPolygon(const i32* xPoints, const i32* yPoints, i32 count) {
    logDebug("drawPolygon(%d points)", count);
    draw(createPolygon(xPoints, yPoints, count, true));
}

void Graphics::fillPolygon(const i32* xPoints, const i32* yPoints, i32 count) {
    logDebug("fillPolygon(%d points)", count);
    fill(createPolygon(xPoints, yPoints, count, true));
}

bool Graphics::hit(const RectI& rect, const Shape& shape, bool onStroke) const {
    logDebug("hit(%d, %d, %d, %d, %d)", rect.x, rect.y, rect.w, rect.h, onStroke);
    const AffineTransform& t = tracker_.transform();
    std::optional<PathShape> device;
    if (onStroke) {
        f64 half = std::max(getStroke().width, StrokeTranslator::kMinStrokeWidth) / 2.0;
        RectD b = shape.bounds();
        device.emplace(RectShape(b.x - half, b.y - half, b.w + 2 * half, b.h + 2 * half), &t);
    } else {
        device.emplace(shape, &t);
    }

    RectShape area(f64(rect.x), f64(rect.y), f64(rect.w), f64(rect.h));
    if (!area.bounds().intersects(device->bounds())) {
        return false;
    }
    return !intersectShapes(area, *device).isEmpty();
}

// --- Text ---

void Graphics::drawString(std::string_view text, f32 x, f32 y) {
    logDebug("drawString(%.*s, %g, %g)", static_cast<int>(text.size()), text.data(), x, y);
    paint_.setMode(PaintMode::Fill);
    canvas_->drawString(text, x, y, backendFont_, paint_);
}

void Graphics::drawString(const char* text, f32 x, f32 y) {
    if (!text) {
        throw std::invalid_argument("Null 'str' argument.");
    }
    drawString(std::string_view(text), x, y);
}

void Graphics::drawString(const AttributedString& text, f32 x, f32 y) {
    logDebug("drawString(AttributedString, %g, %g)", x, y);
    if (!text.hasAttributes()) {
        drawString(std::string_view(text.plainText()), x, y);
        return;
    }

    FontSpec savedFont = font_;
    PaintSpec savedPaint = getPaint();
    f32 cursor = x;
    for (const TextRun& run : text.runs()) {
        setFont(run.font ? *run.font : savedFont);
        if (run.color) {
            setPaint(*run.color);
        } else {
            setPaint(savedPaint);
        }
        drawString(std::string_view(run.text), cursor, y);
        cursor += backendFont_.measureText(run.text);
    }
    setFont(savedFont);
    setPaint(savedPaint);
}

// --- Images ---

Paint Graphics::imagePaint() const {
    Paint p;
    p.setAlphaf(paint_.alphaf());
    p.setBlendMode(paint_.blendMode());
    p.setAntiAlias(paint_.isAntiAlias());
    return p;
}

bool Graphics::drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y) {
    logDebug("drawImage(Image, %d, %d)", x, y);
    if (!image) {
        return true;
    }
    return drawImage(image, x, y, image->width(), image->height());
}

bool Graphics::drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y,
                         i32 width, i32 height) {
    logDebug("drawImage(Image, %d, %d, %d, %d)", x, y, width, height);
    if (!image || width <= 0 || height <= 0) {
        return true;
    }
    Paint p = imagePaint();
    canvas_->drawImageRect(image, image->bounds(),
                           {f32(x), f32(y), f32(width), f32(height)}, &p);
    return true;
}

bool Graphics::drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y, Color background) {
    logDebug("drawImage(Image, %d, %d, Color)", x, y);
    if (!image) {
        return true;
    }
    return drawImage(image, x, y, image->width(), image->height(), background);
}

bool Graphics::drawImage(const std::shared_ptr<Image>& image, i32 x, i32 y,
                         i32 width, i32 height, Color background) {
    logDebug("drawImage(Image, %d, %d, %d, %d, Color)", x, y, width, height);
    fillWith(background, x, y, width, height);
    return drawImage(image, x, y, width, height);
}

bool Graphics::drawImage(const std::shared_ptr<Image>& image,
                         i32 dx1, i32 dy1, i32 dx2, i32 dy2,
                         i32 sx1, i32 sy1, i32 sx2, i32 sy2) {
    logDebug("drawImage(Image, %d, %d, %d, %d, %d, %d, %d, %d)",
             dx1, dy1, dx2, dy2, sx1, sy1, sx2, sy2);
    if (!image) {
        return true;
    }
    Rect dst = {f32(dx1), f32(dy1), f32(dx2 - dx1), f32(dy2 - dy1)};
    Rect src = {f32(sx1), f32(sy1), f32(sx2 - sx1), f32(sy2 - sy1)};
    if (dst.isEmpty() || src.isEmpty()) {
        return true;
    }
    Paint p = imagePaint();
    canvas_->drawImageRect(image, src, dst, &p);
    return true;
}

bool Graphics::drawImage(const std::shared_ptr<Image>& image,
                         i32 dx1, i32 dy1, i32 dx2, i32 dy2,
                         i32 sx1, i32 sy1, i32 sx2, i32 sy2, Color background) {
    fillWith(background, dx1, dy1, dx2 - dx1, dy2 - dy1);
    return drawImage(image, dx1, dy1, dx2, dy2, sx1, sy1, sx2, sy2);
}

bool Graphics::drawImage(const std::shared_ptr<Image>& image, const AffineTransform& xform) {
    logDebug("drawImage(Image, AffineTransform)");
    AffineTransform saved = getTransform();
    transform(xform);
    bool result = drawImage(image, 0, 0);
    setTransform(saved);
    return result;
}

// --- Paint, stroke, composite ---

void Graphics::setPaint(const PaintSpec& paint) {
    logDebug("setPaint(kind %zu)", paint.index());
    if (!paints_.apply(paint, paint_)) {
        return;
    }
    if (const Color* c = std::get_if<Color>(&paint)) {
        color_ = *c;
    }
}

void Graphics::setPaint(const PaintSpec* paint) {
    if (!paint) {
        return;
    }
    setPaint(*paint);
}

void Graphics::setColor(Color c) {
    logDebug("setColor(0x%08x)", c.argb());
    if (c == color_) {
        return;
    }
    color_ = c;
    setPaint(PaintSpec(c));
}

void Graphics::setBackground(Color c) {
    background_ = c;
}

void Graphics::setStroke(const StrokeSpec& stroke) {
    logDebug("setStroke(width %g)", stroke.width);
    strokes_.apply(stroke, paint_);
}

void Graphics::setComposite(const Composite& composite) {
    logDebug("setComposite(%d, %g)", static_cast<int>(composite.rule), composite.alpha);
    composite_ = Composite::Make(composite.rule, composite.alpha);
    paint_.setAlphaf(composite_.alpha);
    paint_.setBlendMode(toBlendMode(composite_.rule));
}

// --- Fonts ---

void Graphics::setFont(const FontSpec& font) {
    logDebug("setFont(%s, %d, %g)", font.family.c_str(), static_cast<int>(font.style), font.size);
    std::shared_ptr<const Typeface> face =
        typefaces_->resolve(font.family, font.style, *factory_, hints_.fontMapping());
    font_ = font;
    backendFont_ = Font(std::move(face), font.size);
}

FontMetrics Graphics::getFontMetrics() const {
    return FontMetrics(font_, backendFont_);
}

FontMetrics Graphics::getFontMetrics(const FontSpec& font) {
    std::shared_ptr<const Typeface> face =
        typefaces_->resolve(font.family, font.style, *factory_, hints_.fontMapping());
    return FontMetrics(font, Font(std::move(face), font.size));
}

// --- Rendering hints ---

void Graphics::setRenderingHint(HintKey key, HintEntry value) {
    logDebug("setRenderingHint(%d)", static_cast<int>(key));
    hints_.set(key, std::move(value));
    applyHints();
}

void Graphics::setRenderingHints(const RenderingHints& hints) {
    logDebug("setRenderingHints(%zu)", hints.size());
    hints_ = hints;
    applyHints();
}

void Graphics::addRenderingHints(const RenderingHints& hints) {
    logDebug("addRenderingHints(%zu)", hints.size());
    hints_.merge(hints);
    applyHints();
}

// --- Transform ---

void Graphics::translate(f64 tx, f64 ty) {
    logDebug("translate(%g, %g)", tx, ty);
    tracker_.translate(tx, ty);
}

void Graphics::rotate(f64 theta) {
    logDebug("rotate(%g)", theta);
    tracker_.rotate(theta);
}

void Graphics::rotate(f64 theta, f64 x, f64 y) {
    logDebug("rotate(%g, %g, %g)", theta, x, y);
    tracker_.rotate(theta, x, y);
}

void Graphics::scale(f64 sx, f64 sy) {
    logDebug("scale(%g, %g)", sx, sy);
    tracker_.scale(sx, sy);
}

void Graphics::shear(f64 shx, f64 shy) {
    logDebug("shear(%g, %g)", shx, shy);
    tracker_.shear(shx, shy);
}

void Graphics::transform(const AffineTransform& t) {
    logDebug("transform(AffineTransform)");
    tracker_.concatenate(t);
}

void Graphics::setTransform(const AffineTransform& t) {
    logDebug("setTransform(AffineTransform)");
    tracker_.setTransform(t);
}

// --- Clip ---

std::optional<RectI> Graphics::getClipBounds() const {
    std::optional<PathShape> clip = getClip();
    if (!clip) {
        return std::nullopt;
    }
    return enclosingRect(clip->bounds());
}

void Graphics::setClip(const Shape* shape) {
    logDebug("setClip(%s)", shape ? "Shape" : "null");
    clips_.setClip(shape);
}

void Graphics::setClip(i32 x, i32 y, i32 width, i32 height) {
    logDebug("setClip(%d, %d, %d, %d)", x, y, width, height);
    RectShape r(x, y, width, height);
    clips_.setClip(&r);
}

void Graphics::clip(const Shape& shape) {
    logDebug("clip(Shape)");
    clips_.clip(shape);
}

void Graphics::clipRect(i32 x, i32 y, i32 width, i32 height) {
    logDebug("clipRect(%d, %d, %d, %d)", x, y, width, height);
    clips_.clip(RectShape(x, y, width, height));
}

// --- Derived contexts ---

std::unique_ptr<Graphics> Graphics::create() {
    logDebug("create()");
    auto copy = std::make_unique<Graphics>(canvas_, factory_, typefaces_);
    copy->surface_ = surface_;
    copy->setRenderingHints(hints_);
    copy->setTransform(getTransform());
    copy->clips_.adoptClip(clips_.deviceClip());
    copy->setPaint(getPaint());
    copy->color_ = color_;
    copy->setComposite(composite_);
    copy->setStroke(getStroke());
    copy->setFont(font_);
    copy->setBackground(background_);
    return copy;
}

std::unique_ptr<Graphics> Graphics::create(i32 x, i32 y, i32 width, i32 height) {
    logDebug("create(%d, %d, %d, %d)", x, y, width, height);
    std::unique_ptr<Graphics> g = create();
    g->translate(x, y);
    g->clipRect(0, 0, width, height);
    return g;
}

void Graphics::dispose() {
    if (clips_.released()) {
        return;
    }
    logDebug("dispose()");
    clips_.release();
}

}
