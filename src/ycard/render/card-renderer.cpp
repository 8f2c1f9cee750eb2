#include <ycard/card-renderer.h>
#include <ycard/units.h>
#include "clipping-renderer.h"
#include "shape-renderer.h"
#include "ycard/text/text-fitter.h"
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <type_traits>
#include <variant>

namespace ycard {

ImageSize computeImageSize(float naturalWidth, float naturalHeight,
                           std::optional<float> targetWidth, std::optional<float> targetHeight,
                           bool preserveAspect, float maxWidth, float maxHeight) {
    float aspect = naturalHeight > 0.0f ? naturalWidth / naturalHeight : 1.0f;

    if (targetWidth && targetHeight) {
        if (!preserveAspect) {
            return {*targetWidth, *targetHeight};
        }
        if (*targetHeight > 0.0f && *targetWidth / *targetHeight > aspect) {
            return {*targetHeight * aspect, *targetHeight};
        }
        return {*targetWidth, *targetWidth / aspect};
    }
    if (targetWidth) {
        return preserveAspect ? ImageSize{*targetWidth, *targetWidth / aspect}
                              : ImageSize{*targetWidth, naturalHeight};
    }
    if (targetHeight) {
        return preserveAspect ? ImageSize{*targetHeight * aspect, *targetHeight}
                              : ImageSize{naturalWidth, *targetHeight};
    }

    float width = std::min(naturalWidth, maxWidth);
    float height = std::min(naturalHeight, maxHeight);
    if (preserveAspect && naturalWidth > 0.0f && naturalHeight > 0.0f) {
        float scale = std::min(width / naturalWidth, height / naturalHeight);
        return {naturalWidth * scale, naturalHeight * scale};
    }
    return {width, height};
}

namespace {

enum class ElementKind { Shape, Image, Text };

struct Entry {
    ElementKind kind;
    size_t index;   // into the panel's list for this kind
    int zIndex;
};

// Keeps values inside [lo, hi], preferring lo when the range is empty
float clampToSafeArea(float value, float lo, float hi) {
    return std::max(lo, std::min(value, hi));
}

const std::vector<float>& borderDash(BorderStyle style) {
    static const std::vector<float> solid;
    static const std::vector<float> dashed = {6.0f, 3.0f};
    static const std::vector<float> dotted = {1.0f, 2.0f};
    static const std::vector<float> decorative = {8.0f, 2.0f, 2.0f, 2.0f};
    switch (style) {
        case BorderStyle::Solid:      return solid;
        case BorderStyle::Dashed:     return dashed;
        case BorderStyle::Dotted:     return dotted;
        case BorderStyle::Decorative: return decorative;
    }
    return solid;
}

constexpr Color FOLD_LINE_COLOR{0.7f, 0.7f, 0.7f};

} // namespace

class CardRendererImpl : public CardRenderer {
public:
    CardRendererImpl(Options options, DecorativeLibrary::Ptr library) noexcept
        : _options(options), _library(std::move(library)) {}

    ~CardRendererImpl() override = default;

    Result<void> init() noexcept {
        auto shapes = render::ShapeRenderer::create();
        if (!shapes) {
            return Err("Failed to create ShapeRenderer", shapes);
        }
        _shapes = *shapes;

        auto clipping = render::ClippingRenderer::create();
        if (!clipping) {
            return Err("Failed to create ClippingRenderer", clipping);
        }
        _clipping = *clipping;
        ydebug("{} #{}: fold lines {}, clamp images {}", typeName(), id(),
               _options.foldLines, _options.clampImages);
        return Ok();
    }

    const Options& options() const override { return _options; }

    Result<RenderReport> render(DrawingSurface& surface, const Card& card) override {
        RenderReport report;
        yinfo("Rendering card '{}' ({}, {} panels)", card.name, toString(card.foldType), card.panels.size());

        surface.beginPage(inchesToPoints(PAGE_WIDTH), inchesToPoints(PAGE_HEIGHT));
        for (const auto& panel : card.panels) {
            renderPanel(surface, panel, report);
        }
        if (_options.foldLines) {
            drawFoldLines(surface, card.foldType);
        }
        surface.endPage();

        if (report.elementsFailed > 0) {
            ywarn("Card '{}' rendered with {} failed element(s)", card.name, report.elementsFailed);
        } else {
            yinfo("Card '{}' rendered: {} elements", card.name, report.elementsRendered);
        }
        return Ok(std::move(report));
    }

    void renderPanel(DrawingSurface& surface, const Panel& panel, RenderReport& report) override {
        Rect frame{inchesToPoints(panel.x), inchesToPoints(panel.y),
                   inchesToPoints(panel.width), inchesToPoints(panel.height)};

        surface.pushState();
        if (panel.rotation != 0.0f) {
            Point c = frame.center();
            surface.rotateAbout(c.x, c.y, panel.rotation);
        }

        if (panel.backgroundColor) {
            Path background;
            background.addRect(frame);
            surface.setFillColor(*panel.backgroundColor);
            surface.drawPath(background, true, false);
        }
        if (panel.border) {
            drawBorder(surface, frame, *panel.border);
        }

        std::vector<Entry> entries;
        for (size_t i = 0; i < panel.shapeElements.size(); i++) {
            entries.push_back({ElementKind::Shape, i, shapeZIndex(panel.shapeElements[i])});
        }
        for (size_t i = 0; i < panel.imageElements.size(); i++) {
            entries.push_back({ElementKind::Image, i, panel.imageElements[i].zIndex});
        }
        for (size_t i = 0; i < panel.textElements.size(); i++) {
            entries.push_back({ElementKind::Text, i, panel.textElements[i].zIndex});
        }
        // Stable: equal z keeps declaration order
        std::stable_sort(entries.begin(), entries.end(),
                         [](const Entry& a, const Entry& b) { return a.zIndex < b.zIndex; });

        for (const auto& entry : entries) {
            std::string id, kind;
            Result<void> res = Ok();
            switch (entry.kind) {
                case ElementKind::Shape: {
                    const Shape& shape = panel.shapeElements[entry.index];
                    kind = shapeTypeName(shape);
                    id = shapeId(shape);
                    res = renderShape(surface, panel, shape);
                    break;
                }
                case ElementKind::Image: {
                    const ImageElement& image = panel.imageElements[entry.index];
                    kind = "image";
                    id = image.id;
                    res = renderImage(surface, panel, image);
                    break;
                }
                case ElementKind::Text: {
                    const TextElement& text = panel.textElements[entry.index];
                    kind = "text";
                    id = text.id;
                    res = renderText(surface, panel, text, report);
                    break;
                }
            }

            if (res) {
                report.elementsRendered++;
            } else {
                ywarn("Panel '{}': skipped {} '{}': {}", panel.id, kind, id, error_msg(res));
                report.elementsFailed++;
                report.failures.push_back({panel.id, id, kind, error_msg(res)});
            }
        }

        surface.popState();
        report.panelsRendered++;
    }

    void drawFoldLines(DrawingSurface& surface, FoldType foldType) override {
        const float width = inchesToPoints(PAGE_WIDTH);
        const float height = inchesToPoints(PAGE_HEIGHT);

        Path lines;
        switch (foldType) {
            case FoldType::HalfFold:
                lines.moveTo(0.0f, height / 2);
                lines.lineTo(width, height / 2);
                break;
            case FoldType::QuarterFold:
                lines.moveTo(0.0f, height / 2);
                lines.lineTo(width, height / 2);
                lines.moveTo(width / 2, 0.0f);
                lines.lineTo(width / 2, height);
                break;
            case FoldType::TriFold:
                lines.moveTo(width / 3, 0.0f);
                lines.lineTo(width / 3, height);
                lines.moveTo(width * 2 / 3, 0.0f);
                lines.lineTo(width * 2 / 3, height);
                break;
        }

        surface.pushState();
        surface.setStrokeColor(FOLD_LINE_COLOR);
        surface.setLineWidth(FOLD_LINE_WIDTH);
        surface.setDash({3.0f, 3.0f});
        surface.drawPath(lines, false, true);
        surface.popState();
    }

private:
    static std::string shapeId(const Shape& shape) {
        return std::visit([](const auto& s) -> std::string {
            if constexpr (std::is_same_v<std::decay_t<decltype(s)>, DecorativeRef>) {
                return s.id;
            } else {
                return s.style.id;
            }
        }, shape);
    }

    void drawBorder(DrawingSurface& surface, const Rect& frame, const Border& border) {
        Path outline;
        if (border.cornerRadius > 0.0f) {
            outline.addRoundRect(frame, border.cornerRadius);
        } else {
            outline.addRect(frame);
        }

        surface.pushState();
        surface.setStrokeColor(border.color);
        surface.setLineWidth(border.width);
        surface.setDash(borderDash(border.style));
        surface.drawPath(outline, false, true);
        surface.popState();
    }

    Result<void> renderShape(DrawingSurface& surface, const Panel& panel, const Shape& shape) {
        auto* ref = std::get_if<DecorativeRef>(&shape);
        if (!ref) {
            return _shapes->render(surface, shape, panel.x, panel.y);
        }

        if (!_library) {
            return Err("No decorative library loaded for '" + ref->name + "'");
        }
        auto components = _library->expand(*ref);
        if (!components) {
            return Err("Failed to expand decorative element", components);
        }

        // Draw every component that can be drawn, report the first failure
        Result<void> first = Ok();
        for (const auto& component : *components) {
            if (auto res = _shapes->render(surface, component, panel.x, panel.y); !res && first) {
                first = Err("Decorative '" + ref->name + "' component failed", res);
            }
        }
        return first;
    }

    Result<void> renderImage(DrawingSurface& surface, const Panel& panel, const ImageElement& image) {
        auto info = surface.imageInfo(image.sourcePath);
        if (!info) {
            return Err("Failed to read image", info);
        }

        ImageSize size = computeImageSize(info->naturalWidth(), info->naturalHeight(),
                                          image.width, image.height, image.preserveAspect,
                                          panel.width, panel.height);
        const float width = inchesToPoints(size.width);
        const float height = inchesToPoints(size.height);
        float x = inchesToPoints(panel.x + image.x);
        float y = inchesToPoints(panel.y + image.y);

        if (_options.clampImages) {
            const float margin = inchesToPoints(SAFE_MARGIN);
            x = clampToSafeArea(x, margin, inchesToPoints(PAGE_WIDTH) - margin - width);
            y = clampToSafeArea(y, margin, inchesToPoints(PAGE_HEIGHT) - margin - height);
        }

        surface.pushState();
        if (image.opacity < 1.0f) {
            surface.setOpacity(image.opacity);
        }
        if (image.rotation != 0.0f) {
            surface.rotateAbout(x + width / 2, y + height / 2, image.rotation);
        }

        auto draw = [&]() {
            return surface.drawImage(image.sourcePath, x, y, width, height, image.preserveAspect);
        };
        Result<void> res = image.clipMask
            ? _clipping->drawClipped(surface, *image.clipMask, x, y, draw)
            : draw();
        surface.popState();

        if (!res) {
            return Err("Failed to draw image", res);
        }
        ydebug("Image '{}' at ({}, {}) size {}x{} pt{}", image.id, x, y, width, height,
               image.clipMask ? " clipped" : "");
        return Ok();
    }

    Result<void> renderText(DrawingSurface& surface, const Panel& panel, const TextElement& text,
                            RenderReport& report) {
        auto fitted = text::fitText(surface, text, inchesToPoints(panel.height));
        if (text.width) {
            report.textAdjustments.push_back({panel.id, text.id, fitted.adjustment});
        }

        const float x = inchesToPoints(panel.x + text.x);
        const float y = inchesToPoints(panel.y + text.y);
        const float size = static_cast<float>(fitted.fontSize);
        const float step = text::lineHeight(size);

        surface.pushState();
        if (text.rotation != 0.0f) {
            surface.rotateAbout(x, y, text.rotation);
        }
        surface.setFont(text.fontName(), size);
        surface.setFillColor(text.color.value_or(colors::Black));
        for (size_t i = 0; i < fitted.lines.size(); i++) {
            surface.drawText(fitted.lines[i], x, y - static_cast<float>(i) * step, text.alignment);
        }
        surface.popState();
        return Ok();
    }

    Options _options;
    DecorativeLibrary::Ptr _library;
    render::ShapeRenderer::Ptr _shapes;
    render::ClippingRenderer::Ptr _clipping;
};

Result<CardRenderer::Ptr> CardRenderer::createImpl(ContextType&, Options options,
                                                   DecorativeLibrary::Ptr library) noexcept {
    auto impl = Ptr(new CardRendererImpl(options, std::move(library)));
    if (auto res = static_cast<CardRendererImpl*>(impl.get())->init(); !res) {
        return Err<Ptr>("Failed to initialize CardRenderer", res);
    }
    return Ok(impl);
}

Result<CardRenderer::Ptr> CardRenderer::createImpl(ContextType& ctx, Config::Ptr config,
                                                   DecorativeLibrary::Ptr library) noexcept {
    Options options;
    if (config) {
        options.foldLines = config->foldLines();
        options.clampImages = config->clampImages();
    }
    return createImpl(ctx, options, std::move(library));
}

} // namespace ycard
