#include "shape-renderer.h"
#include "path-builder.h"
#include <ycard/units.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <type_traits>

namespace ycard::render {

namespace {

Point toPage(float panelX, float panelY, float x, float y) {
    return {inchesToPoints(panelX + x), inchesToPoints(panelY + y)};
}

const ShapeStyle& styleOf(const Shape& shape) {
    static const ShapeStyle none;
    return std::visit([](const auto& s) -> const ShapeStyle& {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, DecorativeRef>) {
            return none;
        } else {
            return s.style;
        }
    }, shape);
}

} // namespace

Result<ShapeGeometry> shapeGeometry(const Shape& shape, float panelX, float panelY) {
    ShapeGeometry geom;

    if (auto* r = std::get_if<RectangleShape>(&shape)) {
        Point p = toPage(panelX, panelY, r->x, r->y);
        geom.box = {p.x, p.y, inchesToPoints(r->width), inchesToPoints(r->height)};
        geom.outline.addRect(geom.box);
        geom.pivot = geom.box.center();
        return Ok(std::move(geom));
    }

    if (auto* c = std::get_if<CircleShape>(&shape)) {
        Point center = toPage(panelX, panelY, c->centerX, c->centerY);
        float radius = inchesToPoints(c->radius);
        geom.outline.addCircle(center.x, center.y, radius);
        geom.box = {center.x - radius, center.y - radius, radius * 2, radius * 2};
        geom.pivot = center;
        return Ok(std::move(geom));
    }

    if (auto* t = std::get_if<TriangleShape>(&shape)) {
        Point a = toPage(panelX, panelY, t->x1, t->y1);
        Point b = toPage(panelX, panelY, t->x2, t->y2);
        Point c = toPage(panelX, panelY, t->x3, t->y3);
        geom.outline.addPolygon({a, b, c});
        float minX = std::min({a.x, b.x, c.x});
        float minY = std::min({a.y, b.y, c.y});
        float maxX = std::max({a.x, b.x, c.x});
        float maxY = std::max({a.y, b.y, c.y});
        geom.box = {minX, minY, maxX - minX, maxY - minY};
        geom.pivot = centroid(a, b, c);
        return Ok(std::move(geom));
    }

    if (auto* s = std::get_if<StarShape>(&shape)) {
        Point center = toPage(panelX, panelY, s->centerX, s->centerY);
        float outer = inchesToPoints(s->outerRadius);
        geom.outline.addPolygon(starVertices(center.x, center.y, outer,
                                             inchesToPoints(s->innerRadius), s->points));
        geom.box = {center.x - outer, center.y - outer, outer * 2, outer * 2};
        geom.pivot = center;
        return Ok(std::move(geom));
    }

    if (auto* l = std::get_if<LineShape>(&shape)) {
        Point a = toPage(panelX, panelY, l->startX, l->startY);
        Point b = toPage(panelX, panelY, l->endX, l->endY);
        geom.outline.moveTo(a.x, a.y);
        geom.outline.lineTo(b.x, b.y);
        geom.box = geom.outline.bounds();
        geom.pivot = {(a.x + b.x) / 2, (a.y + b.y) / 2};
        geom.closed = false;
        return Ok(std::move(geom));
    }

    if (auto* p = std::get_if<PathShape>(&shape)) {
        PathMapping mapping{inchesToPoints(panelX), inchesToPoints(panelY), inchesToPoints(p->scale)};
        auto built = buildPath(p->pathData, mapping);
        if (!built) {
            return Err<ShapeGeometry>("Failed to build SVG path shape", built);
        }
        geom.outline = std::move(*built);
        geom.box = geom.outline.bounds();
        geom.pivot = geom.box.center();
        return Ok(std::move(geom));
    }

    return Err<ShapeGeometry>(std::string("Cannot draw ") + shapeTypeName(shape) +
                              " directly, expand it first");
}

Result<ShapeRenderer::Ptr> ShapeRenderer::create() {
    auto renderer = Ptr(new ShapeRenderer());
    if (auto res = renderer->init(); !res) {
        return Err<Ptr>("Failed to initialize ShapeRenderer", res);
    }
    return Ok(std::move(renderer));
}

Result<void> ShapeRenderer::init() {
    auto gradients = GradientRenderer::create();
    if (!gradients) {
        return Err("Failed to create GradientRenderer", gradients);
    }
    _gradients = *gradients;

    auto patterns = PatternRenderer::create();
    if (!patterns) {
        return Err("Failed to create PatternRenderer", patterns);
    }
    _patterns = *patterns;
    return Ok();
}

bool ShapeRenderer::applyFill(DrawingSurface& surface, const ShapeStyle& style, const ShapeGeometry& geom) {
    if (style.fill) {
        const FillStyle& fill = *style.fill;
        if (auto* solid = std::get_if<SolidFill>(&fill)) {
            surface.setFillColor(solid->color);
            return true;
        }
        if (auto* linear = std::get_if<LinearGradientFill>(&fill)) {
            _gradients->fillLinear(surface, *linear, geom.box, geom.outline);
            return false;
        }
        if (auto* radial = std::get_if<RadialGradientFill>(&fill)) {
            _gradients->fillRadial(surface, *radial, geom.box, geom.outline);
            return false;
        }
        if (auto* pattern = std::get_if<PatternFill>(&fill)) {
            _patterns->fill(surface, *pattern, geom.box, geom.outline);
            return false;
        }
    }
    if (style.fillColor) {
        surface.setFillColor(*style.fillColor);
        return true;
    }
    return false;
}

Result<void> ShapeRenderer::render(DrawingSurface& surface, const Shape& shape, float panelX, float panelY) {
    auto geom = shapeGeometry(shape, panelX, panelY);
    if (!geom) {
        return Err(std::string("Failed to render ") + shapeTypeName(shape), geom);
    }
    const ShapeStyle& style = styleOf(shape);
    const bool isLine = std::holds_alternative<LineShape>(shape);

    surface.pushState();

    if (style.opacity < 1.0f) {
        surface.setOpacity(style.opacity);
    }
    if (style.rotation != 0.0f) {
        surface.rotateAbout(geom->pivot.x, geom->pivot.y, style.rotation);
    }

    bool fill = false;
    bool stroke = false;
    if (isLine) {
        // lines always stroke: black and 1pt unless set
        surface.setStrokeColor(style.strokeColor.value_or(colors::Black));
        surface.setLineWidth(style.strokeWidth > 0.0f ? style.strokeWidth : 1.0f);
        stroke = true;
    } else {
        fill = applyFill(surface, style, *geom);
        if (style.strokeColor && style.strokeWidth > 0.0f) {
            surface.setStrokeColor(*style.strokeColor);
            surface.setLineWidth(style.strokeWidth);
            stroke = true;
        }
    }

    if (fill || stroke) {
        surface.drawPath(geom->outline, fill, stroke);
    }

    surface.popState();

    ydebug("Rendered {} at ({:.2f},{:.2f},{:.2f},{:.2f})pts fill={} stroke={}",
           shapeTypeName(shape), geom->box.x, geom->box.y, geom->box.width, geom->box.height, fill, stroke);
    return Ok();
}

} // namespace ycard::render
