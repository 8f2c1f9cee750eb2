#include "gradient-renderer.h"
#include <ytrace/ytrace.hpp>
#include <cmath>

namespace ycard::render {

GradientLine linearEndpoints(float angleDegrees, const Rect& box) {
    float angle = std::fmod(angleDegrees, 360.0f);
    if (angle < 0.0f) angle += 360.0f;

    float rad = toRadians(angle);
    float half = box.diagonal() / 2;
    float dx = std::cos(rad) * half;
    float dy = std::sin(rad) * half;
    Point c = box.center();
    return {{c.x - dx, c.y - dy}, {c.x + dx, c.y + dy}};
}

RadialGeometry radialGeometry(const RadialGradientFill& fill, const Rect& box) {
    return {
        {box.x + fill.centerX * box.width, box.y + fill.centerY * box.height},
        fill.radius * box.diagonal(),
    };
}

Result<GradientRenderer::Ptr> GradientRenderer::create() {
    return Ok(Ptr(new GradientRenderer()));
}

bool GradientRenderer::fillLinear(DrawingSurface& surface, const LinearGradientFill& fill,
                                  const Rect& box, const Path& outline) {
    if (auto res = paintLinear(surface, fill, box, outline); !res) {
        yerror("Failed to render linear gradient: {}", error_msg(res));
        fallback(surface, fill.stops, outline);
        return false;
    }
    return true;
}

bool GradientRenderer::fillRadial(DrawingSurface& surface, const RadialGradientFill& fill,
                                  const Rect& box, const Path& outline) {
    if (auto res = paintRadial(surface, fill, box, outline); !res) {
        yerror("Failed to render radial gradient: {}", error_msg(res));
        fallback(surface, fill.stops, outline);
        return false;
    }
    return true;
}

Result<void> GradientRenderer::paintLinear(DrawingSurface& surface, const LinearGradientFill& fill,
                                           const Rect& box, const Path& outline) {
    if (auto res = validateStops(fill.stops); !res) {
        return Err("Invalid gradient stops", res);
    }
    if (box.diagonal() <= 0.0f) {
        return Err("Gradient box has zero size");
    }

    GradientLine line = linearEndpoints(fill.angle, box);
    ydebug("Linear gradient: angle={} stops={} ({}, {}) -> ({}, {})",
           fill.angle, fill.stops.size(), line.start.x, line.start.y, line.end.x, line.end.y);

    surface.pushState();
    surface.clipTo(outline);
    Result<void> res = Ok();
    if (surface.supportsGradients()) {
        res = surface.linearGradient(line.start, line.end, fill.stops);
    } else {
        synthesizeLinear(surface, line, box.diagonal() / 2, fill.stops);
    }
    surface.popState();
    return res;
}

Result<void> GradientRenderer::paintRadial(DrawingSurface& surface, const RadialGradientFill& fill,
                                           const Rect& box, const Path& outline) {
    if (auto res = validateStops(fill.stops); !res) {
        return Err("Invalid gradient stops", res);
    }
    RadialGeometry geom = radialGeometry(fill, box);
    if (geom.radius <= 0.0f) {
        return Err("Radial gradient radius is zero");
    }
    ydebug("Radial gradient: center=({}, {}) radius={} stops={}",
           geom.center.x, geom.center.y, geom.radius, fill.stops.size());

    surface.pushState();
    surface.clipTo(outline);
    Result<void> res = Ok();
    if (surface.supportsGradients()) {
        res = surface.radialGradient(geom.center, geom.radius, fill.stops);
    } else {
        synthesizeRadial(surface, geom, box, fill.stops);
    }
    surface.popState();
    return res;
}

void GradientRenderer::synthesizeLinear(DrawingSurface& surface, const GradientLine& line,
                                        float halfWidth, const std::vector<ColorStop>& stops) {
    float ax = line.end.x - line.start.x;
    float ay = line.end.y - line.start.y;
    float len = std::sqrt(ax * ax + ay * ay);
    float ux = ax / len, uy = ay / len;
    // perpendicular, long enough to cover the box from its center
    float px = -uy * halfWidth, py = ux * halfWidth;

    for (int i = 0; i < SYNTH_STEPS; i++) {
        float t0 = static_cast<float>(i) / SYNTH_STEPS;
        float t1 = static_cast<float>(i + 1) / SYNTH_STEPS;
        Point a{line.start.x + ax * t0, line.start.y + ay * t0};
        Point b{line.start.x + ax * t1, line.start.y + ay * t1};

        Path band;
        band.addPolygon({
            {a.x - px, a.y - py}, {b.x - px, b.y - py},
            {b.x + px, b.y + py}, {a.x + px, a.y + py},
        });
        surface.setFillColor(colorAt(stops, (t0 + t1) / 2));
        surface.drawPath(band, true, false);
    }
}

void GradientRenderer::synthesizeRadial(DrawingSurface& surface, const RadialGeometry& geom,
                                        const Rect& box, const std::vector<ColorStop>& stops) {
    // Outside the radius the last stop extends
    Path backdrop;
    backdrop.addRect(box);
    surface.setFillColor(stops.back().color);
    surface.drawPath(backdrop, true, false);

    for (int i = SYNTH_STEPS - 1; i >= 0; i--) {
        float r = geom.radius * static_cast<float>(i + 1) / SYNTH_STEPS;
        Path ring;
        ring.addCircle(geom.center.x, geom.center.y, r);
        surface.setFillColor(colorAt(stops, (static_cast<float>(i) + 0.5f) / SYNTH_STEPS));
        surface.drawPath(ring, true, false);
    }
}

void GradientRenderer::fallback(DrawingSurface& surface, const std::vector<ColorStop>& stops,
                                const Path& outline) {
    if (stops.empty()) {
        ywarn("Gradient has no stops, shape left unfilled");
        return;
    }
    surface.pushState();
    surface.setFillColor(stops.front().color);
    surface.drawPath(outline, true, false);
    surface.popState();
}

} // namespace ycard::render
