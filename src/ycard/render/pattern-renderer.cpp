#include "pattern-renderer.h"
#include <ycard/units.h>
#include <ytrace/ytrace.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <cmath>

namespace ycard::render {

float patternTileSize(const PatternFill& fill) {
    return std::max(inchesToPoints(fill.spacing) * fill.scale, MIN_TILE_SIZE);
}

int patternStampCount(float extent, float tileSize) {
    return static_cast<int>(std::ceil(extent / tileSize)) + 1;
}

Result<PatternRenderer::Ptr> PatternRenderer::create() {
    return Ok(Ptr(new PatternRenderer()));
}

//=============================================================================
// Tiles
//=============================================================================

Result<void> PatternRenderer::drawTile(DrawingSurface& surface, const PatternFill& pattern,
                                       float tileSize, float x, float y) {
    const auto& colors = pattern.colors;
    if (colors.empty()) {
        return Err("Pattern has no colors");
    }

    switch (pattern.kind) {
        case PatternKind::Stripes: {
            float band = tileSize / static_cast<float>(colors.size());
            for (size_t i = 0; i < colors.size(); i++) {
                Path stripe;
                stripe.addRect({x + static_cast<float>(i) * band, y, band, tileSize});
                surface.setFillColor(colors[i]);
                surface.drawPath(stripe, true, false);
            }
            return Ok();
        }

        case PatternKind::Dots: {
            if (colors.size() > 1) {
                Path bg;
                bg.addRect({x, y, tileSize, tileSize});
                surface.setFillColor(colors[1]);
                surface.drawPath(bg, true, false);
            }
            Path dot;
            dot.addCircle(x + tileSize / 2, y + tileSize / 2, tileSize * 0.3f);
            surface.setFillColor(colors[0]);
            surface.drawPath(dot, true, false);
            return Ok();
        }

        case PatternKind::Grid: {
            // bottom and left edges; neighbours complete the grid
            Path edges;
            edges.moveTo(x + tileSize, y);
            edges.lineTo(x, y);
            edges.lineTo(x, y + tileSize);
            surface.setStrokeColor(colors[0]);
            surface.setLineWidth(std::max(1.0f, tileSize * 0.05f));
            surface.drawPath(edges, false, true);
            return Ok();
        }

        case PatternKind::Checkerboard: {
            float half = tileSize / 2;
            Color first = colors[0];
            Color second = colors.size() > 1 ? colors[1] : colors::White;

            Path a;
            a.addRect({x, y + half, half, half});  // top-left
            a.addRect({x + half, y, half, half});  // bottom-right
            surface.setFillColor(first);
            surface.drawPath(a, true, false);

            Path b;
            b.addRect({x + half, y + half, half, half});  // top-right
            b.addRect({x, y, half, half});                // bottom-left
            surface.setFillColor(second);
            surface.drawPath(b, true, false);
            return Ok();
        }
    }
    return Err(fmt::format("Unsupported pattern type: {}", static_cast<int>(pattern.kind)));
}

//=============================================================================
// Fill
//=============================================================================

bool PatternRenderer::fill(DrawingSurface& surface, const PatternFill& pattern,
                           const Rect& area, const Path& outline) {
    if (auto res = paint(surface, pattern, area, outline); !res) {
        yerror("Failed to render pattern fill: {}", error_msg(res));
        fallback(surface, pattern, outline);
        return false;
    }
    return true;
}

Result<void> PatternRenderer::paint(DrawingSurface& surface, const PatternFill& pattern,
                                    const Rect& area, const Path& outline) {
    if (pattern.colors.empty()) {
        return Err("Pattern has no colors");
    }
    if (area.width <= 0.0f || area.height <= 0.0f) {
        return Err(fmt::format("Pattern area {}x{} is empty", area.width, area.height));
    }

    float tileSize = patternTileSize(pattern);

    surface.pushState();
    Path areaClip;
    areaClip.addRect(area);
    surface.clipTo(areaClip);
    surface.clipTo(outline);
    if (pattern.rotation != 0.0f) {
        Point c = area.center();
        surface.rotateAbout(c.x, c.y, pattern.rotation);
    }
    auto res = stamp(surface, pattern, area, tileSize);
    surface.popState();
    if (!res) {
        return res;
    }

    yinfo("Rendered {} pattern: area=({:.2f},{:.2f},{:.2f},{:.2f})pts tile={:.2f}pts rotation={}",
          toString(pattern.kind), area.x, area.y, area.width, area.height, tileSize, pattern.rotation);
    return Ok();
}

Result<void> PatternRenderer::stamp(DrawingSurface& surface, const PatternFill& pattern,
                                    const Rect& area, float tileSize) {
    int nx = patternStampCount(area.width, tileSize);
    int ny = patternStampCount(area.height, tileSize);

    if (surface.supportsTiles()) {
        std::string name = fmt::format("pattern_{}_{}", toString(pattern.kind), _tileCounter++);
        if (auto res = surface.beginTile(name, tileSize); !res) {
            return Err("Failed to begin pattern tile", res);
        }
        auto drawn = drawTile(surface, pattern, tileSize, 0.0f, 0.0f);
        if (auto res = surface.endTile(); !res) {
            return Err("Failed to end pattern tile", res);
        }
        if (!drawn) {
            return drawn;
        }
        for (int i = 0; i < nx; i++) {
            for (int j = 0; j < ny; j++) {
                float x = area.x + static_cast<float>(i) * tileSize;
                float y = area.y + static_cast<float>(j) * tileSize;
                if (auto res = surface.stampTile(name, x, y); !res) {
                    return Err("Failed to stamp pattern tile", res);
                }
            }
        }
        return Ok();
    }

    for (int i = 0; i < nx; i++) {
        for (int j = 0; j < ny; j++) {
            float x = area.x + static_cast<float>(i) * tileSize;
            float y = area.y + static_cast<float>(j) * tileSize;
            if (auto res = drawTile(surface, pattern, tileSize, x, y); !res) {
                return res;
            }
        }
    }
    return Ok();
}

void PatternRenderer::fallback(DrawingSurface& surface, const PatternFill& pattern, const Path& outline) {
    if (pattern.colors.empty()) {
        ywarn("Pattern has no colors, shape left unfilled");
        return;
    }
    surface.pushState();
    surface.setFillColor(pattern.colors.front());
    surface.drawPath(outline, true, false);
    surface.popState();
    ywarn("Fell back to solid fill due to pattern error");
}

} // namespace ycard::render
