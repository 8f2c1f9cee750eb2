#include "clipping-renderer.h"
#include "path-builder.h"
#include <ycard/units.h>
#include <ytrace/ytrace.hpp>

namespace ycard::render {

Result<ClippingRenderer::Ptr> ClippingRenderer::create() {
    return Ok(Ptr(new ClippingRenderer()));
}

Result<Path> ClippingRenderer::buildClipPath(const ClipMask& mask, float imageX, float imageY) const {
    Path path;

    if (auto* c = std::get_if<CircleClipMask>(&mask)) {
        path.addCircle(imageX + inchesToPoints(c->centerX), imageY + inchesToPoints(c->centerY),
                       inchesToPoints(c->radius));
        ydebug("Circle clip: center=({:.2f},{:.2f}) radius={:.2f}pts",
               inchesToPoints(c->centerX), inchesToPoints(c->centerY), inchesToPoints(c->radius));
        return Ok(std::move(path));
    }

    if (auto* r = std::get_if<RectangleClipMask>(&mask)) {
        path.addRect({imageX + inchesToPoints(r->x), imageY + inchesToPoints(r->y),
                      inchesToPoints(r->width), inchesToPoints(r->height)});
        ydebug("Rectangle clip: ({:.2f},{:.2f},{:.2f},{:.2f})pts",
               inchesToPoints(r->x), inchesToPoints(r->y), inchesToPoints(r->width), inchesToPoints(r->height));
        return Ok(std::move(path));
    }

    if (auto* e = std::get_if<EllipseClipMask>(&mask)) {
        path.addEllipse(imageX + inchesToPoints(e->centerX), imageY + inchesToPoints(e->centerY),
                        inchesToPoints(e->radiusX), inchesToPoints(e->radiusY));
        ydebug("Ellipse clip: radii=({:.2f},{:.2f})pts", inchesToPoints(e->radiusX), inchesToPoints(e->radiusY));
        return Ok(std::move(path));
    }

    if (auto* s = std::get_if<StarClipMask>(&mask)) {
        path.addPolygon(starVertices(imageX + inchesToPoints(s->centerX),
                                     imageY + inchesToPoints(s->centerY),
                                     inchesToPoints(s->outerRadius),
                                     inchesToPoints(s->innerRadius), s->points));
        ydebug("Star clip: points={} outer={:.2f}pts inner={:.2f}pts",
               s->points, inchesToPoints(s->outerRadius), inchesToPoints(s->innerRadius));
        return Ok(std::move(path));
    }

    if (auto* p = std::get_if<PathClipMask>(&mask)) {
        // Path clip data is in points relative to the image origin
        PathMapping mapping{imageX, imageY, p->scale};
        auto built = buildPath(p->pathData, mapping);
        if (!built) {
            return Err<Path>("Invalid SVG clip path", built);
        }
        return built;
    }

    return Err<Path>("Unsupported clip mask type");
}

Result<void> ClippingRenderer::drawClipped(DrawingSurface& surface, const ClipMask& mask,
                                           float imageX, float imageY, const DrawFn& draw) const {
    auto clip = buildClipPath(mask, imageX, imageY);
    if (!clip) {
        ywarn("Failed to apply {} clip mask, drawing unclipped: {}", clipMaskTypeName(mask), error_msg(clip));
        return draw();
    }

    surface.pushState();
    surface.clipTo(*clip);
    auto res = draw();
    surface.popState();
    return res;
}

} // namespace ycard::render
