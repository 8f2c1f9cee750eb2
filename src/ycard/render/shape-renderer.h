#pragma once

#include "gradient-renderer.h"
#include "pattern-renderer.h"
#include <ycard/geometry.h>
#include <ycard/result.hpp>
#include <ycard/shape.h>
#include <ycard/surface.h>
#include <memory>

namespace ycard::render {

// Output-space geometry of one primitive shape
struct ShapeGeometry {
    Path outline;
    Point pivot;       // rotation center
    Rect box;          // fill region for gradients and patterns
    bool closed = true;
};

// Panel offset in inches; returns Err for decorative refs and unbuildable paths
Result<ShapeGeometry> shapeGeometry(const Shape& shape, float panelX, float panelY);

//=============================================================================
// ShapeRenderer - draws one primitive shape
//
// Each shape runs inside its own pushState/popState: opacity, rotation about
// the shape pivot, fill (explicit fill style, else legacy fill color, else
// none), then stroke when a stroke color and width are set.
//=============================================================================
class ShapeRenderer {
public:
    using Ptr = std::shared_ptr<ShapeRenderer>;

    static Result<Ptr> create();

    Result<void> render(DrawingSurface& surface, const Shape& shape, float panelX, float panelY);

private:
    ShapeRenderer() = default;

    Result<void> init();

    // Returns true when the outline still needs a solid fill
    bool applyFill(DrawingSurface& surface, const ShapeStyle& style, const ShapeGeometry& geom);

    GradientRenderer::Ptr _gradients;
    PatternRenderer::Ptr _patterns;
};

} // namespace ycard::render
