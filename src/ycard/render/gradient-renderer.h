#pragma once

#include <ycard/fill-style.h>
#include <ycard/geometry.h>
#include <ycard/result.hpp>
#include <ycard/surface.h>
#include <memory>

namespace ycard::render {

struct GradientLine {
    Point start;
    Point end;
};

// Start/end centered on the box, half a diagonal each way along the angle
GradientLine linearEndpoints(float angleDegrees, const Rect& box);

struct RadialGeometry {
    Point center;
    float radius = 0.0f;
};

// Relative center (fraction of box) and radius (fraction of diagonal) in points
RadialGeometry radialGeometry(const RadialGradientFill& fill, const Rect& box);

//=============================================================================
// GradientRenderer - paints a gradient inside a shape outline
//
// Uses the surface's native gradients when it has them, otherwise draws
// solid bands/rings. Any failure falls back to a solid fill with the first
// stop color.
//=============================================================================
class GradientRenderer {
public:
    using Ptr = std::shared_ptr<GradientRenderer>;

    // Bands drawn per synthesized ramp
    static constexpr int SYNTH_STEPS = 64;

    static Result<Ptr> create();

    // Returns false when the fallback fill was used
    bool fillLinear(DrawingSurface& surface, const LinearGradientFill& fill,
                    const Rect& box, const Path& outline);
    bool fillRadial(DrawingSurface& surface, const RadialGradientFill& fill,
                    const Rect& box, const Path& outline);

private:
    GradientRenderer() = default;

    Result<void> paintLinear(DrawingSurface& surface, const LinearGradientFill& fill,
                             const Rect& box, const Path& outline);
    Result<void> paintRadial(DrawingSurface& surface, const RadialGradientFill& fill,
                             const Rect& box, const Path& outline);

    void synthesizeLinear(DrawingSurface& surface, const GradientLine& line,
                          float halfWidth, const std::vector<ColorStop>& stops);
    void synthesizeRadial(DrawingSurface& surface, const RadialGeometry& geom,
                          const Rect& box, const std::vector<ColorStop>& stops);

    void fallback(DrawingSurface& surface, const std::vector<ColorStop>& stops, const Path& outline);
};

} // namespace ycard::render
