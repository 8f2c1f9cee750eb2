#pragma once

#include <ycard/fill-style.h>
#include <ycard/geometry.h>
#include <ycard/result.hpp>
#include <ycard/surface.h>
#include <memory>
#include <string>

namespace ycard::render {

// Smallest tile edge ever emitted, points
constexpr float MIN_TILE_SIZE = 2.0f;

// spacing (inches) * scale in points, floored to MIN_TILE_SIZE
float patternTileSize(const PatternFill& fill);

// Stamps per axis: ceil(extent / tile) + 1
int patternStampCount(float extent, float tileSize);

//=============================================================================
// PatternRenderer - fills an area with a repeating tile
//
// One square tile is synthesized per fill and stamped across the area
// inside a clip to the area (and the shape outline), optionally rotated
// about the area center. Failures fall back to a solid fill with the first
// pattern color.
//=============================================================================
class PatternRenderer {
public:
    using Ptr = std::shared_ptr<PatternRenderer>;

    static Result<Ptr> create();

    // Returns false when the fallback fill was used
    bool fill(DrawingSurface& surface, const PatternFill& pattern,
              const Rect& area, const Path& outline);

    // Draws one tile with its lower-left corner at (x, y)
    static Result<void> drawTile(DrawingSurface& surface, const PatternFill& pattern,
                                 float tileSize, float x, float y);

private:
    PatternRenderer() = default;

    Result<void> paint(DrawingSurface& surface, const PatternFill& pattern,
                       const Rect& area, const Path& outline);
    Result<void> stamp(DrawingSurface& surface, const PatternFill& pattern,
                       const Rect& area, float tileSize);
    void fallback(DrawingSurface& surface, const PatternFill& pattern, const Path& outline);

    int _tileCounter = 0;
};

} // namespace ycard::render
