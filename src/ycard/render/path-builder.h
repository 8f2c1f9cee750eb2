#pragma once

#include "ycard/svg/path-parser.h"
#include <ycard/geometry.h>
#include <ycard/result.hpp>
#include <vector>

namespace ycard::render {

// Maps path-language units to output points: origin + value * factor
struct PathMapping {
    float originX = 0.0f;
    float originY = 0.0f;
    float factor = 1.0f;

    Point map(float x, float y) const { return {originX + x * factor, originY + y * factor}; }
    Point map(const Point& p) const { return map(p.x, p.y); }
};

//=============================================================================
// buildPath - interprets parsed commands into an absolute Path
//
// Tracks the current point (relative commands), the subpath start (Z) and
// the last control point (S/T reflection). Q/T are degree-elevated to
// cubics. A is drawn as a straight line to its end point.
//=============================================================================
Result<Path> buildPath(const std::vector<svg::PathCommand>& commands, const PathMapping& mapping);

// Parse + build in one step
Result<Path> buildPath(const std::string& pathData, const PathMapping& mapping);

} // namespace ycard::render
