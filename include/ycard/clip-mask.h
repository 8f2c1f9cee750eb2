#pragma once

#include <ycard/result.hpp>
#include <string>
#include <variant>

namespace ycard {

//=============================================================================
// ClipMask - region restricting an image draw. Coordinates are inches
// relative to the image origin.
//=============================================================================
struct CircleClipMask {
    float centerX = 0.0f;
    float centerY = 0.0f;
    float radius = 0.0f;

    static Result<CircleClipMask> create(float centerX, float centerY, float radius);
};

struct RectangleClipMask {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    static Result<RectangleClipMask> create(float x, float y, float width, float height);
};

struct EllipseClipMask {
    float centerX = 0.0f;
    float centerY = 0.0f;
    float radiusX = 0.0f;
    float radiusY = 0.0f;

    static Result<EllipseClipMask> create(float centerX, float centerY, float radiusX, float radiusY);
};

struct StarClipMask {
    float centerX = 0.0f;
    float centerY = 0.0f;
    float outerRadius = 0.0f;
    float innerRadius = 0.0f;
    int points = 5;

    static Result<StarClipMask> create(float centerX, float centerY, float outerRadius,
                                       float innerRadius, int points = 5);
};

struct PathClipMask {
    std::string pathData;  // trimmed, always closed
    float scale = 1.0f;

    static Result<PathClipMask> create(const std::string& pathData, float scale = 1.0f);
};

using ClipMask = std::variant<CircleClipMask, RectangleClipMask, EllipseClipMask,
                              StarClipMask, PathClipMask>;

const char* clipMaskTypeName(const ClipMask& mask);

// False when the mask obviously reaches past a width x height image.
// Path masks are not checked.
bool clipMaskWithin(const ClipMask& mask, float width, float height);

} // namespace ycard
