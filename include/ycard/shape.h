#pragma once

#include <ycard/color.h>
#include <ycard/fill-style.h>
#include <ycard/result.hpp>
#include <map>
#include <optional>
#include <string>
#include <variant>

namespace ycard {

//=============================================================================
// ShapeStyle - fields every primitive shape carries
//
// Positions are inches relative to the panel origin; stroke width is points.
//=============================================================================
struct ShapeStyle {
    std::string id;
    int zIndex = 0;
    std::optional<Color> fillColor;    // legacy single color fill
    std::optional<Color> strokeColor;
    float strokeWidth = 0.0f;
    float opacity = 1.0f;
    float rotation = 0.0f;             // degrees, [0, 360)
    std::optional<FillStyle> fill;     // wins over fillColor
};

Result<void> validateStyle(const ShapeStyle& style);

struct RectangleShape {
    ShapeStyle style;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    static Result<RectangleShape> create(float x, float y, float width, float height,
                                         ShapeStyle style = {});
};

struct CircleShape {
    ShapeStyle style;
    float centerX = 0.0f;
    float centerY = 0.0f;
    float radius = 0.0f;

    static Result<CircleShape> create(float centerX, float centerY, float radius,
                                      ShapeStyle style = {});
};

struct TriangleShape {
    ShapeStyle style;
    float x1 = 0.0f, y1 = 0.0f;
    float x2 = 0.0f, y2 = 0.0f;
    float x3 = 0.0f, y3 = 0.0f;

    static Result<TriangleShape> create(float x1, float y1, float x2, float y2,
                                        float x3, float y3, ShapeStyle style = {});
};

struct StarShape {
    ShapeStyle style;
    float centerX = 0.0f;
    float centerY = 0.0f;
    float outerRadius = 0.0f;
    float innerRadius = 0.0f;
    int points = 5;

    static Result<StarShape> create(float centerX, float centerY, float outerRadius,
                                    float innerRadius, int points = 5, ShapeStyle style = {});
};

struct LineShape {
    ShapeStyle style;
    float startX = 0.0f;
    float startY = 0.0f;
    float endX = 0.0f;
    float endY = 0.0f;

    static Result<LineShape> create(float startX, float startY, float endX, float endY,
                                    ShapeStyle style = {});
};

struct PathShape {
    ShapeStyle style;
    std::string pathData;
    float scale = 1.0f;  // (0, 10]

    static Result<PathShape> create(const std::string& pathData, float scale = 1.0f,
                                    ShapeStyle style = {});
};

// Instance of a named composite from the decorative library
struct DecorativeRef {
    std::string id;
    std::string name;
    float x = 0.0f;
    float y = 0.0f;
    float scale = 1.0f;
    float rotation = 0.0f;
    std::map<std::string, std::string> colorPalette;  // role -> "#rrggbb"
    int zIndex = 0;

    static Result<DecorativeRef> create(const std::string& name, float x, float y,
                                        float scale = 1.0f, float rotation = 0.0f,
                                        std::map<std::string, std::string> colorPalette = {},
                                        int zIndex = 0);
};

using Shape = std::variant<RectangleShape, CircleShape, TriangleShape, StarShape,
                           LineShape, PathShape, DecorativeRef>;

int shapeZIndex(const Shape& shape);
const char* shapeTypeName(const Shape& shape);

} // namespace ycard
