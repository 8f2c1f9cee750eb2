#pragma once

#include <ycard/color.h>
#include <ycard/result.hpp>
#include <string>
#include <variant>
#include <vector>

namespace ycard {

constexpr size_t MIN_GRADIENT_STOPS = 2;
constexpr size_t MAX_GRADIENT_STOPS = 20;
constexpr size_t MIN_PATTERN_COLORS = 1;
constexpr size_t MAX_PATTERN_COLORS = 4;

struct ColorStop {
    float position = 0.0f;  // 0.0 = start, 1.0 = end
    Color color;

    static Result<ColorStop> create(float position, const Color& color);
};

// Count within [2, 20], positions within [0, 1] and non-decreasing
Result<void> validateStops(const std::vector<ColorStop>& stops);

// Color along the ramp; outside the stop range the end stops win
Color colorAt(const std::vector<ColorStop>& stops, float position);

//=============================================================================
// FillStyle variants
//=============================================================================
struct SolidFill {
    Color color;
};

struct LinearGradientFill {
    float angle = 0.0f;  // degrees, 0 = towards +x, 90 = towards +y
    std::vector<ColorStop> stops;

    static Result<LinearGradientFill> create(float angle, std::vector<ColorStop> stops);
};

struct RadialGradientFill {
    float centerX = 0.5f;  // fraction of the box width
    float centerY = 0.5f;  // fraction of the box height
    float radius = 0.5f;   // fraction of the box diagonal
    std::vector<ColorStop> stops;

    static Result<RadialGradientFill> create(float centerX, float centerY, float radius,
                                             std::vector<ColorStop> stops);
};

enum class PatternKind {
    Stripes,
    Dots,
    Grid,
    Checkerboard,
};

const char* toString(PatternKind kind);
Result<PatternKind> patternKindFromString(const std::string& name);

struct PatternFill {
    PatternKind kind = PatternKind::Stripes;
    std::vector<Color> colors;
    float spacing = 0.25f;  // inches, (0, 2]
    float scale = 1.0f;     // (0, 5]
    float rotation = 0.0f;  // degrees, [0, 360)

    static Result<PatternFill> create(PatternKind kind, std::vector<Color> colors,
                                      float spacing = 0.25f, float scale = 1.0f,
                                      float rotation = 0.0f);
};

using FillStyle = std::variant<SolidFill, LinearGradientFill, RadialGradientFill, PatternFill>;

const char* fillTypeName(const FillStyle& fill);

} // namespace ycard
