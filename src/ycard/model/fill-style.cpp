#include <ycard/fill-style.h>
#include <fmt/format.h>

namespace ycard {

Result<ColorStop> ColorStop::create(float position, const Color& color) {
    if (position < 0.0f || position > 1.0f) {
        return Err<ColorStop>(fmt::format("Color stop position {} out of range (0.0-1.0)", position));
    }
    return Ok(ColorStop{position, color});
}

Result<void> validateStops(const std::vector<ColorStop>& stops) {
    if (stops.size() < MIN_GRADIENT_STOPS) {
        return Err("Gradient must have at least 2 color stops");
    }
    if (stops.size() > MAX_GRADIENT_STOPS) {
        return Err("Gradient cannot have more than 20 color stops");
    }
    for (size_t i = 0; i < stops.size(); i++) {
        if (stops[i].position < 0.0f || stops[i].position > 1.0f) {
            return Err(fmt::format("Color stop position {} out of range (0.0-1.0)", stops[i].position));
        }
        if (i > 0 && stops[i].position < stops[i - 1].position) {
            return Err("Color stop positions must be in ascending order");
        }
    }
    return Ok();
}

Color colorAt(const std::vector<ColorStop>& stops, float position) {
    if (stops.empty()) return colors::Black;

    if (position <= stops.front().position) return stops.front().color;
    if (position >= stops.back().position) return stops.back().color;

    for (size_t i = 0; i + 1 < stops.size(); i++) {
        const auto& a = stops[i];
        const auto& b = stops[i + 1];
        if (position >= a.position && position <= b.position) {
            float span = b.position - a.position;
            if (span <= 0.0f) return a.color;
            return interpolate(a.color, b.color, (position - a.position) / span);
        }
    }
    return stops.back().color;
}

Result<LinearGradientFill> LinearGradientFill::create(float angle, std::vector<ColorStop> stops) {
    if (angle < 0.0f || angle >= 360.0f) {
        return Err<LinearGradientFill>(fmt::format("Gradient angle {} out of range [0, 360)", angle));
    }
    if (auto res = validateStops(stops); !res) {
        return Err<LinearGradientFill>("Invalid linear gradient", res);
    }
    return Ok(LinearGradientFill{angle, std::move(stops)});
}

Result<RadialGradientFill> RadialGradientFill::create(float centerX, float centerY, float radius,
                                                      std::vector<ColorStop> stops) {
    if (centerX < 0.0f || centerX > 1.0f || centerY < 0.0f || centerY > 1.0f) {
        return Err<RadialGradientFill>(
            fmt::format("Radial gradient center ({}, {}) out of range (0.0-1.0)", centerX, centerY));
    }
    if (radius <= 0.0f || radius > 1.0f) {
        return Err<RadialGradientFill>(fmt::format("Radial gradient radius {} out of range (0.0-1.0]", radius));
    }
    if (auto res = validateStops(stops); !res) {
        return Err<RadialGradientFill>("Invalid radial gradient", res);
    }
    return Ok(RadialGradientFill{centerX, centerY, radius, std::move(stops)});
}

const char* toString(PatternKind kind) {
    switch (kind) {
        case PatternKind::Stripes:      return "stripes";
        case PatternKind::Dots:         return "dots";
        case PatternKind::Grid:         return "grid";
        case PatternKind::Checkerboard: return "checkerboard";
    }
    return "unknown";
}

Result<PatternKind> patternKindFromString(const std::string& name) {
    if (name == "stripes") return Ok(PatternKind::Stripes);
    if (name == "dots") return Ok(PatternKind::Dots);
    if (name == "grid") return Ok(PatternKind::Grid);
    if (name == "checkerboard") return Ok(PatternKind::Checkerboard);
    return Err<PatternKind>("Unknown pattern type: '" + name + "'");
}

Result<PatternFill> PatternFill::create(PatternKind kind, std::vector<Color> colors,
                                        float spacing, float scale, float rotation) {
    if (spacing <= 0.0f || spacing > 2.0f) {
        return Err<PatternFill>(fmt::format("Pattern spacing {} out of range (0.0-2.0]", spacing));
    }
    if (scale <= 0.0f || scale > 5.0f) {
        return Err<PatternFill>(fmt::format("Pattern scale {} out of range (0.0-5.0]", scale));
    }
    if (rotation < 0.0f || rotation >= 360.0f) {
        return Err<PatternFill>(fmt::format("Pattern rotation {} out of range [0, 360)", rotation));
    }
    if (colors.size() < MIN_PATTERN_COLORS) {
        return Err<PatternFill>("Pattern must have at least 1 color");
    }
    if (colors.size() > MAX_PATTERN_COLORS) {
        return Err<PatternFill>("Pattern cannot have more than 4 colors");
    }
    return Ok(PatternFill{kind, std::move(colors), spacing, scale, rotation});
}

const char* fillTypeName(const FillStyle& fill) {
    switch (fill.index()) {
        case 0: return "solid";
        case 1: return "linear_gradient";
        case 2: return "radial_gradient";
        case 3: return "pattern";
    }
    return "unknown";
}

} // namespace ycard
