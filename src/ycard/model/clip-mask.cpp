#include <ycard/clip-mask.h>
#include <fmt/format.h>

namespace ycard {

namespace {

std::string trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos) return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

Result<void> checkPosition(const char* field, float value) {
    if (value < 0.0f) {
        return Err(fmt::format("{} must be >= 0, got {}", field, value));
    }
    return Ok();
}

Result<void> checkPositive(const char* field, float value) {
    if (value <= 0.0f) {
        return Err(fmt::format("{} must be > 0, got {}", field, value));
    }
    return Ok();
}

} // namespace

Result<CircleClipMask> CircleClipMask::create(float centerX, float centerY, float radius) {
    if (auto res = checkPosition("center_x", centerX); !res) return Err<CircleClipMask>("Invalid circle clip mask", res);
    if (auto res = checkPosition("center_y", centerY); !res) return Err<CircleClipMask>("Invalid circle clip mask", res);
    if (auto res = checkPositive("radius", radius); !res) return Err<CircleClipMask>("Invalid circle clip mask", res);
    return Ok(CircleClipMask{centerX, centerY, radius});
}

Result<RectangleClipMask> RectangleClipMask::create(float x, float y, float width, float height) {
    if (auto res = checkPosition("x", x); !res) return Err<RectangleClipMask>("Invalid rectangle clip mask", res);
    if (auto res = checkPosition("y", y); !res) return Err<RectangleClipMask>("Invalid rectangle clip mask", res);
    if (auto res = checkPositive("width", width); !res) return Err<RectangleClipMask>("Invalid rectangle clip mask", res);
    if (auto res = checkPositive("height", height); !res) return Err<RectangleClipMask>("Invalid rectangle clip mask", res);
    return Ok(RectangleClipMask{x, y, width, height});
}

Result<EllipseClipMask> EllipseClipMask::create(float centerX, float centerY, float radiusX, float radiusY) {
    if (auto res = checkPosition("center_x", centerX); !res) return Err<EllipseClipMask>("Invalid ellipse clip mask", res);
    if (auto res = checkPosition("center_y", centerY); !res) return Err<EllipseClipMask>("Invalid ellipse clip mask", res);
    if (auto res = checkPositive("radius_x", radiusX); !res) return Err<EllipseClipMask>("Invalid ellipse clip mask", res);
    if (auto res = checkPositive("radius_y", radiusY); !res) return Err<EllipseClipMask>("Invalid ellipse clip mask", res);
    return Ok(EllipseClipMask{centerX, centerY, radiusX, radiusY});
}

Result<StarClipMask> StarClipMask::create(float centerX, float centerY, float outerRadius,
                                          float innerRadius, int points) {
    if (auto res = checkPosition("center_x", centerX); !res) return Err<StarClipMask>("Invalid star clip mask", res);
    if (auto res = checkPosition("center_y", centerY); !res) return Err<StarClipMask>("Invalid star clip mask", res);
    if (auto res = checkPositive("outer_radius", outerRadius); !res) return Err<StarClipMask>("Invalid star clip mask", res);
    if (auto res = checkPositive("inner_radius", innerRadius); !res) return Err<StarClipMask>("Invalid star clip mask", res);
    if (innerRadius >= outerRadius) {
        return Err<StarClipMask>(fmt::format(
            "Invalid star clip mask: inner_radius ({}) must be less than outer_radius ({})",
            innerRadius, outerRadius));
    }
    if (points < 3 || points > 20) {
        return Err<StarClipMask>(fmt::format("Invalid star clip mask: points {} out of range [3, 20]", points));
    }
    return Ok(StarClipMask{centerX, centerY, outerRadius, innerRadius, points});
}

Result<PathClipMask> PathClipMask::create(const std::string& pathData, float scale) {
    std::string data = trim(pathData);
    if (data.empty()) {
        return Err<PathClipMask>("Invalid path clip mask: path_data cannot be empty");
    }
    if (data.back() != 'Z' && data.back() != 'z') {
        return Err<PathClipMask>("Invalid path clip mask: path must be closed (end with Z or z)");
    }
    if (scale <= 0.0f || scale > 10.0f) {
        return Err<PathClipMask>(fmt::format("Invalid path clip mask: scale {} out of range (0.0-10.0]", scale));
    }
    return Ok(PathClipMask{std::move(data), scale});
}

const char* clipMaskTypeName(const ClipMask& mask) {
    switch (mask.index()) {
        case 0: return "circle";
        case 1: return "rectangle";
        case 2: return "ellipse";
        case 3: return "star";
        case 4: return "svg_path";
    }
    return "unknown";
}

bool clipMaskWithin(const ClipMask& mask, float width, float height) {
    if (auto* c = std::get_if<CircleClipMask>(&mask)) {
        return c->centerX + c->radius <= width && c->centerY + c->radius <= height;
    }
    if (auto* r = std::get_if<RectangleClipMask>(&mask)) {
        return r->x + r->width <= width && r->y + r->height <= height;
    }
    if (auto* e = std::get_if<EllipseClipMask>(&mask)) {
        return e->centerX + e->radiusX <= width && e->centerY + e->radiusY <= height;
    }
    if (auto* s = std::get_if<StarClipMask>(&mask)) {
        return s->centerX + s->outerRadius <= width && s->centerY + s->outerRadius <= height;
    }
    return true;
}

} // namespace ycard
