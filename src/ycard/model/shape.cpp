#include <ycard/shape.h>
#include <fmt/format.h>
#include <type_traits>

namespace ycard {

namespace {

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

Result<void> checkRotation(float rotation) {
    if (rotation < 0.0f || rotation >= 360.0f) {
        return Err(fmt::format("rotation {} out of range [0, 360)", rotation));
    }
    return Ok();
}

bool hasPathCommand(const std::string& data) {
    static const std::string commands = "MmLlHhVvCcSsQqTtAaZz";
    return data.find_first_of(commands) != std::string::npos;
}

} // namespace

Result<void> validateStyle(const ShapeStyle& style) {
    if (style.strokeWidth < 0.0f) {
        return Err(fmt::format("stroke_width must be >= 0, got {}", style.strokeWidth));
    }
    if (style.opacity < 0.0f || style.opacity > 1.0f) {
        return Err(fmt::format("opacity {} out of range (0.0-1.0)", style.opacity));
    }
    return checkRotation(style.rotation);
}

Result<RectangleShape> RectangleShape::create(float x, float y, float width, float height,
                                              ShapeStyle style) {
    if (auto res = validateStyle(style); !res) return Err<RectangleShape>("Invalid rectangle", res);
    if (auto res = checkPosition("x", x); !res) return Err<RectangleShape>("Invalid rectangle", res);
    if (auto res = checkPosition("y", y); !res) return Err<RectangleShape>("Invalid rectangle", res);
    if (auto res = checkPositive("width", width); !res) return Err<RectangleShape>("Invalid rectangle", res);
    if (auto res = checkPositive("height", height); !res) return Err<RectangleShape>("Invalid rectangle", res);
    return Ok(RectangleShape{std::move(style), x, y, width, height});
}

Result<CircleShape> CircleShape::create(float centerX, float centerY, float radius, ShapeStyle style) {
    if (auto res = validateStyle(style); !res) return Err<CircleShape>("Invalid circle", res);
    if (auto res = checkPosition("center_x", centerX); !res) return Err<CircleShape>("Invalid circle", res);
    if (auto res = checkPosition("center_y", centerY); !res) return Err<CircleShape>("Invalid circle", res);
    if (auto res = checkPositive("radius", radius); !res) return Err<CircleShape>("Invalid circle", res);
    return Ok(CircleShape{std::move(style), centerX, centerY, radius});
}

Result<TriangleShape> TriangleShape::create(float x1, float y1, float x2, float y2,
                                            float x3, float y3, ShapeStyle style) {
    if (auto res = validateStyle(style); !res) return Err<TriangleShape>("Invalid triangle", res);
    const float coords[] = {x1, y1, x2, y2, x3, y3};
    const char* names[] = {"x1", "y1", "x2", "y2", "x3", "y3"};
    for (int i = 0; i < 6; i++) {
        if (auto res = checkPosition(names[i], coords[i]); !res) {
            return Err<TriangleShape>("Invalid triangle", res);
        }
    }
    TriangleShape t;
    t.style = std::move(style);
    t.x1 = x1; t.y1 = y1;
    t.x2 = x2; t.y2 = y2;
    t.x3 = x3; t.y3 = y3;
    return Ok(std::move(t));
}

Result<StarShape> StarShape::create(float centerX, float centerY, float outerRadius,
                                    float innerRadius, int points, ShapeStyle style) {
    if (auto res = validateStyle(style); !res) return Err<StarShape>("Invalid star", res);
    if (auto res = checkPosition("center_x", centerX); !res) return Err<StarShape>("Invalid star", res);
    if (auto res = checkPosition("center_y", centerY); !res) return Err<StarShape>("Invalid star", res);
    if (auto res = checkPositive("outer_radius", outerRadius); !res) return Err<StarShape>("Invalid star", res);
    if (auto res = checkPositive("inner_radius", innerRadius); !res) return Err<StarShape>("Invalid star", res);
    if (innerRadius >= outerRadius) {
        return Err<StarShape>(fmt::format(
            "Invalid star: inner_radius ({}) must be less than outer_radius ({})", innerRadius, outerRadius));
    }
    if (points < 3 || points > 20) {
        return Err<StarShape>(fmt::format("Invalid star: points {} out of range [3, 20]", points));
    }
    return Ok(StarShape{std::move(style), centerX, centerY, outerRadius, innerRadius, points});
}

Result<LineShape> LineShape::create(float startX, float startY, float endX, float endY, ShapeStyle style) {
    if (auto res = validateStyle(style); !res) return Err<LineShape>("Invalid line", res);
    if (auto res = checkPosition("start_x", startX); !res) return Err<LineShape>("Invalid line", res);
    if (auto res = checkPosition("start_y", startY); !res) return Err<LineShape>("Invalid line", res);
    if (auto res = checkPosition("end_x", endX); !res) return Err<LineShape>("Invalid line", res);
    if (auto res = checkPosition("end_y", endY); !res) return Err<LineShape>("Invalid line", res);
    return Ok(LineShape{std::move(style), startX, startY, endX, endY});
}

Result<PathShape> PathShape::create(const std::string& pathData, float scale, ShapeStyle style) {
    if (auto res = validateStyle(style); !res) return Err<PathShape>("Invalid svg path", res);
    auto first = pathData.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return Err<PathShape>("Invalid svg path: path_data cannot be empty");
    }
    auto last = pathData.find_last_not_of(" \t\r\n");
    std::string data = pathData.substr(first, last - first + 1);
    if (!hasPathCommand(data)) {
        return Err<PathShape>("Invalid svg path: path_data must contain at least one command (M, L, C, Q, A, Z)");
    }
    if (scale <= 0.0f || scale > 10.0f) {
        return Err<PathShape>(fmt::format("Invalid svg path: scale {} out of range (0.0-10.0]", scale));
    }
    return Ok(PathShape{std::move(style), std::move(data), scale});
}

Result<DecorativeRef> DecorativeRef::create(const std::string& name, float x, float y,
                                            float scale, float rotation,
                                            std::map<std::string, std::string> colorPalette,
                                            int zIndex) {
    if (name.empty()) {
        return Err<DecorativeRef>("Invalid decorative element: name cannot be empty");
    }
    if (auto res = checkPosition("x", x); !res) return Err<DecorativeRef>("Invalid decorative element", res);
    if (auto res = checkPosition("y", y); !res) return Err<DecorativeRef>("Invalid decorative element", res);
    if (auto res = checkPositive("scale", scale); !res) return Err<DecorativeRef>("Invalid decorative element", res);
    if (auto res = checkRotation(rotation); !res) return Err<DecorativeRef>("Invalid decorative element", res);
    for (const auto& [role, hex] : colorPalette) {
        if (auto res = Color::fromHex(hex); !res) {
            return Err<DecorativeRef>("Invalid decorative element: color_palette." + role, res);
        }
    }
    DecorativeRef ref;
    ref.name = name;
    ref.x = x;
    ref.y = y;
    ref.scale = scale;
    ref.rotation = rotation;
    ref.colorPalette = std::move(colorPalette);
    ref.zIndex = zIndex;
    return Ok(std::move(ref));
}

int shapeZIndex(const Shape& shape) {
    return std::visit([](const auto& s) -> int {
        using T = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<T, DecorativeRef>) {
            return s.zIndex;
        } else {
            return s.style.zIndex;
        }
    }, shape);
}

const char* shapeTypeName(const Shape& shape) {
    switch (shape.index()) {
        case 0: return "rectangle";
        case 1: return "circle";
        case 2: return "triangle";
        case 3: return "star";
        case 4: return "line";
        case 5: return "svg_path";
        case 6: return "decorative_element";
    }
    return "unknown";
}

} // namespace ycard
