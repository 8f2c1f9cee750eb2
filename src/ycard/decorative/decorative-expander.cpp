#include "decorative-expander.h"
#include <ycard/scene-parser.h>
#include <fmt/format.h>
#include <ytrace/ytrace.hpp>
#include <cmath>

namespace ycard::decorative {

namespace {

struct FieldSet {
    const char* type;
    std::vector<const char*> xs;       // scaled, then offset by anchor x
    std::vector<const char*> ys;       // scaled, then offset by anchor y
    std::vector<const char*> lengths;  // scaled only
};

const std::vector<FieldSet>& fieldSets() {
    static const std::vector<FieldSet> sets = {
        {"rectangle", {"x"}, {"y"}, {"width", "height"}},
        {"circle", {"center_x"}, {"center_y"}, {"radius"}},
        {"triangle", {"x1", "x2", "x3"}, {"y1", "y2", "y3"}, {}},
        {"star", {"center_x"}, {"center_y"}, {"outer_radius", "inner_radius"}},
        {"line", {"start_x", "end_x"}, {"start_y", "end_y"}, {}},
    };
    return sets;
}

void substituteIn(YAML::Node node, const char* key, const Palette& palette) {
    if (node[key] && node[key].IsScalar()) {
        node[key] = substituteRole(node[key].Scalar(), palette);
    }
}

void scaleField(YAML::Node node, const char* key, float scale, float offset) {
    if (!node[key]) return;
    node[key] = node[key].as<float>() * scale + offset;
}

} // namespace

Palette mergePalette(const Palette& roles, const Palette& overrides) {
    Palette merged = roles;
    for (const auto& [role, color] : overrides) {
        merged[role] = color;
    }
    return merged;
}

std::string substituteRole(const std::string& value, const Palette& palette) {
    if (value.size() < 2 || value.front() != '{' || value.back() != '}') {
        return value;
    }
    auto it = palette.find(value.substr(1, value.size() - 2));
    return it == palette.end() ? value : it->second;
}

YAML::Node resolveColors(const YAML::Node& shape, const Palette& palette) {
    YAML::Node out = YAML::Clone(shape);
    if (!out.IsMap()) return out;

    substituteIn(out, "fill_color", palette);
    substituteIn(out, "stroke_color", palette);

    YAML::Node fill = out["fill"];
    if (fill && fill.IsMap()) {
        substituteIn(fill, "color", palette);
        if (fill["stops"] && fill["stops"].IsSequence()) {
            for (auto stop : fill["stops"]) {
                if (stop.IsMap()) substituteIn(stop, "color", palette);
            }
        }
        if (fill["colors"] && fill["colors"].IsSequence()) {
            YAML::Node colors = fill["colors"];
            for (size_t i = 0; i < colors.size(); i++) {
                if (colors[i].IsScalar()) {
                    colors[i] = substituteRole(colors[i].Scalar(), palette);
                }
            }
        }
    }
    return out;
}

Result<YAML::Node> applyTransform(const YAML::Node& shape, const DecorativeRef& ref) {
    YAML::Node out = YAML::Clone(shape);
    if (!out.IsMap() || !out["type"]) {
        return Err<YAML::Node>("child shape must be a map with a 'type'");
    }

    try {
        const std::string type = out["type"].as<std::string>();
        if (type == "decorative_element") {
            return Err<YAML::Node>("nested decorative elements are not supported");
        }

        bool placed = false;
        for (const auto& set : fieldSets()) {
            if (type != set.type) continue;
            for (const char* key : set.xs) scaleField(out, key, ref.scale, ref.x);
            for (const char* key : set.ys) scaleField(out, key, ref.scale, ref.y);
            for (const char* key : set.lengths) scaleField(out, key, ref.scale, 0.0f);
            placed = true;
        }
        if (!placed) {
            ydebug("Decorative '{}': '{}' child passed through without placement", ref.name, type);
        }

        float rotation = out["rotation"] ? out["rotation"].as<float>() : 0.0f;
        float combined = std::fmod(rotation + ref.rotation, 360.0f);
        if (combined < 0.0f) {
            combined += 360.0f;
        }
        if (combined >= 360.0f) {
            combined = 0.0f;
        }
        out["rotation"] = combined;

        if (!out["z_index"]) {
            out["z_index"] = ref.zIndex;
        }
    } catch (const YAML::Exception& e) {
        return Err<YAML::Node>(fmt::format("bad child shape field: {}", e.what()));
    }
    return out;
}

Result<std::vector<Shape>> expandDecorative(const DecorativeDefinition& definition,
                                            const DecorativeRef& ref) {
    const Palette palette = mergePalette(definition.colorRoles, ref.colorPalette);
    std::vector<Shape> shapes;

    if (!definition.shapes || !definition.shapes.IsSequence()) {
        return Err<std::vector<Shape>>(fmt::format("Decorative element '{}' has no shapes", definition.name));
    }

    for (size_t i = 0; i < definition.shapes.size(); i++) {
        std::string where = fmt::format("{}.shapes[{}]", ref.id.empty() ? ref.name : ref.id, i);

        YAML::Node resolved = resolveColors(definition.shapes[i], palette);
        auto placed = applyTransform(resolved, ref);
        if (!placed) {
            return Err<std::vector<Shape>>(
                fmt::format("Failed to expand decorative element '{}' ({})", definition.name, where), placed);
        }

        auto shape = parseShape(*placed, where);
        if (!shape) {
            return Err<std::vector<Shape>>(
                fmt::format("Failed to expand decorative element '{}'", definition.name), shape);
        }
        shapes.push_back(std::move(*shape));
    }

    ydebug("Expanded decorative '{}' at ({}, {}) x{} into {} shapes",
           definition.name, ref.x, ref.y, ref.scale, shapes.size());
    return shapes;
}

} // namespace ycard::decorative
