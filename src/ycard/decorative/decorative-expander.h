#pragma once

#include <ycard/decorative-library.h>
#include <ycard/result.hpp>
#include <ycard/shape.h>
#include <yaml-cpp/yaml.h>
#include <map>
#include <string>
#include <vector>

namespace ycard::decorative {

using Palette = std::map<std::string, std::string>;

// Definition roles with instance overrides applied on top
Palette mergePalette(const Palette& roles, const Palette& overrides);

// "{role}" -> palette color; anything else (including unknown roles) is
// returned unchanged
std::string substituteRole(const std::string& value, const Palette& palette);

// Copy of a child shape map with every color field run through substituteRole:
// fill_color, stroke_color and the colors inside a fill
YAML::Node resolveColors(const YAML::Node& shape, const Palette& palette);

// Copy of a child shape map placed by the instance: positional fields become
// value * scale + anchor, sizes and radii value * scale, rotation adds the
// instance rotation mod 360, and a missing z_index is inherited. Stroke width
// is left alone. Kinds without a field set only get rotation and z_index.
Result<YAML::Node> applyTransform(const YAML::Node& shape, const DecorativeRef& ref);

Result<std::vector<Shape>> expandDecorative(const DecorativeDefinition& definition,
                                            const DecorativeRef& ref);

} // namespace ycard::decorative
