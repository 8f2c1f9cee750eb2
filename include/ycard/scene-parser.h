#pragma once

#include <ycard/card.h>
#include <ycard/clip-mask.h>
#include <ycard/color.h>
#include <ycard/fill-style.h>
#include <ycard/result.hpp>
#include <ycard/shape.h>
#include <yaml-cpp/yaml.h>
#include <filesystem>
#include <string>

namespace ycard {

//=============================================================================
// Scene documents (YAML)
//
// One parse function per variant, selected by the "type" discriminator.
// Keys are snake_case. Errors are prefixed with the path of the failing node,
// e.g. "panels[1].shape_elements[3]: Invalid star: ...". Elements without an
// id get their node path as id.
//=============================================================================

// "#RRGGBB" string or {r, g, b} map
Result<Color> parseColor(const YAML::Node& node);

Result<FillStyle> parseFillStyle(const YAML::Node& node, const std::string& where);
Result<ClipMask> parseClipMask(const YAML::Node& node, const std::string& where);
Result<Shape> parseShape(const YAML::Node& node, const std::string& where);
Result<TextElement> parseTextElement(const YAML::Node& node, const std::string& where);
// Relative source paths are resolved against baseDir when it is not empty
Result<ImageElement> parseImageElement(const YAML::Node& node, const std::string& where,
                                       const std::filesystem::path& baseDir = {});
Result<Border> parseBorder(const YAML::Node& node, const std::string& where);
Result<Panel> parsePanel(const YAML::Node& node, const std::string& where,
                         const std::filesystem::path& baseDir = {});
Result<Card> parseCard(const YAML::Node& node, const std::filesystem::path& baseDir = {});

Result<Card> parseCardString(const std::string& yaml);
// Image paths in the document are relative to the document's directory
Result<Card> loadCard(const std::filesystem::path& path);

} // namespace ycard
