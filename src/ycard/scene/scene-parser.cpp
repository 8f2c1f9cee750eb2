#include <ycard/scene-parser.h>
#include <fmt/format.h>
#include <ytrace/ytrace.hpp>
#include <map>
#include <optional>
#include <type_traits>
#include <vector>

namespace ycard {

namespace {

std::string child(const std::string& where, const char* key) {
    return where.empty() ? std::string(key) : where + "." + key;
}

std::string item(const std::string& where, size_t index) {
    return fmt::format("{}[{}]", where, index);
}

bool present(const YAML::Node& node, const char* key) {
    const YAML::Node value = node[key];
    return value && !value.IsNull();
}

template<typename T>
Result<T> convert(const YAML::Node& value, const char* key) {
    if constexpr (std::is_same_v<T, Color>) {
        auto color = parseColor(value);
        if (!color) {
            return Err<T>(fmt::format("field '{}'", key), color);
        }
        return color;
    } else {
        try {
            return value.as<T>();
        } catch (const YAML::Exception&) {
            return Err<T>(fmt::format("field '{}' has an invalid value", key));
        }
    }
}

// Optional field: out keeps its default when the key is absent
template<typename T>
Result<void> read(const YAML::Node& node, const char* key, T& out) {
    if (!present(node, key)) return Ok();
    auto value = convert<T>(node[key], key);
    if (!value) return std::unexpected(value.error());
    out = std::move(*value);
    return Ok();
}

template<typename T>
Result<void> read(const YAML::Node& node, const char* key, std::optional<T>& out) {
    if (!present(node, key)) return Ok();
    auto value = convert<T>(node[key], key);
    if (!value) return std::unexpected(value.error());
    out = std::move(*value);
    return Ok();
}

template<typename T>
Result<void> require(const YAML::Node& node, const char* key, T& out) {
    if (!present(node, key)) {
        return Err(fmt::format("missing required field '{}'", key));
    }
    return read(node, key, out);
}

Result<std::string> typeOf(const YAML::Node& node) {
    if (!node.IsMap()) {
        return Err<std::string>("expected a map");
    }
    std::string type;
    if (auto res = require(node, "type", type); !res) {
        return std::unexpected(res.error());
    }
    return type;
}

Result<std::vector<ColorStop>> parseStops(const YAML::Node& node, const std::string& where) {
    const YAML::Node list = node["stops"];
    if (!list || !list.IsSequence()) {
        return Err<std::vector<ColorStop>>(where + ": 'stops' must be a list");
    }
    std::vector<ColorStop> stops;
    for (size_t i = 0; i < list.size(); i++) {
        const YAML::Node entry = list[i];
        std::string at = item(child(where, "stops"), i);
        float position = 0.0f;
        Color color;
        if (auto res = require(entry, "position", position); !res) return Err<std::vector<ColorStop>>(at, res);
        if (auto res = require(entry, "color", color); !res) return Err<std::vector<ColorStop>>(at, res);
        auto stop = ColorStop::create(position, color);
        if (!stop) return Err<std::vector<ColorStop>>(at, stop);
        stops.push_back(*stop);
    }
    return stops;
}

Result<ShapeStyle> parseShapeStyle(const YAML::Node& node, const std::string& where) {
    ShapeStyle style;
    style.id = where;
    if (auto res = read(node, "id", style.id); !res) return Err<ShapeStyle>(where, res);
    if (auto res = read(node, "z_index", style.zIndex); !res) return Err<ShapeStyle>(where, res);
    if (auto res = read(node, "fill_color", style.fillColor); !res) return Err<ShapeStyle>(where, res);
    if (auto res = read(node, "stroke_color", style.strokeColor); !res) return Err<ShapeStyle>(where, res);
    if (auto res = read(node, "stroke_width", style.strokeWidth); !res) return Err<ShapeStyle>(where, res);
    if (auto res = read(node, "opacity", style.opacity); !res) return Err<ShapeStyle>(where, res);
    if (auto res = read(node, "rotation", style.rotation); !res) return Err<ShapeStyle>(where, res);
    if (present(node, "fill")) {
        auto fill = parseFillStyle(node["fill"], child(where, "fill"));
        if (!fill) return std::unexpected(fill.error());
        style.fill = std::move(*fill);
    }
    return style;
}

// Lifts a typed Result into the variant Result, prefixing the node path
template<typename V, typename T>
Result<V> lift(Result<T> res, const std::string& where) {
    if (!res) return Err<V>(where, res);
    return V(std::move(*res));
}

} // namespace

Result<Color> parseColor(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return Err<Color>("color is missing");
    }
    if (node.IsScalar()) {
        return Color::fromHex(node.Scalar());
    }
    if (node.IsMap()) {
        float r = 0.0f, g = 0.0f, b = 0.0f;
        if (auto res = require(node, "r", r); !res) return Err<Color>("Invalid color", res);
        if (auto res = require(node, "g", g); !res) return Err<Color>("Invalid color", res);
        if (auto res = require(node, "b", b); !res) return Err<Color>("Invalid color", res);
        return Color::create(r, g, b);
    }
    return Err<Color>("color must be a hex string or an {r, g, b} map");
}

Result<FillStyle> parseFillStyle(const YAML::Node& node, const std::string& where) {
    auto type = typeOf(node);
    if (!type) return Err<FillStyle>(where, type);

    if (*type == "solid") {
        Color color;
        if (auto res = require(node, "color", color); !res) return Err<FillStyle>(where, res);
        return FillStyle(SolidFill{color});
    }
    if (*type == "linear_gradient") {
        float angle = 0.0f;
        if (auto res = read(node, "angle", angle); !res) return Err<FillStyle>(where, res);
        auto stops = parseStops(node, where);
        if (!stops) return std::unexpected(stops.error());
        return lift<FillStyle>(LinearGradientFill::create(angle, std::move(*stops)), where);
    }
    if (*type == "radial_gradient") {
        float cx = 0.5f, cy = 0.5f, radius = 0.5f;
        if (auto res = read(node, "center_x", cx); !res) return Err<FillStyle>(where, res);
        if (auto res = read(node, "center_y", cy); !res) return Err<FillStyle>(where, res);
        if (auto res = read(node, "radius", radius); !res) return Err<FillStyle>(where, res);
        auto stops = parseStops(node, where);
        if (!stops) return std::unexpected(stops.error());
        return lift<FillStyle>(RadialGradientFill::create(cx, cy, radius, std::move(*stops)), where);
    }
    if (*type == "pattern") {
        std::string kindName;
        float spacing = 0.25f, scale = 1.0f, rotation = 0.0f;
        if (auto res = require(node, "pattern_type", kindName); !res) return Err<FillStyle>(where, res);
        auto kind = patternKindFromString(kindName);
        if (!kind) return Err<FillStyle>(where, kind);

        const YAML::Node list = node["colors"];
        if (!list || !list.IsSequence()) {
            return Err<FillStyle>(where + ": 'colors' must be a list");
        }
        std::vector<Color> colors;
        for (size_t i = 0; i < list.size(); i++) {
            auto color = parseColor(list[i]);
            if (!color) return Err<FillStyle>(item(child(where, "colors"), i), color);
            colors.push_back(*color);
        }
        if (auto res = read(node, "spacing", spacing); !res) return Err<FillStyle>(where, res);
        if (auto res = read(node, "scale", scale); !res) return Err<FillStyle>(where, res);
        if (auto res = read(node, "rotation", rotation); !res) return Err<FillStyle>(where, res);
        return lift<FillStyle>(PatternFill::create(*kind, std::move(colors), spacing, scale, rotation), where);
    }
    return Err<FillStyle>(fmt::format("{}: Unknown fill type: '{}'", where, *type));
}

Result<ClipMask> parseClipMask(const YAML::Node& node, const std::string& where) {
    auto type = typeOf(node);
    if (!type) return Err<ClipMask>(where, type);

    if (*type == "circle") {
        float cx = 0.0f, cy = 0.0f, r = 0.0f;
        if (auto res = require(node, "center_x", cx); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "center_y", cy); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "radius", r); !res) return Err<ClipMask>(where, res);
        return lift<ClipMask>(CircleClipMask::create(cx, cy, r), where);
    }
    if (*type == "rectangle") {
        float x = 0.0f, y = 0.0f, w = 0.0f, h = 0.0f;
        if (auto res = require(node, "x", x); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "y", y); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "width", w); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "height", h); !res) return Err<ClipMask>(where, res);
        return lift<ClipMask>(RectangleClipMask::create(x, y, w, h), where);
    }
    if (*type == "ellipse") {
        float cx = 0.0f, cy = 0.0f, rx = 0.0f, ry = 0.0f;
        if (auto res = require(node, "center_x", cx); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "center_y", cy); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "radius_x", rx); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "radius_y", ry); !res) return Err<ClipMask>(where, res);
        return lift<ClipMask>(EllipseClipMask::create(cx, cy, rx, ry), where);
    }
    if (*type == "star") {
        float cx = 0.0f, cy = 0.0f, outer = 0.0f, inner = 0.0f;
        int points = 5;
        if (auto res = require(node, "center_x", cx); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "center_y", cy); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "outer_radius", outer); !res) return Err<ClipMask>(where, res);
        if (auto res = require(node, "inner_radius", inner); !res) return Err<ClipMask>(where, res);
        if (auto res = read(node, "points", points); !res) return Err<ClipMask>(where, res);
        return lift<ClipMask>(StarClipMask::create(cx, cy, outer, inner, points), where);
    }
    if (*type == "svg_path") {
        std::string data;
        float scale = 1.0f;
        if (auto res = require(node, "path_data", data); !res) return Err<ClipMask>(where, res);
        if (auto res = read(node, "scale", scale); !res) return Err<ClipMask>(where, res);
        return lift<ClipMask>(PathClipMask::create(data, scale), where);
    }
    return Err<ClipMask>(fmt::format("{}: Unknown clip mask type: '{}'", where, *type));
}

Result<Shape> parseShape(const YAML::Node& node, const std::string& where) {
    auto type = typeOf(node);
    if (!type) return Err<Shape>(where, type);

    if (*type == "decorative_element") {
        std::string id = where;
        std::string name;
        float x = 0.0f, y = 0.0f, scale = 1.0f, rotation = 0.0f;
        int zIndex = 0;
        std::map<std::string, std::string> palette;
        if (auto res = read(node, "id", id); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "name", name); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "x", x); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "y", y); !res) return Err<Shape>(where, res);
        if (auto res = read(node, "scale", scale); !res) return Err<Shape>(where, res);
        if (auto res = read(node, "rotation", rotation); !res) return Err<Shape>(where, res);
        if (auto res = read(node, "color_palette", palette); !res) return Err<Shape>(where, res);
        if (auto res = read(node, "z_index", zIndex); !res) return Err<Shape>(where, res);
        auto ref = DecorativeRef::create(name, x, y, scale, rotation, std::move(palette), zIndex);
        if (!ref) return Err<Shape>(where, ref);
        ref->id = id;
        return Shape(std::move(*ref));
    }

    auto style = parseShapeStyle(node, where);
    if (!style) return std::unexpected(style.error());

    if (*type == "rectangle") {
        float x = 0.0f, y = 0.0f, w = 0.0f, h = 0.0f;
        if (auto res = require(node, "x", x); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "y", y); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "width", w); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "height", h); !res) return Err<Shape>(where, res);
        return lift<Shape>(RectangleShape::create(x, y, w, h, std::move(*style)), where);
    }
    if (*type == "circle") {
        float cx = 0.0f, cy = 0.0f, r = 0.0f;
        if (auto res = require(node, "center_x", cx); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "center_y", cy); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "radius", r); !res) return Err<Shape>(where, res);
        return lift<Shape>(CircleShape::create(cx, cy, r, std::move(*style)), where);
    }
    if (*type == "triangle") {
        float v[6] = {};
        const char* keys[6] = {"x1", "y1", "x2", "y2", "x3", "y3"};
        for (int i = 0; i < 6; i++) {
            if (auto res = require(node, keys[i], v[i]); !res) return Err<Shape>(where, res);
        }
        return lift<Shape>(TriangleShape::create(v[0], v[1], v[2], v[3], v[4], v[5], std::move(*style)), where);
    }
    if (*type == "star") {
        float cx = 0.0f, cy = 0.0f, outer = 0.0f, inner = 0.0f;
        int points = 5;
        if (auto res = require(node, "center_x", cx); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "center_y", cy); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "outer_radius", outer); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "inner_radius", inner); !res) return Err<Shape>(where, res);
        if (auto res = read(node, "points", points); !res) return Err<Shape>(where, res);
        return lift<Shape>(StarShape::create(cx, cy, outer, inner, points, std::move(*style)), where);
    }
    if (*type == "line") {
        float sx = 0.0f, sy = 0.0f, ex = 0.0f, ey = 0.0f;
        if (auto res = require(node, "start_x", sx); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "start_y", sy); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "end_x", ex); !res) return Err<Shape>(where, res);
        if (auto res = require(node, "end_y", ey); !res) return Err<Shape>(where, res);
        return lift<Shape>(LineShape::create(sx, sy, ex, ey, std::move(*style)), where);
    }
    if (*type == "svg_path") {
        std::string data;
        float scale = 1.0f;
        if (auto res = require(node, "path_data", data); !res) return Err<Shape>(where, res);
        if (auto res = read(node, "scale", scale); !res) return Err<Shape>(where, res);
        return lift<Shape>(PathShape::create(data, scale, std::move(*style)), where);
    }
    return Err<Shape>(fmt::format("{}: Unknown shape type: '{}'", where, *type));
}

Result<TextElement> parseTextElement(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) return Err<TextElement>(where + ": expected a map");

    TextElement draft;
    draft.id = where;
    std::string style, alignment, overflow;
    if (auto res = read(node, "id", draft.id); !res) return Err<TextElement>(where, res);
    if (auto res = require(node, "content", draft.content); !res) return Err<TextElement>(where, res);
    if (auto res = require(node, "x", draft.x); !res) return Err<TextElement>(where, res);
    if (auto res = require(node, "y", draft.y); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "width", draft.width); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "font_family", draft.fontFamily); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "font_size", draft.fontSize); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "font_style", style); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "color", draft.color); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "alignment", alignment); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "rotation", draft.rotation); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "z_index", draft.zIndex); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "overflow", overflow); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "overflow_strategy", overflow); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "max_lines", draft.maxLines); !res) return Err<TextElement>(where, res);
    if (auto res = read(node, "min_font_size", draft.minFontSize); !res) return Err<TextElement>(where, res);

    if (!style.empty()) {
        auto v = fontStyleFromString(style);
        if (!v) return Err<TextElement>(where, v);
        draft.fontStyle = *v;
    }
    if (!alignment.empty()) {
        auto v = textAlignmentFromString(alignment);
        if (!v) return Err<TextElement>(where, v);
        draft.alignment = *v;
    }
    if (!overflow.empty()) {
        auto v = overflowPolicyFromString(overflow);
        if (!v) return Err<TextElement>(where, v);
        draft.overflow = *v;
    }

    auto text = TextElement::create(std::move(draft));
    if (!text) return Err<TextElement>(where, text);
    return text;
}

Result<ImageElement> parseImageElement(const YAML::Node& node, const std::string& where,
                                       const std::filesystem::path& baseDir) {
    if (!node.IsMap()) return Err<ImageElement>(where + ": expected a map");

    ImageElement draft;
    draft.id = where;
    if (auto res = read(node, "id", draft.id); !res) return Err<ImageElement>(where, res);
    if (auto res = require(node, "source_path", draft.sourcePath); !res) return Err<ImageElement>(where, res);
    if (auto res = require(node, "x", draft.x); !res) return Err<ImageElement>(where, res);
    if (auto res = require(node, "y", draft.y); !res) return Err<ImageElement>(where, res);
    if (auto res = read(node, "width", draft.width); !res) return Err<ImageElement>(where, res);
    if (auto res = read(node, "height", draft.height); !res) return Err<ImageElement>(where, res);
    if (auto res = read(node, "preserve_aspect", draft.preserveAspect); !res) return Err<ImageElement>(where, res);
    if (auto res = read(node, "rotation", draft.rotation); !res) return Err<ImageElement>(where, res);
    if (auto res = read(node, "opacity", draft.opacity); !res) return Err<ImageElement>(where, res);
    if (auto res = read(node, "z_index", draft.zIndex); !res) return Err<ImageElement>(where, res);

    if (present(node, "clip_mask")) {
        auto mask = parseClipMask(node["clip_mask"], child(where, "clip_mask"));
        if (!mask) return std::unexpected(mask.error());
        draft.clipMask = std::move(*mask);
    }

    std::filesystem::path source(draft.sourcePath);
    if (!baseDir.empty() && source.is_relative()) {
        draft.sourcePath = (baseDir / source).lexically_normal().string();
    }

    auto image = ImageElement::create(std::move(draft));
    if (!image) return Err<ImageElement>(where, image);
    return image;
}

Result<Border> parseBorder(const YAML::Node& node, const std::string& where) {
    if (!node.IsMap()) return Err<Border>(where + ": expected a map");

    Border draft;
    std::string style;
    if (auto res = read(node, "style", style); !res) return Err<Border>(where, res);
    if (auto res = read(node, "width", draft.width); !res) return Err<Border>(where, res);
    if (auto res = read(node, "color", draft.color); !res) return Err<Border>(where, res);
    if (auto res = read(node, "corner_radius", draft.cornerRadius); !res) return Err<Border>(where, res);
    if (!style.empty()) {
        auto v = borderStyleFromString(style);
        if (!v) return Err<Border>(where, v);
        draft.style = *v;
    }

    auto border = Border::create(draft);
    if (!border) return Err<Border>(where, border);
    return border;
}

Result<Panel> parsePanel(const YAML::Node& node, const std::string& where,
                         const std::filesystem::path& baseDir) {
    if (!node.IsMap()) return Err<Panel>(where + ": expected a map");

    Panel draft;
    draft.id = where;
    std::string position;
    if (auto res = read(node, "id", draft.id); !res) return Err<Panel>(where, res);
    if (auto res = require(node, "position", position); !res) return Err<Panel>(where, res);
    if (auto res = require(node, "x", draft.x); !res) return Err<Panel>(where, res);
    if (auto res = require(node, "y", draft.y); !res) return Err<Panel>(where, res);
    if (auto res = require(node, "width", draft.width); !res) return Err<Panel>(where, res);
    if (auto res = require(node, "height", draft.height); !res) return Err<Panel>(where, res);
    if (auto res = read(node, "rotation", draft.rotation); !res) return Err<Panel>(where, res);
    if (auto res = read(node, "background_color", draft.backgroundColor); !res) return Err<Panel>(where, res);

    auto pos = panelPositionFromString(position);
    if (!pos) return Err<Panel>(where, pos);
    draft.position = *pos;

    if (present(node, "border")) {
        auto border = parseBorder(node["border"], child(where, "border"));
        if (!border) return std::unexpected(border.error());
        draft.border = *border;
    }

    auto forEach = [&](const char* key, auto&& parseOne) -> Result<void> {
        if (!present(node, key)) return Ok();
        const YAML::Node list = node[key];
        if (!list.IsSequence()) {
            return Err(fmt::format("{}: '{}' must be a list", where, key));
        }
        for (size_t i = 0; i < list.size(); i++) {
            if (auto res = parseOne(list[i], item(child(where, key), i)); !res) return res;
        }
        return Ok();
    };

    auto texts = forEach("text_elements", [&](const YAML::Node& n, const std::string& at) -> Result<void> {
        auto text = parseTextElement(n, at);
        if (!text) return std::unexpected(text.error());
        draft.textElements.push_back(std::move(*text));
        return Ok();
    });
    if (!texts) return std::unexpected(texts.error());

    auto images = forEach("image_elements", [&](const YAML::Node& n, const std::string& at) -> Result<void> {
        auto image = parseImageElement(n, at, baseDir);
        if (!image) return std::unexpected(image.error());
        draft.imageElements.push_back(std::move(*image));
        return Ok();
    });
    if (!images) return std::unexpected(images.error());

    auto shapes = forEach("shape_elements", [&](const YAML::Node& n, const std::string& at) -> Result<void> {
        auto shape = parseShape(n, at);
        if (!shape) return std::unexpected(shape.error());
        draft.shapeElements.push_back(std::move(*shape));
        return Ok();
    });
    if (!shapes) return std::unexpected(shapes.error());

    auto panel = Panel::create(std::move(draft));
    if (!panel) return Err<Panel>(where, panel);
    return panel;
}

Result<Card> parseCard(const YAML::Node& node, const std::filesystem::path& baseDir) {
    if (!node || !node.IsMap()) {
        return Err<Card>("card: document root must be a map");
    }

    Card draft;
    std::string foldType;
    if (auto res = read(node, "id", draft.id); !res) return Err<Card>("card", res);
    if (auto res = require(node, "name", draft.name); !res) return Err<Card>("card", res);
    if (auto res = require(node, "fold_type", foldType); !res) return Err<Card>("card", res);
    if (draft.id.empty()) draft.id = draft.name;

    auto fold = foldTypeFromString(foldType);
    if (!fold) return Err<Card>("card", fold);
    draft.foldType = *fold;

    const YAML::Node panels = node["panels"];
    if (!panels || !panels.IsSequence()) {
        return Err<Card>("card: 'panels' must be a list");
    }
    for (size_t i = 0; i < panels.size(); i++) {
        auto panel = parsePanel(panels[i], item("panels", i), baseDir);
        if (!panel) return std::unexpected(panel.error());
        draft.panels.push_back(std::move(*panel));
    }

    auto card = Card::create(std::move(draft));
    if (!card) return Err<Card>("card", card);
    return card;
}

Result<Card> parseCardString(const std::string& yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        return Err<Card>("YAML parse error: " + std::string(e.what()));
    }
    return parseCard(root);
}

Result<Card> loadCard(const std::filesystem::path& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path.string());
    } catch (const YAML::BadFile&) {
        return Err<Card>("Cannot open card file: " + path.string());
    } catch (const YAML::Exception& e) {
        return Err<Card>(fmt::format("YAML parse error in {}: {}", path.string(), e.what()));
    }

    auto card = parseCard(root, path.parent_path());
    if (!card) {
        return Err<Card>("Failed to load card " + path.string(), card);
    }
    yinfo("Loaded card '{}' from {} ({} panels)", card->name, path.string(), card->panels.size());
    return card;
}

} // namespace ycard
