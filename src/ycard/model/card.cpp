#include <ycard/card.h>
#include <fmt/format.h>

namespace ycard {

const char* toString(BorderStyle style) {
    switch (style) {
        case BorderStyle::Solid:      return "solid";
        case BorderStyle::Dashed:     return "dashed";
        case BorderStyle::Dotted:     return "dotted";
        case BorderStyle::Decorative: return "decorative";
    }
    return "solid";
}

Result<BorderStyle> borderStyleFromString(const std::string& name) {
    if (name == "solid") return Ok(BorderStyle::Solid);
    if (name == "dashed") return Ok(BorderStyle::Dashed);
    if (name == "dotted") return Ok(BorderStyle::Dotted);
    if (name == "decorative") return Ok(BorderStyle::Decorative);
    return Err<BorderStyle>("Unknown border style: '" + name + "'");
}

Result<Border> Border::create(Border draft) {
    if (draft.width < 0.0f || draft.width > 10.0f) {
        return Err<Border>(fmt::format("Invalid border: width {} out of range [0, 10]", draft.width));
    }
    if (draft.cornerRadius < 0.0f) {
        return Err<Border>(fmt::format("Invalid border: corner_radius must be >= 0, got {}", draft.cornerRadius));
    }
    return Ok(std::move(draft));
}

const char* toString(PanelPosition position) {
    switch (position) {
        case PanelPosition::Front:       return "front";
        case PanelPosition::Back:        return "back";
        case PanelPosition::InsideLeft:  return "inside_left";
        case PanelPosition::InsideRight: return "inside_right";
        case PanelPosition::Center:      return "center";
    }
    return "front";
}

Result<PanelPosition> panelPositionFromString(const std::string& name) {
    if (name == "front") return Ok(PanelPosition::Front);
    if (name == "back") return Ok(PanelPosition::Back);
    if (name == "inside_left") return Ok(PanelPosition::InsideLeft);
    if (name == "inside_right") return Ok(PanelPosition::InsideRight);
    if (name == "center") return Ok(PanelPosition::Center);
    return Err<PanelPosition>("Unknown panel position: '" + name + "'");
}

Result<Panel> Panel::create(Panel draft) {
    if (draft.x < 0.0f || draft.y < 0.0f) {
        return Err<Panel>(fmt::format("Invalid panel: position ({}, {}) must be >= 0", draft.x, draft.y));
    }
    if (draft.width <= 0.0f || draft.height <= 0.0f) {
        return Err<Panel>(fmt::format("Invalid panel: size {}x{} must be > 0", draft.width, draft.height));
    }
    return Ok(std::move(draft));
}

const char* toString(FoldType type) {
    switch (type) {
        case FoldType::HalfFold:    return "half_fold";
        case FoldType::QuarterFold: return "quarter_fold";
        case FoldType::TriFold:     return "tri_fold";
    }
    return "half_fold";
}

Result<FoldType> foldTypeFromString(const std::string& name) {
    if (name == "half_fold") return Ok(FoldType::HalfFold);
    if (name == "quarter_fold") return Ok(FoldType::QuarterFold);
    if (name == "tri_fold") return Ok(FoldType::TriFold);
    return Err<FoldType>("Unknown fold type: '" + name + "'");
}

Result<Card> Card::create(Card draft) {
    if (draft.name.empty() || draft.name.size() > 100) {
        return Err<Card>(fmt::format("Invalid card: name length {} out of range [1, 100]", draft.name.size()));
    }
    if (draft.panels.empty()) {
        return Err<Card>("Invalid card: card must have at least one panel");
    }
    return Ok(std::move(draft));
}

} // namespace ycard
