#pragma once

#include <ycard/color.h>
#include <ycard/image-element.h>
#include <ycard/result.hpp>
#include <ycard/shape.h>
#include <ycard/text-element.h>
#include <optional>
#include <string>
#include <vector>

namespace ycard {

enum class BorderStyle {
    Solid,
    Dashed,
    Dotted,
    Decorative,
};

const char* toString(BorderStyle style);
Result<BorderStyle> borderStyleFromString(const std::string& name);

// Dimensions in points
struct Border {
    BorderStyle style = BorderStyle::Solid;
    float width = 1.0f;       // [0, 10]
    Color color = colors::Black;
    float cornerRadius = 0.0f;

    static Result<Border> create(Border draft);
};

enum class PanelPosition {
    Front,
    Back,
    InsideLeft,
    InsideRight,
    Center,
};

const char* toString(PanelPosition position);
Result<PanelPosition> panelPositionFromString(const std::string& name);

//=============================================================================
// Panel - own coordinate frame on the page (inches, origin bottom-left)
//=============================================================================
struct Panel {
    std::string id;
    PanelPosition position = PanelPosition::Front;
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;
    float rotation = 0.0f;
    std::optional<Color> backgroundColor;
    std::optional<Border> border;
    std::vector<TextElement> textElements;
    std::vector<ImageElement> imageElements;
    std::vector<Shape> shapeElements;

    static Result<Panel> create(Panel draft);
};

enum class FoldType {
    HalfFold,
    QuarterFold,
    TriFold,
};

const char* toString(FoldType type);
Result<FoldType> foldTypeFromString(const std::string& name);

struct Card {
    std::string id;
    std::string name;  // 1..100 characters
    FoldType foldType = FoldType::HalfFold;
    std::vector<Panel> panels;

    static Result<Card> create(Card draft);
};

} // namespace ycard
