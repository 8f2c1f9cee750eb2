#pragma once

#include <ycard/color.h>
#include <ycard/result.hpp>
#include <optional>
#include <string>

namespace ycard {

enum class TextAlignment {
    Left,
    Center,
    Right,
};

enum class FontStyle {
    Normal,
    Bold,
    Italic,
    BoldItalic,
};

enum class OverflowPolicy {
    Auto,
    Shrink,
    Wrap,
    Truncate,
};

const char* toString(TextAlignment alignment);
const char* toString(FontStyle style);
const char* toString(OverflowPolicy policy);

Result<TextAlignment> textAlignmentFromString(const std::string& name);
Result<FontStyle> fontStyleFromString(const std::string& name);
Result<OverflowPolicy> overflowPolicyFromString(const std::string& name);

// Standard base font for a family + style, e.g. ("times", Bold) -> "Times-Bold".
// Unknown families pass through with a style suffix.
std::string resolveFontName(const std::string& family, FontStyle style);

// Number of UTF-8 code points in text. Continuation bytes are not counted.
size_t codePointCount(const std::string& text);

//=============================================================================
// TextElement - positions in inches relative to the panel origin
//=============================================================================
struct TextElement {
    std::string id;
    std::string content;                 // 1..1000 characters
    float x = 0.0f;
    float y = 0.0f;
    std::optional<float> width;          // max width, inches
    std::string fontFamily = "Helvetica";
    int fontSize = 12;                   // 6..144 pt
    FontStyle fontStyle = FontStyle::Normal;
    std::optional<Color> color;          // black when unset
    TextAlignment alignment = TextAlignment::Left;
    float rotation = 0.0f;
    int zIndex = 100;
    OverflowPolicy overflow = OverflowPolicy::Auto;
    std::optional<int> maxLines;         // >= 1
    int minFontSize = 8;                 // 6..72 pt

    // Validates a filled-in draft
    static Result<TextElement> create(TextElement draft);

    std::string fontName() const { return resolveFontName(fontFamily, fontStyle); }
};

// Outcome of one text-fit decision. Produced per render, never stored on
// the element.
struct AdjustmentResult {
    bool wasAdjusted = false;
    OverflowPolicy policyApplied = OverflowPolicy::Shrink;
    int originalFontSize = 12;
    int finalFontSize = 12;
    int linesUsed = 1;
    bool contentTruncated = false;
};

} // namespace ycard
