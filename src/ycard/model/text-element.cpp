#include <ycard/text-element.h>
#include <fmt/format.h>
#include <algorithm>
#include <cctype>

namespace ycard {

size_t codePointCount(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return (static_cast<unsigned char>(c) & 0xC0) != 0x80;
    }));
}

const char* toString(TextAlignment alignment) {
    switch (alignment) {
        case TextAlignment::Left:   return "left";
        case TextAlignment::Center: return "center";
        case TextAlignment::Right:  return "right";
    }
    return "left";
}

const char* toString(FontStyle style) {
    switch (style) {
        case FontStyle::Normal:     return "normal";
        case FontStyle::Bold:       return "bold";
        case FontStyle::Italic:     return "italic";
        case FontStyle::BoldItalic: return "bold_italic";
    }
    return "normal";
}

const char* toString(OverflowPolicy policy) {
    switch (policy) {
        case OverflowPolicy::Auto:     return "auto";
        case OverflowPolicy::Shrink:   return "shrink";
        case OverflowPolicy::Wrap:     return "wrap";
        case OverflowPolicy::Truncate: return "truncate";
    }
    return "auto";
}

Result<TextAlignment> textAlignmentFromString(const std::string& name) {
    if (name == "left") return Ok(TextAlignment::Left);
    if (name == "center") return Ok(TextAlignment::Center);
    if (name == "right") return Ok(TextAlignment::Right);
    return Err<TextAlignment>("Unknown text alignment: '" + name + "'");
}

Result<FontStyle> fontStyleFromString(const std::string& name) {
    if (name == "normal") return Ok(FontStyle::Normal);
    if (name == "bold") return Ok(FontStyle::Bold);
    if (name == "italic") return Ok(FontStyle::Italic);
    if (name == "bold_italic") return Ok(FontStyle::BoldItalic);
    return Err<FontStyle>("Unknown font style: '" + name + "'");
}

Result<OverflowPolicy> overflowPolicyFromString(const std::string& name) {
    if (name == "auto") return Ok(OverflowPolicy::Auto);
    if (name == "shrink") return Ok(OverflowPolicy::Shrink);
    if (name == "wrap") return Ok(OverflowPolicy::Wrap);
    if (name == "truncate") return Ok(OverflowPolicy::Truncate);
    return Err<OverflowPolicy>("Unknown overflow strategy: '" + name + "'");
}

std::string resolveFontName(const std::string& family, FontStyle style) {
    std::string lower = family;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "times") {
        switch (style) {
            case FontStyle::Normal:     return "Times-Roman";
            case FontStyle::Bold:       return "Times-Bold";
            case FontStyle::Italic:     return "Times-Italic";
            case FontStyle::BoldItalic: return "Times-BoldItalic";
        }
    }

    std::string base = family;
    if (lower == "helvetica") base = "Helvetica";
    else if (lower == "courier") base = "Courier";

    // Helvetica and Courier slant with Oblique
    bool oblique = base == "Helvetica" || base == "Courier";
    switch (style) {
        case FontStyle::Normal:     return base;
        case FontStyle::Bold:       return base + "-Bold";
        case FontStyle::Italic:     return base + (oblique ? "-Oblique" : "-Italic");
        case FontStyle::BoldItalic: return base + (oblique ? "-BoldOblique" : "-BoldItalic");
    }
    return base;
}

Result<TextElement> TextElement::create(TextElement draft) {
    size_t length = codePointCount(draft.content);
    if (length == 0 || length > 1000) {
        return Err<TextElement>(fmt::format(
            "Invalid text element: content length {} out of range [1, 1000]", length));
    }
    if (draft.x < 0.0f || draft.y < 0.0f) {
        return Err<TextElement>(fmt::format(
            "Invalid text element: position ({}, {}) must be >= 0", draft.x, draft.y));
    }
    if (draft.width && *draft.width < 0.0f) {
        return Err<TextElement>(fmt::format("Invalid text element: width must be >= 0, got {}", *draft.width));
    }
    if (draft.fontSize < 6 || draft.fontSize > 144) {
        return Err<TextElement>(fmt::format(
            "Invalid text element: font_size {} out of range [6, 144]", draft.fontSize));
    }
    if (draft.minFontSize < 6 || draft.minFontSize > 72) {
        return Err<TextElement>(fmt::format(
            "Invalid text element: min_font_size {} out of range [6, 72]", draft.minFontSize));
    }
    if (draft.maxLines && *draft.maxLines < 1) {
        return Err<TextElement>(fmt::format("Invalid text element: max_lines must be >= 1, got {}", *draft.maxLines));
    }
    if (draft.fontFamily.empty()) {
        return Err<TextElement>("Invalid text element: font_family cannot be empty");
    }
    return Ok(std::move(draft));
}

} // namespace ycard
