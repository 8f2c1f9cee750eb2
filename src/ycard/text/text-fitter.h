#pragma once

#include <ycard/surface.h>
#include <ycard/text-element.h>
#include <optional>
#include <string>
#include <vector>

namespace ycard::text {

constexpr float LINE_HEIGHT_FACTOR = 1.2f;
constexpr const char* ELLIPSIS = "...";
// Below this many characters AUTO prefers shrinking over wrapping
constexpr size_t AUTO_SHRINK_MAX_LENGTH = 30;

inline float lineHeight(float fontSize) { return fontSize * LINE_HEIGHT_FACTOR; }

struct TextMetrics {
    float width = 0.0f;   // widest line, points
    float height = 0.0f;  // lines * line height, points
    int lineCount = 1;
    bool fits = false;
};

// Single line when lines is null, otherwise the given block
TextMetrics measureText(const TextMeasurer& measurer, const std::string& content,
                        const std::string& fontName, int fontSize, float maxWidth,
                        std::optional<float> maxHeight = std::nullopt,
                        const std::vector<std::string>* lines = nullptr);

// Largest integer size in [minSize, initialSize] whose single line fits
// maxWidth; minSize when none does
int shrinkToFit(const TextMeasurer& measurer, const std::string& content,
                const std::string& fontName, int initialSize, float maxWidth, int minSize = 8);

// Greedy word packing. A word wider than maxWidth gets a line of its own.
std::vector<std::string> wrapText(const TextMeasurer& measurer, const std::string& content,
                                  const std::string& fontName, int fontSize, float maxWidth,
                                  std::optional<int> maxLines = std::nullopt);

// Drops trailing characters until content plus "..." fits; unchanged when
// it already fits
std::string truncateWithEllipsis(const TextMeasurer& measurer, const std::string& content,
                                 const std::string& fontName, int fontSize, float maxWidth);

OverflowPolicy selectAutoPolicy(const TextElement& element);

struct FittedText {
    int fontSize = 12;
    std::vector<std::string> lines;
    AdjustmentResult adjustment;
};

// Fits an element into its width (and availableHeight, points, for WRAP).
// Elements without a width come back unchanged.
FittedText fitText(const TextMeasurer& measurer, const TextElement& element,
                   std::optional<float> availableHeight = std::nullopt);

} // namespace ycard::text
