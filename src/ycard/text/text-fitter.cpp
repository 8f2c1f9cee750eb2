#include "text-fitter.h"
#include <ycard/units.h>
#include <ytrace/ytrace.hpp>
#include <algorithm>
#include <sstream>

namespace ycard::text {

namespace {

std::vector<std::string> splitWords(const std::string& content) {
    std::vector<std::string> words;
    std::istringstream in(content);
    std::string word;
    while (in >> word) {
        words.push_back(word);
    }
    return words;
}

std::string join(const std::vector<std::string>& words) {
    std::string out;
    for (size_t i = 0; i < words.size(); i++) {
        if (i > 0) out += ' ';
        out += words[i];
    }
    return out;
}

// Removes the last UTF-8 code point
void popCodePoint(std::string& s) {
    while (!s.empty()) {
        unsigned char c = static_cast<unsigned char>(s.back());
        s.pop_back();
        if ((c & 0xC0) != 0x80) break;
    }
}

void rstrip(std::string& s) {
    while (!s.empty() && (s.back() == ' ' || s.back() == '\t' || s.back() == '\n' || s.back() == '\r')) {
        s.pop_back();
    }
}

bool endsWith(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() && s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

TextMetrics measureText(const TextMeasurer& measurer, const std::string& content,
                        const std::string& fontName, int fontSize, float maxWidth,
                        std::optional<float> maxHeight, const std::vector<std::string>* lines) {
    TextMetrics m;
    float size = static_cast<float>(fontSize);
    if (lines) {
        m.lineCount = static_cast<int>(lines->size());
        for (const auto& line : *lines) {
            m.width = std::max(m.width, measurer.measureTextWidth(line, fontName, size));
        }
        m.height = lineHeight(size) * static_cast<float>(m.lineCount);
    } else {
        m.width = measurer.measureTextWidth(content, fontName, size);
        m.height = lineHeight(size);
    }
    m.fits = m.width <= maxWidth && (!maxHeight || m.height <= *maxHeight);
    return m;
}

int shrinkToFit(const TextMeasurer& measurer, const std::string& content,
                const std::string& fontName, int initialSize, float maxWidth, int minSize) {
    minSize = std::min(minSize, initialSize);
    int low = minSize;
    int high = initialSize;
    int best = minSize;

    while (low <= high) {
        int mid = (low + high) / 2;
        if (measureText(measurer, content, fontName, mid, maxWidth).fits) {
            best = mid;
            low = mid + 1;
        } else {
            high = mid - 1;
        }
    }
    return best;
}

std::vector<std::string> wrapText(const TextMeasurer& measurer, const std::string& content,
                                  const std::string& fontName, int fontSize, float maxWidth,
                                  std::optional<int> maxLines) {
    const float size = static_cast<float>(fontSize);
    const size_t cap = maxLines ? static_cast<size_t>(std::max(*maxLines, 1)) : 0;
    std::vector<std::string> lines;
    std::vector<std::string> current;

    for (const auto& word : splitWords(content)) {
        current.push_back(word);
        if (measurer.measureTextWidth(join(current), fontName, size) > maxWidth) {
            current.pop_back();
            if (current.empty()) {
                lines.push_back(word);
            } else {
                lines.push_back(join(current));
                current = {word};
            }
        }
        if (cap && lines.size() >= cap) {
            current.clear();
            break;
        }
    }

    if (!current.empty()) {
        lines.push_back(join(current));
    }
    if (cap && lines.size() > cap) {
        lines.resize(cap);
    }
    return lines;
}

std::string truncateWithEllipsis(const TextMeasurer& measurer, const std::string& content,
                                 const std::string& fontName, int fontSize, float maxWidth) {
    const float size = static_cast<float>(fontSize);
    if (measurer.measureTextWidth(content, fontName, size) <= maxWidth) {
        return content;
    }
    float available = maxWidth - measurer.measureTextWidth(ELLIPSIS, fontName, size);

    std::string truncated = content;
    while (!truncated.empty() && measurer.measureTextWidth(truncated, fontName, size) > available) {
        popCodePoint(truncated);
    }
    rstrip(truncated);
    return truncated + ELLIPSIS;
}

OverflowPolicy selectAutoPolicy(const TextElement& element) {
    if (codePointCount(element.content) < AUTO_SHRINK_MAX_LENGTH) {
        return OverflowPolicy::Shrink;
    }
    if (element.width) {
        return OverflowPolicy::Wrap;
    }
    return OverflowPolicy::Shrink;
}

FittedText fitText(const TextMeasurer& measurer, const TextElement& element,
                   std::optional<float> availableHeight) {
    OverflowPolicy policy = element.overflow;
    if (policy == OverflowPolicy::Auto) {
        policy = selectAutoPolicy(element);
    }

    FittedText out;
    out.fontSize = element.fontSize;
    out.adjustment.policyApplied = policy;
    out.adjustment.originalFontSize = element.fontSize;
    out.adjustment.finalFontSize = element.fontSize;

    if (!element.width) {
        out.lines = {element.content};
        return out;
    }

    const std::string font = element.fontName();
    const float maxWidth = inchesToPoints(*element.width);
    const int minSize = std::min(element.minFontSize, element.fontSize);
    bool truncated = false;

    switch (policy) {
        case OverflowPolicy::Auto:
        case OverflowPolicy::Shrink: {
            out.fontSize = shrinkToFit(measurer, element.content, font, element.fontSize, maxWidth, minSize);
            std::string content = element.content;
            if (out.fontSize == minSize &&
                !measureText(measurer, content, font, out.fontSize, maxWidth).fits) {
                content = truncateWithEllipsis(measurer, content, font, out.fontSize, maxWidth);
            }
            truncated = content != element.content && endsWith(content, ELLIPSIS);
            out.lines = {content};
            break;
        }

        case OverflowPolicy::Wrap: {
            out.lines = wrapText(measurer, element.content, font, element.fontSize, maxWidth, element.maxLines);
            if (availableHeight && *availableHeight > 0.0f && element.fontSize > minSize &&
                !measureText(measurer, element.content, font, element.fontSize, maxWidth,
                             availableHeight, &out.lines).fits) {
                int low = minSize;
                int high = element.fontSize;
                int best = minSize;
                std::vector<std::string> bestLines;
                while (low <= high) {
                    int mid = (low + high) / 2;
                    auto lines = wrapText(measurer, element.content, font, mid, maxWidth, element.maxLines);
                    if (measureText(measurer, element.content, font, mid, maxWidth,
                                    availableHeight, &lines).fits) {
                        best = mid;
                        bestLines = std::move(lines);
                        low = mid + 1;
                    } else {
                        high = mid - 1;
                    }
                }
                // Nothing fit: lay out at the minimum size anyway
                if (bestLines.empty()) {
                    bestLines = wrapText(measurer, element.content, font, best, maxWidth, element.maxLines);
                }
                out.fontSize = best;
                out.lines = std::move(bestLines);
            }
            if (out.lines.empty()) {
                out.lines = {element.content};
            }
            break;
        }

        case OverflowPolicy::Truncate: {
            std::string content = truncateWithEllipsis(measurer, element.content, font, element.fontSize, maxWidth);
            truncated = content != element.content;
            out.lines = {content};
            break;
        }
    }

    out.adjustment.finalFontSize = out.fontSize;
    out.adjustment.linesUsed = static_cast<int>(out.lines.size());
    out.adjustment.contentTruncated = truncated;
    out.adjustment.wasAdjusted = out.fontSize != element.fontSize || truncated || out.lines.size() > 1;

    if (out.adjustment.wasAdjusted) {
        ydebug("Text '{}' fitted with {}: {}pt -> {}pt, {} line(s){}",
               element.id, toString(policy), element.fontSize, out.fontSize,
               out.lines.size(), truncated ? ", truncated" : "");
    }
    return out;
}

} // namespace ycard::text
