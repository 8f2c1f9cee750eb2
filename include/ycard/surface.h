#pragma once

#include <ycard/color.h>
#include <ycard/fill-style.h>
#include <ycard/geometry.h>
#include <ycard/result.hpp>
#include <ycard/text-element.h>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace ycard {

// Width of a string set in a named base font, in points
class TextMeasurer {
public:
    virtual ~TextMeasurer() = default;
    virtual float measureTextWidth(const std::string& text, const std::string& fontName,
                                   float fontSize) const = 0;
};

struct ImageInfo {
    uint32_t pixelWidth = 0;
    uint32_t pixelHeight = 0;
    float dpiX = 72.0f;
    float dpiY = 72.0f;

    float naturalWidth() const { return pixelWidth / dpiX; }    // inches
    float naturalHeight() const { return pixelHeight / dpiY; }  // inches
};

/**
 * DrawingSurface - page-oriented output target.
 *
 * All coordinates are points with the origin at the bottom-left of the page.
 * Paint state (colors, line width, dash, opacity, font), transforms and
 * clipping live on a state stack saved by pushState() and restored by
 * popState(). Callers pair every push with a pop in the same scope.
 */
class DrawingSurface : public TextMeasurer {
public:
    using Ptr = std::shared_ptr<DrawingSurface>;

    ~DrawingSurface() override = default;

    // =========================================================================
    // Pages
    // =========================================================================
    virtual void beginPage(float width, float height) = 0;
    virtual void endPage() = 0;

    // =========================================================================
    // Paint state
    // =========================================================================
    virtual void setFillColor(const Color& color) = 0;
    virtual void setStrokeColor(const Color& color) = 0;
    virtual void setLineWidth(float width) = 0;
    // Empty pattern = solid line
    virtual void setDash(const std::vector<float>& pattern) = 0;
    virtual void setOpacity(float alpha) = 0;

    // =========================================================================
    // State stack and transforms
    // =========================================================================
    virtual void pushState() = 0;
    virtual void popState() = 0;
    virtual void translate(float dx, float dy) = 0;
    virtual void rotateAbout(float cx, float cy, float degrees) = 0;

    // =========================================================================
    // Paths
    // =========================================================================
    virtual void drawPath(const Path& path, bool fill, bool stroke) = 0;
    // Intersects the current clip with the path; undone by popState()
    virtual void clipTo(const Path& path) = 0;

    // =========================================================================
    // Images
    // =========================================================================
    virtual Result<ImageInfo> imageInfo(const std::string& path) = 0;
    virtual Result<void> drawImage(const std::string& path, float x, float y,
                                   float width, float height, bool preserveAspect) = 0;

    // =========================================================================
    // Text
    // =========================================================================
    virtual void setFont(const std::string& fontName, float size) = 0;
    // (x, y) is the baseline anchor; alignment picks which end of the line it marks
    virtual void drawText(const std::string& text, float x, float y, TextAlignment alignment) = 0;

    // =========================================================================
    // Native gradients - paint the current clip region
    // =========================================================================
    virtual bool supportsGradients() const = 0;
    virtual Result<void> linearGradient(const Point& start, const Point& end,
                                        const std::vector<ColorStop>& stops) = 0;
    virtual Result<void> radialGradient(const Point& center, float radius,
                                        const std::vector<ColorStop>& stops) = 0;

    // =========================================================================
    // Native tiles - draw calls between beginTile/endTile form a reusable
    // size x size tile anchored at the origin
    // =========================================================================
    virtual bool supportsTiles() const = 0;
    virtual Result<void> beginTile(const std::string& name, float size) = 0;
    virtual Result<void> endTile() = 0;
    virtual Result<void> stampTile(const std::string& name, float x, float y) = 0;

protected:
    DrawingSurface() = default;
};

} // namespace ycard
