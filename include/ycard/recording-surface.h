#pragma once

#include <ycard/base/factory.h>
#include <ycard/surface.h>
#include <optional>
#include <string>
#include <vector>

namespace ycard {

// Paint state snapshot attached to every recorded draw
struct PaintState {
    Color fillColor = colors::Black;
    Color strokeColor = colors::Black;
    float lineWidth = 1.0f;
    float opacity = 1.0f;
    std::vector<float> dash;
    std::string fontName = "Helvetica";
    float fontSize = 12.0f;
    int clipCount = 0;
};

struct RecordedOp {
    std::string name;              // "drawPath", "pushState", "drawText", ...
    std::vector<float> args;
    std::string text;              // text, font, image path or tile name
    Path path;
    bool fill = false;
    bool stroke = false;
    TextAlignment alignment = TextAlignment::Left;
    std::vector<ColorStop> stops;
    PaintState paint;
    int depth = 0;                 // state stack depth when recorded

    // One-line human readable form
    std::string describe() const;
};

/**
 * RecordingSurface - in-memory DrawingSurface.
 *
 * Every call is appended to an operation log. Text is measured with fixed
 * per-character metrics so layouts are reproducible, and image sizes are
 * read from PNG/JPEG headers without decoding pixels.
 */
class RecordingSurface : public DrawingSurface,
                         public base::ObjectFactory<RecordingSurface> {
public:
    using Ptr = std::shared_ptr<RecordingSurface>;
    using base::ObjectFactory<RecordingSurface>::create;

    struct Options {
        bool nativeGradients = true;
        bool nativeTiles = true;
        // Advance per character as a fraction of the font size; unset uses
        // per-character-class widths
        std::optional<float> fixedAdvance;
    };

    static Result<Ptr> createImpl(ContextType& ctx, Options options) noexcept;
    static Result<Ptr> createImpl(ContextType& ctx) noexcept;

    ~RecordingSurface() override = default;

    virtual const std::vector<RecordedOp>& ops() const = 0;
    virtual std::vector<RecordedOp> opsNamed(const std::string& name) const = 0;
    virtual void clear() = 0;

    // Current and deepest state stack depth, and pops with nothing to restore
    virtual int depth() const = 0;
    virtual int maxDepth() const = 0;
    virtual int unbalancedPops() const = 0;

    virtual std::string dump() const = 0;

protected:
    RecordingSurface() = default;
};

} // namespace ycard
