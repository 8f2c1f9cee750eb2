#pragma once

#include <ycard/base/factory.h>
#include <ycard/base/object.h>
#include <ycard/card.h>
#include <ycard/config.h>
#include <ycard/decorative-library.h>
#include <ycard/result.hpp>
#include <ycard/surface.h>
#include <ycard/text-element.h>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace ycard {

// One element that was skipped or degraded during a render pass
struct ElementFailure {
    std::string panelId;
    std::string elementId;
    std::string kind;      // shape type name, "image" or "text"
    std::string message;
};

struct TextAdjustment {
    std::string panelId;
    std::string elementId;
    AdjustmentResult result;
};

struct RenderReport {
    int panelsRendered = 0;
    int elementsRendered = 0;
    int elementsFailed = 0;
    std::vector<ElementFailure> failures;
    std::vector<TextAdjustment> textAdjustments;
};

struct ImageSize {
    float width = 0.0f;   // inches
    float height = 0.0f;  // inches
};

// Both targets: fit inside them (or stretch without preserveAspect). One
// target: derive the other. Neither: natural size limited to maxWidth x maxHeight.
ImageSize computeImageSize(float naturalWidth, float naturalHeight,
                           std::optional<float> targetWidth, std::optional<float> targetHeight,
                           bool preserveAspect, float maxWidth, float maxHeight);

/**
 * CardRenderer - draws a whole card onto one US Letter page.
 *
 * Panels are drawn in order, each inside its own state scope. Within a panel
 * elements are drawn by (z_index, declaration order), shapes declared before
 * images before text. An element that fails is logged, recorded in the
 * RenderReport and skipped; the rest of the card still renders.
 */
class CardRenderer : public base::Object,
                     public base::ObjectFactory<CardRenderer> {
public:
    using Ptr = std::shared_ptr<CardRenderer>;
    using base::ObjectFactory<CardRenderer>::create;

    struct Options {
        bool foldLines = true;
        bool clampImages = true;  // keep images inside the page safe area
    };

    // library may be null: decorative elements then fail individually
    static Result<Ptr> createImpl(ContextType& ctx, Options options,
                                  DecorativeLibrary::Ptr library) noexcept;
    // Options read from config (rendering.fold-lines, rendering.clamp-images)
    static Result<Ptr> createImpl(ContextType& ctx, Config::Ptr config,
                                  DecorativeLibrary::Ptr library) noexcept;

    ~CardRenderer() override = default;

    const char* typeName() const override { return "CardRenderer"; }

    virtual Result<RenderReport> render(DrawingSurface& surface, const Card& card) = 0;

    // Panel loop only, no page setup; failures are appended to report
    virtual void renderPanel(DrawingSurface& surface, const Panel& panel, RenderReport& report) = 0;

    virtual void drawFoldLines(DrawingSurface& surface, FoldType foldType) = 0;

    virtual const Options& options() const = 0;

protected:
    CardRenderer() = default;
};

} // namespace ycard
