#pragma once

#include <ycard/clip-mask.h>
#include <ycard/geometry.h>
#include <ycard/result.hpp>
#include <ycard/surface.h>
#include <functional>
#include <memory>

namespace ycard::render {

//=============================================================================
// ClippingRenderer - turns a ClipMask into a closed region anchored at an
// image position (points) and scopes it around a draw call
//=============================================================================
class ClippingRenderer {
public:
    using Ptr = std::shared_ptr<ClippingRenderer>;
    using DrawFn = std::function<Result<void>()>;

    static Result<Ptr> create();

    Result<Path> buildClipPath(const ClipMask& mask, float imageX, float imageY) const;

    // pushState, clip, draw, popState. The clip never outlives the call.
    // A mask that cannot be built is logged and the draw runs unclipped.
    Result<void> drawClipped(DrawingSurface& surface, const ClipMask& mask,
                             float imageX, float imageY, const DrawFn& draw) const;

private:
    ClippingRenderer() = default;
};

} // namespace ycard::render
