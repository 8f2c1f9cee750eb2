#include <ycard/image-element.h>
#include <ytrace/ytrace.hpp>
#include <fmt/format.h>

namespace ycard {

Result<ImageElement> ImageElement::create(ImageElement draft) {
    if (draft.sourcePath.empty()) {
        return Err<ImageElement>("Invalid image element: source_path cannot be empty");
    }
    if (draft.x < 0.0f || draft.y < 0.0f) {
        return Err<ImageElement>(fmt::format(
            "Invalid image element: position ({}, {}) must be >= 0", draft.x, draft.y));
    }
    if (draft.width && *draft.width < 0.0f) {
        return Err<ImageElement>(fmt::format("Invalid image element: width must be >= 0, got {}", *draft.width));
    }
    if (draft.height && *draft.height < 0.0f) {
        return Err<ImageElement>(fmt::format("Invalid image element: height must be >= 0, got {}", *draft.height));
    }
    if (draft.opacity < 0.0f || draft.opacity > 1.0f) {
        return Err<ImageElement>(fmt::format("Invalid image element: opacity {} out of range (0.0-1.0)", draft.opacity));
    }
    if (draft.clipMask && draft.width && draft.height &&
        !clipMaskWithin(*draft.clipMask, *draft.width, *draft.height)) {
        ywarn("Image '{}': {} clip mask extends beyond the {}x{} in image bounds",
              draft.sourcePath, clipMaskTypeName(*draft.clipMask), *draft.width, *draft.height);
    }
    return Ok(std::move(draft));
}

} // namespace ycard
