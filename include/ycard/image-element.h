#pragma once

#include <ycard/clip-mask.h>
#include <ycard/result.hpp>
#include <optional>
#include <string>

namespace ycard {

//=============================================================================
// ImageElement - positions and sizes in inches relative to the panel origin
//=============================================================================
struct ImageElement {
    std::string id;
    std::string sourcePath;
    float x = 0.0f;
    float y = 0.0f;
    std::optional<float> width;
    std::optional<float> height;
    bool preserveAspect = true;
    float rotation = 0.0f;
    float opacity = 1.0f;
    int zIndex = 100;
    std::optional<ClipMask> clipMask;

    static Result<ImageElement> create(ImageElement draft);
};

} // namespace ycard
