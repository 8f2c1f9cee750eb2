#pragma once

#include <ycard/result.hpp>
#include <string>

namespace ycard {

//=============================================================================
// Color - RGB, each component in [0, 1]
//=============================================================================
struct Color {
    float r = 0.0f;
    float g = 0.0f;
    float b = 0.0f;

    static Result<Color> create(float r, float g, float b);

    // Accepts "#RRGGBB" or "RRGGBB", any case
    static Result<Color> fromHex(const std::string& hex);

    // Lowercase "#rrggbb", components truncated to 0..255
    std::string toHex() const;

    bool operator==(const Color&) const = default;
};

// Linear blend, t clamped to [0, 1]
Color interpolate(const Color& a, const Color& b, float t);

namespace colors {
inline constexpr Color White{1.0f, 1.0f, 1.0f};
inline constexpr Color Black{0.0f, 0.0f, 0.0f};
inline constexpr Color Red{0.8f, 0.1f, 0.1f};
inline constexpr Color Green{0.2f, 0.5f, 0.2f};
inline constexpr Color Blue{0.1f, 0.3f, 0.7f};
inline constexpr Color Gold{1.0f, 0.84f, 0.0f};
inline constexpr Color Silver{0.75f, 0.75f, 0.75f};
} // namespace colors

} // namespace ycard
