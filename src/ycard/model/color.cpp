#include <ycard/color.h>
#include <algorithm>
#include <cctype>
#include <cstdio>

namespace ycard {

static bool inUnitRange(float v) { return v >= 0.0f && v <= 1.0f; }

static int hexDigit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
    return -1;
}

Result<Color> Color::create(float r, float g, float b) {
    if (!inUnitRange(r)) return Err<Color>("Invalid red value: " + std::to_string(r) + ", must be between 0.0 and 1.0");
    if (!inUnitRange(g)) return Err<Color>("Invalid green value: " + std::to_string(g) + ", must be between 0.0 and 1.0");
    if (!inUnitRange(b)) return Err<Color>("Invalid blue value: " + std::to_string(b) + ", must be between 0.0 and 1.0");
    return Ok(Color{r, g, b});
}

Result<Color> Color::fromHex(const std::string& hex) {
    std::string digits = hex;
    if (!digits.empty() && digits[0] == '#') digits.erase(0, 1);
    if (digits.size() != 6) {
        return Err<Color>("Hex color must be 7 characters (#RRGGBB), got: '" + hex + "'");
    }

    int bytes[3];
    for (int i = 0; i < 3; i++) {
        int hi = hexDigit(digits[i * 2]);
        int lo = hexDigit(digits[i * 2 + 1]);
        if (hi < 0 || lo < 0) {
            return Err<Color>("Invalid hex color: '" + hex + "'");
        }
        bytes[i] = hi * 16 + lo;
    }
    return Ok(Color{bytes[0] / 255.0f, bytes[1] / 255.0f, bytes[2] / 255.0f});
}

std::string Color::toHex() const {
    // Truncating conversion; the epsilon keeps fromHex() values stable
    auto channel = [](float c) {
        return std::clamp(static_cast<int>(c * 255.0f + 1e-3f), 0, 255);
    };
    char buf[8];
    std::snprintf(buf, sizeof(buf), "#%02x%02x%02x", channel(r), channel(g), channel(b));
    return buf;
}

Color interpolate(const Color& a, const Color& b, float t) {
    t = std::clamp(t, 0.0f, 1.0f);
    return Color{
        a.r + (b.r - a.r) * t,
        a.g + (b.g - a.g) * t,
        a.b + (b.b - a.b) * t,
    };
}

} // namespace ycard
