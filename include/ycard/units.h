#pragma once

namespace ycard {

//=============================================================================
// Units - scene values are inches, the output surface works in points
//=============================================================================

// US Letter page
constexpr float PAGE_WIDTH = 8.5f;    // inches
constexpr float PAGE_HEIGHT = 11.0f;  // inches

// Minimum distance from every page edge
constexpr float SAFE_MARGIN = 0.25f;  // inches

constexpr float POINTS_PER_INCH = 72.0f;

// Guide line widths (points)
constexpr float FOLD_LINE_WIDTH = 0.5f;
constexpr float CUT_LINE_WIDTH = 1.0f;

// Folded sizes (inches)
constexpr float HALF_FOLD_WIDTH = PAGE_HEIGHT / 2;     // 5.5
constexpr float HALF_FOLD_HEIGHT = PAGE_WIDTH;         // 8.5
constexpr float QUARTER_FOLD_WIDTH = PAGE_WIDTH / 2;   // 4.25
constexpr float QUARTER_FOLD_HEIGHT = PAGE_HEIGHT / 2; // 5.5
constexpr float TRI_FOLD_PANEL_WIDTH = PAGE_WIDTH / 3;
constexpr float TRI_FOLD_HEIGHT = PAGE_HEIGHT;

constexpr float inchesToPoints(float inches) { return inches * POINTS_PER_INCH; }
constexpr float pointsToInches(float points) { return points / POINTS_PER_INCH; }

// True when the rectangle (inches, page coordinates) stays inside the safe area
constexpr bool withinPage(float x, float y, float width, float height) {
    if (x < SAFE_MARGIN || y < SAFE_MARGIN) return false;
    if (x + width > PAGE_WIDTH - SAFE_MARGIN) return false;
    if (y + height > PAGE_HEIGHT - SAFE_MARGIN) return false;
    return true;
}

// Same check against a panel's local frame
constexpr bool withinPanel(float x, float y, float width, float height,
                           float panelWidth, float panelHeight) {
    if (x < SAFE_MARGIN || y < SAFE_MARGIN) return false;
    if (x + width > panelWidth - SAFE_MARGIN) return false;
    if (y + height > panelHeight - SAFE_MARGIN) return false;
    return true;
}

} // namespace ycard
