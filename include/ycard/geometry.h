#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace ycard {

constexpr float PI = 3.14159265f;

constexpr float toRadians(float degrees) { return degrees * PI / 180.0f; }

struct Point {
    float x = 0.0f;
    float y = 0.0f;

    bool operator==(const Point&) const = default;
};

struct Rect {
    float x = 0.0f;
    float y = 0.0f;
    float width = 0.0f;
    float height = 0.0f;

    Point center() const { return {x + width / 2, y + height / 2}; }
    float diagonal() const;
};

//=============================================================================
// Path - absolute outline in output units, built from the four primitives
// every surface understands (move, line, cubic curve, close)
//=============================================================================
enum class SegmentType : uint8_t {
    MoveTo,
    LineTo,
    CurveTo,  // pts[0], pts[1] control points, pts[2] end point
    Close,
};

struct PathSegment {
    SegmentType type = SegmentType::MoveTo;
    Point pts[3];
};

class Path {
public:
    void moveTo(float x, float y);
    void lineTo(float x, float y);
    void curveTo(float x1, float y1, float x2, float y2, float x, float y);
    void close();

    void addRect(const Rect& r);
    void addRoundRect(const Rect& r, float radius);
    void addEllipse(float cx, float cy, float rx, float ry);
    void addCircle(float cx, float cy, float r) { addEllipse(cx, cy, r, r); }
    // Closed polygon through all vertices
    void addPolygon(const std::vector<Point>& vertices);

    const std::vector<PathSegment>& segments() const { return _segments; }
    bool empty() const { return _segments.empty(); }
    size_t size() const { return _segments.size(); }

    // Box around every point, control points included
    Rect bounds() const;

private:
    std::vector<PathSegment> _segments;
};

// Star outline: 2 * points vertices, alternating outer/inner radius,
// first vertex at -90 degrees
std::vector<Point> starVertices(float cx, float cy, float outerRadius,
                                float innerRadius, int points);

Point centroid(const Point& a, const Point& b, const Point& c);

// Degree elevation: the cubic control points equivalent to a quadratic curve
struct CubicControls {
    Point cp1;
    Point cp2;
};
CubicControls elevateQuadratic(const Point& start, const Point& control, const Point& end);

} // namespace ycard
