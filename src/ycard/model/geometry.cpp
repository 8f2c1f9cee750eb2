#include <ycard/geometry.h>
#include <algorithm>
#include <cmath>
#include <limits>

namespace ycard {

// Control point distance for a quarter ellipse drawn with one cubic
static constexpr float KAPPA = 0.5522847498f;

float Rect::diagonal() const {
    return std::sqrt(width * width + height * height);
}

void Path::moveTo(float x, float y) {
    PathSegment seg;
    seg.type = SegmentType::MoveTo;
    seg.pts[0] = {x, y};
    _segments.push_back(seg);
}

void Path::lineTo(float x, float y) {
    PathSegment seg;
    seg.type = SegmentType::LineTo;
    seg.pts[0] = {x, y};
    _segments.push_back(seg);
}

void Path::curveTo(float x1, float y1, float x2, float y2, float x, float y) {
    PathSegment seg;
    seg.type = SegmentType::CurveTo;
    seg.pts[0] = {x1, y1};
    seg.pts[1] = {x2, y2};
    seg.pts[2] = {x, y};
    _segments.push_back(seg);
}

void Path::close() {
    PathSegment seg;
    seg.type = SegmentType::Close;
    _segments.push_back(seg);
}

void Path::addRect(const Rect& r) {
    moveTo(r.x, r.y);
    lineTo(r.x + r.width, r.y);
    lineTo(r.x + r.width, r.y + r.height);
    lineTo(r.x, r.y + r.height);
    close();
}

void Path::addRoundRect(const Rect& r, float radius) {
    radius = std::min(radius, std::min(r.width, r.height) / 2);
    if (radius <= 0.0f) {
        addRect(r);
        return;
    }
    float k = radius * (1.0f - KAPPA);
    float x0 = r.x, y0 = r.y;
    float x1 = r.x + r.width, y1 = r.y + r.height;

    moveTo(x0 + radius, y0);
    lineTo(x1 - radius, y0);
    curveTo(x1 - k, y0, x1, y0 + k, x1, y0 + radius);
    lineTo(x1, y1 - radius);
    curveTo(x1, y1 - k, x1 - k, y1, x1 - radius, y1);
    lineTo(x0 + radius, y1);
    curveTo(x0 + k, y1, x0, y1 - k, x0, y1 - radius);
    lineTo(x0, y0 + radius);
    curveTo(x0, y0 + k, x0 + k, y0, x0 + radius, y0);
    close();
}

void Path::addEllipse(float cx, float cy, float rx, float ry) {
    float kx = rx * KAPPA;
    float ky = ry * KAPPA;

    moveTo(cx + rx, cy);
    curveTo(cx + rx, cy + ky, cx + kx, cy + ry, cx, cy + ry);
    curveTo(cx - kx, cy + ry, cx - rx, cy + ky, cx - rx, cy);
    curveTo(cx - rx, cy - ky, cx - kx, cy - ry, cx, cy - ry);
    curveTo(cx + kx, cy - ry, cx + rx, cy - ky, cx + rx, cy);
    close();
}

void Path::addPolygon(const std::vector<Point>& vertices) {
    if (vertices.empty()) return;
    moveTo(vertices[0].x, vertices[0].y);
    for (size_t i = 1; i < vertices.size(); i++) {
        lineTo(vertices[i].x, vertices[i].y);
    }
    close();
}

Rect Path::bounds() const {
    float minX = std::numeric_limits<float>::max();
    float minY = std::numeric_limits<float>::max();
    float maxX = std::numeric_limits<float>::lowest();
    float maxY = std::numeric_limits<float>::lowest();
    bool any = false;

    auto include = [&](const Point& p) {
        minX = std::min(minX, p.x);
        minY = std::min(minY, p.y);
        maxX = std::max(maxX, p.x);
        maxY = std::max(maxY, p.y);
        any = true;
    };

    for (const auto& seg : _segments) {
        switch (seg.type) {
            case SegmentType::MoveTo:
            case SegmentType::LineTo:
                include(seg.pts[0]);
                break;
            case SegmentType::CurveTo:
                include(seg.pts[0]);
                include(seg.pts[1]);
                include(seg.pts[2]);
                break;
            case SegmentType::Close:
                break;
        }
    }

    if (!any) return {};
    return {minX, minY, maxX - minX, maxY - minY};
}

std::vector<Point> starVertices(float cx, float cy, float outerRadius,
                                float innerRadius, int points) {
    std::vector<Point> vertices;
    if (points < 1) return vertices;

    int count = points * 2;
    vertices.reserve(static_cast<size_t>(count));
    float step = 360.0f / static_cast<float>(count);
    for (int i = 0; i < count; i++) {
        float angle = toRadians(static_cast<float>(i) * step - 90.0f);
        float radius = (i % 2 == 0) ? outerRadius : innerRadius;
        vertices.push_back({cx + radius * std::cos(angle), cy + radius * std::sin(angle)});
    }
    return vertices;
}

Point centroid(const Point& a, const Point& b, const Point& c) {
    return {(a.x + b.x + c.x) / 3.0f, (a.y + b.y + c.y) / 3.0f};
}

CubicControls elevateQuadratic(const Point& start, const Point& control, const Point& end) {
    constexpr float twoThirds = 2.0f / 3.0f;
    return {
        {start.x + twoThirds * (control.x - start.x), start.y + twoThirds * (control.y - start.y)},
        {end.x + twoThirds * (control.x - end.x), end.y + twoThirds * (control.y - end.y)},
    };
}

} // namespace ycard
