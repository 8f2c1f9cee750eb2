//=============================================================================
// Path Builder Tests
//
// Interpreting parsed commands into absolute output paths
//=============================================================================

#include <boost/ut.hpp>
#include "ycard/render/path-builder.h"
#include "test-helpers.h"

using namespace boost::ut;
using namespace ycard;
using namespace ycard::render;
using ycard::test::near;

namespace {

const PathMapping identity{0.0f, 0.0f, 1.0f};

bool pointNear(const Point& p, float x, float y) {
    return near(p.x, x) && near(p.y, y);
}

} // namespace

suite path_builder_line_tests = [] {
    "absolute lines"_test = [] {
        auto path = buildPath("M 10 10 L 20 10 L 20 20 Z", identity);
        expect(path.has_value() >> fatal);
        const auto& segs = path->segments();
        expect(segs.size() == 4_u);
        expect(segs[0].type == SegmentType::MoveTo);
        expect(pointNear(segs[2].pts[0], 20.0f, 20.0f));
        expect(segs[3].type == SegmentType::Close);
    };

    "relative commands follow the current point"_test = [] {
        auto path = buildPath("m 10 10 l 5 0 l 0 5 h -5 v -5", identity);
        expect(path.has_value() >> fatal);
        const auto& segs = path->segments();
        expect(segs.size() == 5_u);
        expect(pointNear(segs[1].pts[0], 15.0f, 10.0f));
        expect(pointNear(segs[2].pts[0], 15.0f, 15.0f));
        expect(pointNear(segs[3].pts[0], 10.0f, 15.0f));
        expect(pointNear(segs[4].pts[0], 10.0f, 10.0f));
    };

    "extra move pairs are lines"_test = [] {
        auto path = buildPath("M 0 0 5 0 5 5", identity);
        expect(path.has_value() >> fatal);
        expect(path->segments()[1].type == SegmentType::LineTo);
        expect(path->segments()[2].type == SegmentType::LineTo);
    };

    "close returns to the subpath start"_test = [] {
        auto path = buildPath("M 10 10 L 20 10 Z l 5 5", identity);
        expect(path.has_value() >> fatal);
        expect(pointNear(path->segments().back().pts[0], 15.0f, 15.0f));
    };

    "mapping offsets and scales"_test = [] {
        PathMapping mapping{100.0f, 200.0f, 72.0f};
        auto path = buildPath("M 0 0 L 1 1", mapping);
        expect(path.has_value() >> fatal);
        expect(pointNear(path->segments()[0].pts[0], 100.0f, 200.0f));
        expect(pointNear(path->segments()[1].pts[0], 172.0f, 272.0f));
    };
};

suite path_builder_curve_tests = [] {
    "cubic keeps its controls"_test = [] {
        auto path = buildPath("M 0 0 C 1 2 3 4 5 6", identity);
        expect(path.has_value() >> fatal);
        const auto& seg = path->segments()[1];
        expect(seg.type == SegmentType::CurveTo);
        expect(pointNear(seg.pts[0], 1.0f, 2.0f));
        expect(pointNear(seg.pts[1], 3.0f, 4.0f));
        expect(pointNear(seg.pts[2], 5.0f, 6.0f));
    };

    "smooth cubic reflects the previous control"_test = [] {
        auto path = buildPath("M 0 0 C 0 10 10 10 10 0 S 20 -10 20 0", identity);
        expect(path.has_value() >> fatal);
        const auto& seg = path->segments()[2];
        // (10,10) mirrored through (10,0)
        expect(pointNear(seg.pts[0], 10.0f, -10.0f));
        expect(pointNear(seg.pts[2], 20.0f, 0.0f));
    };

    "smooth cubic without a previous cubic starts at the current point"_test = [] {
        auto path = buildPath("M 5 5 S 10 10 15 5", identity);
        expect(path.has_value() >> fatal);
        expect(pointNear(path->segments()[1].pts[0], 5.0f, 5.0f));
    };

    "quadratic is elevated to a cubic"_test = [] {
        auto path = buildPath("M 0 0 Q 3 3 6 0", identity);
        expect(path.has_value() >> fatal);
        const auto& seg = path->segments()[1];
        expect(seg.type == SegmentType::CurveTo);
        expect(pointNear(seg.pts[0], 2.0f, 2.0f));
        expect(pointNear(seg.pts[1], 4.0f, 2.0f));
        expect(pointNear(seg.pts[2], 6.0f, 0.0f));
    };

    "smooth quadratic reflects the quadratic control"_test = [] {
        auto path = buildPath("M 0 0 Q 3 3 6 0 T 12 0", identity);
        expect(path.has_value() >> fatal);
        const auto& seg = path->segments()[2];
        // implied control (9,-3): cp1 = 6 + 2/3 * (9 - 6), 0 + 2/3 * -3
        expect(pointNear(seg.pts[0], 8.0f, -2.0f));
        expect(pointNear(seg.pts[2], 12.0f, 0.0f));
    };

    "arc is drawn as a line to its end point"_test = [] {
        auto path = buildPath("M 0 0 A 5 5 0 0 1 10 0", identity);
        expect(path.has_value() >> fatal);
        const auto& seg = path->segments()[1];
        expect(seg.type == SegmentType::LineTo);
        expect(pointNear(seg.pts[0], 10.0f, 0.0f));
    };
};

suite path_builder_error_tests = [] {
    "parse errors are chained"_test = [] {
        auto path = buildPath("M 0 0 L 1", identity);
        expect(!path.has_value());
        expect(error_msg(path).find("Failed to parse SVG path: ") == 0_u);
    };

    "no commands"_test = [] {
        std::vector<svg::PathCommand> none;
        expect(!buildPath(none, identity).has_value());
    };

    "line without parameters draws nothing"_test = [] {
        auto path = buildPath("M 0 0 L 4 0 L Z", identity);
        expect(path.has_value() >> fatal);
        expect((path->segments().size() == 3_u) >> fatal);
        expect(path->segments().back().type == SegmentType::Close);
        expect(!buildPath("L", identity).has_value());
    };

    "lone close has nothing to draw"_test = [] {
        auto path = buildPath("Z", identity);
        expect(!path.has_value());
        expect(error_msg(path).find("no drawable segments") != std::string::npos);
    };
};
