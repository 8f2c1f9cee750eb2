//=============================================================================
// ClipMask Tests
//=============================================================================

#include <boost/ut.hpp>
#include <ycard/clip-mask.h>

using namespace boost::ut;
using namespace ycard;

suite clip_mask_create_tests = [] {
    "circle mask requires positive radius"_test = [] {
        expect(CircleClipMask::create(1.0f, 1.0f, 0.5f).has_value());
        expect(!CircleClipMask::create(1.0f, 1.0f, 0.0f).has_value());
        expect(!CircleClipMask::create(-1.0f, 1.0f, 0.5f).has_value());
    };

    "rectangle mask requires positive size"_test = [] {
        expect(RectangleClipMask::create(0.0f, 0.0f, 1.0f, 1.0f).has_value());
        expect(!RectangleClipMask::create(0.0f, 0.0f, 0.0f, 1.0f).has_value());
    };

    "ellipse mask requires both radii"_test = [] {
        expect(EllipseClipMask::create(1.0f, 1.0f, 1.0f, 0.5f).has_value());
        expect(!EllipseClipMask::create(1.0f, 1.0f, 1.0f, 0.0f).has_value());
    };

    "star mask inner radius below outer"_test = [] {
        expect(StarClipMask::create(1.0f, 1.0f, 1.0f, 0.5f).has_value());
        auto equal = StarClipMask::create(1.0f, 1.0f, 1.0f, 1.0f);
        expect(!equal.has_value());
        expect(error_msg(equal).find("inner_radius") != std::string::npos);
    };

    "star mask point count 3 to 20"_test = [] {
        expect(!StarClipMask::create(1.0f, 1.0f, 1.0f, 0.5f, 2).has_value());
        expect(StarClipMask::create(1.0f, 1.0f, 1.0f, 0.5f, 3).has_value());
        expect(StarClipMask::create(1.0f, 1.0f, 1.0f, 0.5f, 20).has_value());
        expect(!StarClipMask::create(1.0f, 1.0f, 1.0f, 0.5f, 21).has_value());
    };

    "path mask must be closed"_test = [] {
        auto open = PathClipMask::create("M 0 0 L 1 0 L 1 1");
        expect(!open.has_value());
        expect(error_msg(open).find("closed") != std::string::npos);

        expect(PathClipMask::create("M 0 0 L 1 0 L 1 1 Z").has_value());
        expect(PathClipMask::create("M 0 0 L 1 0 L 1 1 z").has_value());
    };

    "path mask data is trimmed"_test = [] {
        auto mask = PathClipMask::create("  M 0 0 L 1 1 Z \n");
        expect(mask.has_value() >> fatal);
        expect(mask->pathData == "M 0 0 L 1 1 Z"_b);
        expect(!PathClipMask::create("   ").has_value());
    };

    "path mask scale range"_test = [] {
        expect(!PathClipMask::create("M 0 0 L 1 1 Z", 0.0f).has_value());
        expect(!PathClipMask::create("M 0 0 L 1 1 Z", 11.0f).has_value());
    };
};

suite clip_mask_bounds_tests = [] {
    "masks inside the image pass"_test = [] {
        expect(clipMaskWithin(CircleClipMask{1.0f, 1.0f, 1.0f}, 2.0f, 2.0f));
        expect(clipMaskWithin(RectangleClipMask{0.5f, 0.5f, 1.0f, 1.0f}, 2.0f, 2.0f));
    };

    "masks past the image fail"_test = [] {
        expect(!clipMaskWithin(CircleClipMask{1.5f, 1.0f, 1.0f}, 2.0f, 2.0f));
        expect(!clipMaskWithin(EllipseClipMask{1.0f, 1.0f, 0.5f, 1.5f}, 2.0f, 2.0f));
        expect(!clipMaskWithin(StarClipMask{1.0f, 1.0f, 1.5f, 0.5f, 5}, 2.0f, 2.0f));
    };

    "path masks are not checked"_test = [] {
        expect(clipMaskWithin(PathClipMask{"M 0 0 L 100 100 Z", 1.0f}, 1.0f, 1.0f));
    };

    "type names"_test = [] {
        ClipMask mask = PathClipMask{};
        expect(std::string(clipMaskTypeName(mask)) == "svg_path"_b);
    };
};
