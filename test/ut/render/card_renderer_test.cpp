//=============================================================================
// Card Renderer Tests
//
// Whole-page rendering against a RecordingSurface: ordering, isolation of
// failing elements, images, text fitting and fold guides.
//=============================================================================

#include <boost/ut.hpp>
#include <ycard/card-renderer.h>
#include "test-helpers.h"
#include <algorithm>
#include <cstdlib>

using namespace boost::ut;
using namespace ycard;
using ycard::test::near;

namespace {

CardRenderer::Ptr renderer(bool foldLines = false, bool clampImages = true,
                           DecorativeLibrary::Ptr library = nullptr) {
    CardRenderer::Options options;
    options.foldLines = foldLines;
    options.clampImages = clampImages;
    return *CardRenderer::create(options, library);
}

Panel fullPage(const std::string& id = "front") {
    Panel panel;
    panel.id = id;
    panel.width = 8.5f;
    panel.height = 11.0f;
    return panel;
}

Card cardWith(Panel panel, FoldType fold = FoldType::HalfFold) {
    Card card;
    card.name = "Test";
    card.foldType = fold;
    card.panels.push_back(std::move(panel));
    return card;
}

Shape filledRect(float x, float y, float w, float h, Color color, int z = 0, const std::string& id = "") {
    ShapeStyle style;
    style.id = id;
    style.zIndex = z;
    style.fillColor = color;
    return RectangleShape{style, x, y, w, h};
}

TextElement textAt(const std::string& content, float x, float y, int z = 100) {
    TextElement text;
    text.id = "greeting";
    text.content = content;
    text.x = x;
    text.y = y;
    text.zIndex = z;
    return text;
}

ImageElement imageAt(const std::string& path, float x, float y) {
    ImageElement image;
    image.id = "photo";
    image.sourcePath = path;
    image.x = x;
    image.y = y;
    return image;
}

size_t indexOf(const std::vector<RecordedOp>& ops, const std::string& name) {
    for (size_t i = 0; i < ops.size(); i++) {
        if (ops[i].name == name) return i;
    }
    return ops.size();
}

} // namespace

suite image_size_tests = [] {
    "both targets fit inside the box"_test = [] {
        auto tall = computeImageSize(4.0f, 3.0f, 2.0f, 2.0f, true, 8.5f, 11.0f);
        expect(near(tall.width, 2.0f));
        expect(near(tall.height, 1.5f));

        auto wide = computeImageSize(4.0f, 3.0f, 4.0f, 1.0f, true, 8.5f, 11.0f);
        expect(near(wide.width, 4.0f / 3.0f));
        expect(near(wide.height, 1.0f));
    };

    "both targets stretch without aspect"_test = [] {
        auto size = computeImageSize(4.0f, 3.0f, 2.0f, 2.0f, false, 8.5f, 11.0f);
        expect(near(size.width, 2.0f));
        expect(near(size.height, 2.0f));
    };

    "one target derives the other"_test = [] {
        auto byWidth = computeImageSize(4.0f, 3.0f, 2.0f, std::nullopt, true, 8.5f, 11.0f);
        expect(near(byWidth.height, 1.5f));
        auto byHeight = computeImageSize(4.0f, 3.0f, std::nullopt, 1.5f, true, 8.5f, 11.0f);
        expect(near(byHeight.width, 2.0f));
        auto loose = computeImageSize(4.0f, 3.0f, 2.0f, std::nullopt, false, 8.5f, 11.0f);
        expect(near(loose.height, 3.0f));
    };

    "natural size is capped to the panel"_test = [] {
        auto capped = computeImageSize(10.0f, 5.0f, std::nullopt, std::nullopt, true, 4.0f, 4.0f);
        expect(near(capped.width, 4.0f));
        expect(near(capped.height, 2.0f));

        auto stretched = computeImageSize(10.0f, 5.0f, std::nullopt, std::nullopt, false, 4.0f, 4.0f);
        expect(near(stretched.width, 4.0f));
        expect(near(stretched.height, 4.0f));

        auto small = computeImageSize(2.0f, 1.0f, std::nullopt, std::nullopt, true, 4.0f, 4.0f);
        expect(near(small.width, 2.0f));
        expect(near(small.height, 1.0f));
    };
};

suite card_render_tests = [] {
    "rectangle lands on page points"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        panel.shapeElements.push_back(filledRect(0.5f, 0.5f, 4.0f, 3.0f, colors::Red));

        auto report = renderer()->render(*surface, cardWith(panel));
        expect(report.has_value() >> fatal);
        expect(report->panelsRendered == 1_i);
        expect(report->elementsRendered == 1_i);
        expect(report->failures.empty());

        const auto& ops = surface->ops();
        expect((ops.size() >= 2_u) >> fatal);
        expect(ops.front().name == "beginPage"_b);
        expect(near(ops.front().args[0], 612.0f));
        expect(near(ops.front().args[1], 792.0f));
        expect(ops.back().name == "endPage"_b);

        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 1_u) >> fatal);
        Rect box = draws[0].path.bounds();
        expect(near(box.x, 36.0f));
        expect(near(box.y, 36.0f));
        expect(near(box.width, 288.0f));
        expect(near(box.height, 216.0f));
        expect(draws[0].fill);
        expect(draws[0].paint.fillColor == colors::Red);

        expect(surface->depth() == 0_i);
        expect(surface->unbalancedPops() == 0_i);
    };

    "elements draw by z index"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        panel.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Red, 5));
        panel.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Green, 1));
        panel.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Blue, 3));
        panel.textElements.push_back(textAt("Behind", 1, 1, 0));

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 3_u) >> fatal);
        expect(draws[0].paint.fillColor == colors::Green);
        expect(draws[1].paint.fillColor == colors::Blue);
        expect(draws[2].paint.fillColor == colors::Red);
        expect(indexOf(surface->ops(), "drawText") < indexOf(surface->ops(), "drawPath"));
    };

    "equal z keeps shapes before text"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        panel.textElements.push_back(textAt("Front", 1, 1, 2));
        panel.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Red, 2));

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        expect(indexOf(surface->ops(), "drawPath") < indexOf(surface->ops(), "drawText"));
    };

    "missing image is skipped and reported"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        panel.imageElements.push_back(imageAt("/nonexistent/ycard/photo.png", 1, 1));
        panel.textElements.push_back(textAt("Still here", 1, 5));

        auto report = renderer()->render(*surface, cardWith(panel));
        expect(report.has_value() >> fatal);
        expect(report->elementsRendered == 1_i);
        expect(report->elementsFailed == 1_i);
        expect((report->failures.size() == 1_u) >> fatal);
        const auto& failure = report->failures[0];
        expect(failure.panelId == "front"_b);
        expect(failure.elementId == "photo"_b);
        expect(failure.kind == "image"_b);
        expect(failure.message.find("Image file not found") != std::string::npos);

        expect(surface->opsNamed("drawImage").empty());
        auto texts = surface->opsNamed("drawText");
        expect((texts.size() == 1_u) >> fatal);
        expect(texts[0].text == "Still here"_b);
        expect(surface->depth() == 0_i);
        expect(surface->unbalancedPops() == 0_i);
    };

    "bad shape does not stop the panel"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        ShapeStyle style;
        style.id = "scribble";
        style.fillColor = colors::Red;
        panel.shapeElements.push_back(PathShape{style, "M 0 0 L 5", 1.0f});
        panel.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Blue, 1));

        auto report = renderer()->render(*surface, cardWith(panel));
        expect(report.has_value() >> fatal);
        expect((report->failures.size() == 1_u) >> fatal);
        expect(report->failures[0].kind == "svg_path"_b);
        expect(report->failures[0].elementId == "scribble"_b);
        expect(surface->opsNamed("drawPath").size() == 1_u);
        expect(surface->depth() == 0_i);
    };
};

suite card_decorative_tests = [] {
    "decorative without a library fails alone"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        auto ref = *DecorativeRef::create("wreath", 1.0f, 1.0f);
        ref.id = "w1";
        panel.shapeElements.push_back(ref);
        panel.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Red, 1));

        auto report = renderer()->render(*surface, cardWith(panel));
        expect(report.has_value() >> fatal);
        expect((report->failures.size() == 1_u) >> fatal);
        expect(report->failures[0].kind == "decorative_element"_b);
        expect(report->failures[0].elementId == "w1"_b);
        expect(report->failures[0].message == "No decorative library loaded for 'wreath'"_b);
        expect(surface->opsNamed("drawPath").size() == 1_u);
    };

    "decorative expands through the library"_test = [] {
        auto library = *DecorativeLibrary::create();
        expect(library->addDefinition(R"(
name: bauble
default_width: 1
default_height: 1
color_roles: {body: "#c0392b"}
shapes:
  - {type: circle, center_x: 0.5, center_y: 0.5, radius: 0.5, fill_color: "{body}"}
  - {type: rectangle, x: 0.4, y: 1.0, width: 0.2, height: 0.1, fill_color: "#c0c0c0"}
)").has_value() >> fatal);

        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        panel.shapeElements.push_back(*DecorativeRef::create("bauble", 2.0f, 2.0f, 2.0f));
        panel.shapeElements.push_back(*DecorativeRef::create("tinsel", 2.0f, 2.0f));

        auto report = renderer(false, true, library)->render(*surface, cardWith(panel));
        expect(report.has_value() >> fatal);
        expect(report->elementsRendered == 1_i);
        expect((report->failures.size() == 1_u) >> fatal);
        expect(report->failures[0].message.find("not found in library") != std::string::npos);

        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 2_u) >> fatal);
        Rect ball = draws[0].path.bounds();
        // centre (3, 3) in, radius 1 in
        expect(near(ball.x, 144.0f, 0.5f));
        expect(near(ball.width, 144.0f, 0.5f));
        expect(draws[0].paint.fillColor == *Color::fromHex("#c0392b"));
    };
};

suite card_image_tests = [] {
    "images clamp into the safe area"_test = [] {
        auto dir = ycard::test::scratchDir("card-image-clamp");
        auto png = dir / "square.png";
        ycard::test::writePngHeader(png, 144, 144);  // 2 x 2 in at 72 dpi

        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        panel.imageElements.push_back(imageAt(png.string(), 0.0f, 10.5f));

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        auto images = surface->opsNamed("drawImage");
        expect((images.size() == 1_u) >> fatal);
        expect(near(images[0].args[0], 18.0f));
        expect(near(images[0].args[1], 792.0f - 18.0f - 144.0f));
        expect(near(images[0].args[2], 144.0f));
        expect(near(images[0].args[3], 144.0f));

        auto loose = ycard::test::fixedSurface();
        expect(renderer(false, false)->render(*loose, cardWith(panel)).has_value() >> fatal);
        auto unclamped = loose->opsNamed("drawImage");
        expect((unclamped.size() == 1_u) >> fatal);
        expect(near(unclamped[0].args[0], 0.0f));
        expect(near(unclamped[0].args[1], 756.0f));
    };

    "target width scales the natural size"_test = [] {
        auto dir = ycard::test::scratchDir("card-image-width");
        auto png = dir / "wide.png";
        ycard::test::writePngHeader(png, 400, 200);

        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        auto image = imageAt(png.string(), 1.0f, 1.0f);
        image.width = 1.0f;
        panel.imageElements.push_back(image);

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        auto images = surface->opsNamed("drawImage");
        expect((images.size() == 1_u) >> fatal);
        expect(near(images[0].args[2], 72.0f));
        expect(near(images[0].args[3], 36.0f));
    };

    "clip mask wraps the draw"_test = [] {
        auto dir = ycard::test::scratchDir("card-image-clip");
        auto png = dir / "face.png";
        ycard::test::writePngHeader(png, 144, 144);

        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        auto image = imageAt(png.string(), 1.0f, 1.0f);
        image.clipMask = *CircleClipMask::create(1.0f, 1.0f, 0.9f);
        image.opacity = 0.5f;
        panel.imageElements.push_back(image);

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        const auto& ops = surface->ops();
        size_t clip = indexOf(ops, "clipTo");
        size_t draw = indexOf(ops, "drawImage");
        expect((draw < ops.size()) >> fatal);
        expect(clip < draw);
        expect(ops[draw].paint.clipCount == 1_i);
        expect(near(ops[draw].paint.opacity, 0.5f));
        expect(surface->depth() == 0_i);
    };
};

suite card_text_tests = [] {
    "fitted text records its adjustment"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        auto text = textAt("Happy Days", 1.0f, 5.0f);
        text.width = 1.0f;
        text.fontSize = 24;
        panel.textElements.push_back(text);
        panel.textElements.push_back(textAt("Unbounded", 1.0f, 6.0f));

        auto report = renderer()->render(*surface, cardWith(panel));
        expect(report.has_value() >> fatal);
        expect((report->textAdjustments.size() == 1_u) >> fatal);
        expect(report->textAdjustments[0].panelId == "front"_b);
        expect(report->textAdjustments[0].result.finalFontSize == 14_i);

        auto fonts = surface->opsNamed("setFont");
        expect((fonts.size() == 2_u) >> fatal);
        expect(near(fonts[0].args[0], 14.0f));
        expect(fonts[0].text == "Helvetica"_b);
    };

    "wrapped lines step down by the line height"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        auto text = textAt("aaaa bbbb cccc dddd eeee ffff gggg hhhh", 1.0f, 5.0f);
        text.width = 1.0f;
        text.fontSize = 12;
        text.color = colors::Gold;
        panel.textElements.push_back(text);

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        auto lines = surface->opsNamed("drawText");
        expect((lines.size() == 4_u) >> fatal);
        for (size_t i = 0; i < lines.size(); i++) {
            expect(near(lines[i].args[0], 72.0f));
            expect(near(lines[i].args[1], 360.0f - static_cast<float>(i) * 14.4f));
            expect(lines[i].paint.fillColor == colors::Gold);
        }
    };

    "rotated text turns about its anchor"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        auto text = textAt("Tilted", 2.0f, 3.0f);
        text.rotation = 45.0f;
        panel.textElements.push_back(text);

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        auto rot = surface->opsNamed("rotateAbout");
        expect((rot.size() == 1_u) >> fatal);
        expect(near(rot[0].args[0], 144.0f));
        expect(near(rot[0].args[1], 216.0f));
        expect(near(rot[0].args[2], 45.0f));
    };
};

suite card_panel_tests = [] {
    "panel background, border and rotation"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel;
        panel.id = "inside";
        panel.width = 4.25f;
        panel.height = 5.5f;
        panel.rotation = 90.0f;
        panel.backgroundColor = colors::White;
        panel.border = *Border::create({BorderStyle::Dashed, 2.0f, colors::Red, 0.0f});

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        auto rot = surface->opsNamed("rotateAbout");
        expect((rot.size() == 1_u) >> fatal);
        expect(near(rot[0].args[0], 153.0f));
        expect(near(rot[0].args[1], 198.0f));

        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 2_u) >> fatal);
        expect(draws[0].fill && !draws[0].stroke);
        expect(draws[0].paint.fillColor == colors::White);
        expect(!draws[1].fill && draws[1].stroke);
        expect(draws[1].paint.dash == std::vector<float>{6.0f, 3.0f});
        expect(near(draws[1].paint.lineWidth, 2.0f));
        expect(draws[1].paint.strokeColor == colors::Red);
    };

    "rounded border uses curves"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel panel = fullPage();
        panel.border = *Border::create({BorderStyle::Dotted, 1.0f, colors::Black, 12.0f});

        expect(renderer()->render(*surface, cardWith(panel)).has_value() >> fatal);
        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 1_u) >> fatal);
        const auto& segs = draws[0].path.segments();
        expect(std::any_of(segs.begin(), segs.end(),
                           [](const PathSegment& s) { return s.type == SegmentType::CurveTo; }));
        expect(draws[0].paint.dash == std::vector<float>{1.0f, 2.0f});
    };

    "panels draw in order and each restores state"_test = [] {
        auto surface = ycard::test::fixedSurface();
        Panel front = fullPage("front");
        front.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Red));
        Panel back = fullPage("back");
        back.shapeElements.push_back(filledRect(1, 1, 1, 1, colors::Blue));
        Card card = cardWith(front);
        card.panels.push_back(back);

        auto report = renderer()->render(*surface, card);
        expect(report.has_value() >> fatal);
        expect(report->panelsRendered == 2_i);
        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 2_u) >> fatal);
        expect(draws[0].paint.fillColor == colors::Red);
        expect(draws[1].paint.fillColor == colors::Blue);
        expect(draws[0].depth == draws[1].depth);
        expect(surface->depth() == 0_i);
    };
};

suite fold_line_tests = [] {
    "half fold is one horizontal guide"_test = [] {
        auto surface = ycard::test::fixedSurface();
        renderer()->drawFoldLines(*surface, FoldType::HalfFold);
        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 1_u) >> fatal);
        const auto& segs = draws[0].path.segments();
        expect((segs.size() == 2_u) >> fatal);
        expect(segs[0].pts[0] == Point{0.0f, 396.0f});
        expect(segs[1].pts[0] == Point{612.0f, 396.0f});
        expect(!draws[0].fill && draws[0].stroke);
        expect(draws[0].paint.dash == std::vector<float>{3.0f, 3.0f});
        expect(near(draws[0].paint.lineWidth, 0.5f));
        expect(near(draws[0].paint.strokeColor.r, 0.7f));
        expect(surface->depth() == 0_i);
    };

    "quarter fold crosses the page"_test = [] {
        auto surface = ycard::test::fixedSurface();
        renderer()->drawFoldLines(*surface, FoldType::QuarterFold);
        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 1_u) >> fatal);
        const auto& segs = draws[0].path.segments();
        expect((segs.size() == 4_u) >> fatal);
        expect(segs[2].pts[0] == Point{306.0f, 0.0f});
        expect(segs[3].pts[0] == Point{306.0f, 792.0f});
    };

    "tri fold has two verticals"_test = [] {
        auto surface = ycard::test::fixedSurface();
        renderer()->drawFoldLines(*surface, FoldType::TriFold);
        auto draws = surface->opsNamed("drawPath");
        expect((draws.size() == 1_u) >> fatal);
        const auto& segs = draws[0].path.segments();
        expect((segs.size() == 4_u) >> fatal);
        expect(near(segs[0].pts[0].x, 204.0f));
        expect(near(segs[2].pts[0].x, 408.0f));
        expect(near(segs[3].pts[0].y, 792.0f));
    };

    "fold lines follow the option"_test = [] {
        auto with = ycard::test::fixedSurface();
        expect(renderer(true)->render(*with, cardWith(fullPage())).has_value() >> fatal);
        expect(with->opsNamed("drawPath").size() == 1_u);

        auto without = ycard::test::fixedSurface();
        expect(renderer(false)->render(*without, cardWith(fullPage())).has_value() >> fatal);
        expect(without->opsNamed("drawPath").empty());
    };

    "options come from config"_test = [] {
        auto dir = ycard::test::scratchDir("card-config");
        ::setenv("XDG_CONFIG_HOME", dir.c_str(), 1);
        YAML::Node overrides;
        overrides["rendering"]["fold-lines"] = false;
        auto config = Config::create("", overrides);
        expect(config.has_value() >> fatal);

        auto r = CardRenderer::create(*config, DecorativeLibrary::Ptr());
        expect(r.has_value() >> fatal);
        expect(!(*r)->options().foldLines);
        expect((*r)->options().clampImages);
    };
};
