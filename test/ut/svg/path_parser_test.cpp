//=============================================================================
// SVG Path Parser Tests
//
// Tokenizing path data into commands with their parameter groups
//=============================================================================

#include <boost/ut.hpp>
#include "ycard/svg/path-parser.h"
#include "test-helpers.h"

using namespace boost::ut;
using namespace ycard;
using namespace ycard::svg;
using ycard::test::near;

suite path_parser_basic_tests = [] {
    "parses move line close"_test = [] {
        auto cmds = parsePath("M 10 20 L 30 40 Z");
        expect(cmds.has_value() >> fatal);
        expect(cmds->size() == 3_u);
        expect((*cmds)[0].letter == 'M');
        expect((*cmds)[0].params.size() == 2_u);
        expect(near((*cmds)[1].params[1], 40.0f));
        expect((*cmds)[2].letter == 'Z');
        expect((*cmds)[2].params.empty());
    };

    "relative letters"_test = [] {
        auto cmds = parsePath("m 1 1 l 2 2 z");
        expect(cmds.has_value() >> fatal);
        expect((*cmds)[1].relative());
        expect((*cmds)[1].absolute() == 'L');
        expect(!PathCommand{'C', {}}.relative());
    };

    "repeated groups stay in one command"_test = [] {
        auto cmds = parsePath("M 0 0 L 1 2 3 4 5 6");
        expect(cmds.has_value() >> fatal);
        expect(cmds->size() == 2_u);
        expect((*cmds)[1].params.size() == 6_u);
    };

    "separators commas and signs"_test = [] {
        auto cmds = parsePath("M10,20L-5-6");
        expect(cmds.has_value() >> fatal);
        expect(cmds->size() == 2_u);
        expect(near((*cmds)[1].params[0], -5.0f));
        expect(near((*cmds)[1].params[1], -6.0f));
    };

    "decimals and exponents"_test = [] {
        auto cmds = parsePath("M .5 1.25e1 L 2E-1 -.75");
        expect(cmds.has_value() >> fatal);
        expect(near((*cmds)[0].params[0], 0.5f));
        expect(near((*cmds)[0].params[1], 12.5f));
        expect(near((*cmds)[1].params[0], 0.2f));
        expect(near((*cmds)[1].params[1], -0.75f));
    };

    "every supported letter"_test = [] {
        auto cmds = parsePath("M 0 0 H 5 V 5 C 1 1 2 2 3 3 S 4 4 5 5 Q 1 1 2 2 T 3 3 A 1 1 0 0 1 4 4 Z");
        expect(cmds.has_value() >> fatal);
        expect(cmds->size() == 9_u);
        expect((*cmds)[7].letter == 'A');
        expect((*cmds)[7].params.size() == 7_u);
    };
};

suite path_parser_error_tests = [] {
    "empty input"_test = [] {
        expect(!parsePath("").has_value());
        expect(!parsePath("   \n").has_value());
    };

    "numbers before any command"_test = [] {
        auto res = parsePath("10 20 M 0 0");
        expect(!res.has_value());
        expect(error_msg(res).find("Expected command") != std::string::npos);
    };

    "incomplete parameter group"_test = [] {
        auto res = parsePath("M 0 0 L 10");
        expect(!res.has_value());
        expect(error_msg(res).find("expects 2 parameters") != std::string::npos);

        expect(!parsePath("M 0 0 C 1 2 3 4 5").has_value());
    };

    "command with no parameter groups is accepted"_test = [] {
        auto cmds = parsePath("M 0 0 L Z");
        expect(cmds.has_value() >> fatal);
        expect((cmds->size() == 3_u) >> fatal);
        expect((*cmds)[1].letter == 'L');
        expect((*cmds)[1].params.empty());
        expect((*cmds)[2].letter == 'Z');

        expect(parsePath("M").has_value());
    };

    "close takes no parameters"_test = [] {
        expect(!parsePath("M 0 0 Z 5").has_value());
    };

    "unknown letters are skipped with their numbers"_test = [] {
        auto cmds = parsePath("M 0 0 X 1 2 3 L 4 4");
        expect(cmds.has_value() >> fatal);
        expect(cmds->size() == 2_u);
        expect((*cmds)[1].letter == 'L');
    };

    "param counts"_test = [] {
        expect(PathParser::paramCount('c') == 6_i);
        expect(PathParser::paramCount('a') == 7_i);
        expect(PathParser::paramCount('x') == -1_i);
        expect(PathParser::isCommand('z'));
        expect(!PathParser::isCommand('x'));
    };
};
