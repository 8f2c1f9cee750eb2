#include "path-builder.h"
#include <ytrace/ytrace.hpp>

namespace ycard::render {

namespace {

enum class LastCurve {
    None,
    Cubic,
    Quadratic,
};

class PathInterpreter {
public:
    explicit PathInterpreter(const PathMapping& mapping) : _mapping(mapping) {}

    Result<void> apply(const svg::PathCommand& cmd) {
        const bool rel = cmd.relative();
        const auto& p = cmd.params;

        switch (cmd.absolute()) {
            case 'M':
                for (size_t i = 0; i + 1 < p.size(); i += 2) {
                    Point pt = target(rel, p[i], p[i + 1]);
                    if (i == 0) {
                        _cur = _start = pt;
                        emitMove(pt);
                    } else {
                        // extra pairs after a move are implicit line-tos
                        lineTo(pt);
                    }
                }
                _last = LastCurve::None;
                return Ok();

            case 'L':
                for (size_t i = 0; i + 1 < p.size(); i += 2) {
                    lineTo(target(rel, p[i], p[i + 1]));
                }
                _last = LastCurve::None;
                return Ok();

            case 'H':
                for (float v : p) {
                    lineTo({rel ? _cur.x + v : v, _cur.y});
                }
                _last = LastCurve::None;
                return Ok();

            case 'V':
                for (float v : p) {
                    lineTo({_cur.x, rel ? _cur.y + v : v});
                }
                _last = LastCurve::None;
                return Ok();

            case 'C':
                for (size_t i = 0; i + 5 < p.size(); i += 6) {
                    Point c1 = target(rel, p[i], p[i + 1]);
                    Point c2 = target(rel, p[i + 2], p[i + 3]);
                    Point end = target(rel, p[i + 4], p[i + 5]);
                    cubicTo(c1, c2, end);
                    _ctrl = c2;
                    _last = LastCurve::Cubic;
                }
                return Ok();

            case 'S':
                for (size_t i = 0; i + 3 < p.size(); i += 4) {
                    Point c1 = _last == LastCurve::Cubic ? reflect(_ctrl) : _cur;
                    Point c2 = target(rel, p[i], p[i + 1]);
                    Point end = target(rel, p[i + 2], p[i + 3]);
                    cubicTo(c1, c2, end);
                    _ctrl = c2;
                    _last = LastCurve::Cubic;
                }
                return Ok();

            case 'Q':
                for (size_t i = 0; i + 3 < p.size(); i += 4) {
                    Point ctrl = target(rel, p[i], p[i + 1]);
                    Point end = target(rel, p[i + 2], p[i + 3]);
                    quadTo(ctrl, end);
                }
                return Ok();

            case 'T':
                for (size_t i = 0; i + 1 < p.size(); i += 2) {
                    Point ctrl = _last == LastCurve::Quadratic ? reflect(_ctrl) : _cur;
                    Point end = target(rel, p[i], p[i + 1]);
                    quadTo(ctrl, end);
                }
                return Ok();

            case 'A':
                for (size_t i = 0; i + 6 < p.size(); i += 7) {
                    Point end = target(rel, p[i + 5], p[i + 6]);
                    ydebug("Arc approximated as line: rx={} ry={} rot={} large={} sweep={} -> ({}, {})",
                           p[i], p[i + 1], p[i + 2], p[i + 3], p[i + 4], end.x, end.y);
                    lineTo(end);
                }
                _last = LastCurve::None;
                return Ok();

            case 'Z':
                if (_started) {
                    _path.close();
                }
                _cur = _start;
                _last = LastCurve::None;
                return Ok();
        }
        return Err(std::string("Unsupported SVG command: ") + cmd.letter);
    }

    Path take() { return std::move(_path); }

private:
    Point target(bool rel, float x, float y) const {
        return rel ? Point{_cur.x + x, _cur.y + y} : Point{x, y};
    }

    Point reflect(const Point& ctrl) const {
        return {2 * _cur.x - ctrl.x, 2 * _cur.y - ctrl.y};
    }

    void emitMove(const Point& pt) {
        Point out = _mapping.map(pt);
        _path.moveTo(out.x, out.y);
        _started = true;
    }

    void ensureStarted() {
        if (!_started) emitMove(_cur);
    }

    void lineTo(const Point& pt) {
        ensureStarted();
        Point out = _mapping.map(pt);
        _path.lineTo(out.x, out.y);
        _cur = pt;
    }

    void cubicTo(const Point& c1, const Point& c2, const Point& end) {
        ensureStarted();
        Point a = _mapping.map(c1);
        Point b = _mapping.map(c2);
        Point e = _mapping.map(end);
        _path.curveTo(a.x, a.y, b.x, b.y, e.x, e.y);
        _cur = end;
    }

    void quadTo(const Point& ctrl, const Point& end) {
        CubicControls cc = elevateQuadratic(_cur, ctrl, end);
        cubicTo(cc.cp1, cc.cp2, end);
        _ctrl = ctrl;
        _last = LastCurve::Quadratic;
    }

    PathMapping _mapping;
    Path _path;
    Point _cur;
    Point _start;
    Point _ctrl;
    LastCurve _last = LastCurve::None;
    bool _started = false;
};

} // namespace

Result<Path> buildPath(const std::vector<svg::PathCommand>& commands, const PathMapping& mapping) {
    if (commands.empty()) {
        return Err<Path>("SVG path has no commands");
    }
    PathInterpreter interp(mapping);
    for (const auto& cmd : commands) {
        if (auto res = interp.apply(cmd); !res) {
            return Err<Path>("Failed to build path", res);
        }
    }
    Path path = interp.take();
    if (path.empty()) {
        return Err<Path>("SVG path has no drawable segments");
    }
    return Ok(std::move(path));
}

Result<Path> buildPath(const std::string& pathData, const PathMapping& mapping) {
    auto commands = svg::parsePath(pathData);
    if (!commands) {
        return Err<Path>("Failed to parse SVG path", commands);
    }
    return buildPath(*commands, mapping);
}

} // namespace ycard::render
