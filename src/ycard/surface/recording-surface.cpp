#include <ycard/recording-surface.h>
#include <ytrace/ytrace.hpp>
#include <fmt/format.h>

#define STB_IMAGE_IMPLEMENTATION
#define STBI_ONLY_PNG
#define STBI_ONLY_JPEG
#include <stb_image.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>

namespace ycard {

namespace {

//=============================================================================
// Image headers
//=============================================================================

uint32_t readBE32(const unsigned char* p) {
    return (uint32_t(p[0]) << 24) | (uint32_t(p[1]) << 16) | (uint32_t(p[2]) << 8) | uint32_t(p[3]);
}

uint16_t readBE16(const unsigned char* p) {
    return uint16_t((p[0] << 8) | p[1]);
}

bool isPng(const std::vector<unsigned char>& data) {
    static const unsigned char sig[8] = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    return data.size() >= 8 && std::equal(sig, sig + 8, data.begin());
}

bool isJpeg(const std::vector<unsigned char>& data) {
    return data.size() >= 3 && data[0] == 0xFF && data[1] == 0xD8 && data[2] == 0xFF;
}

// pHYs carries the density in pixels per meter when the unit byte is 1
void readPngDensity(const std::vector<unsigned char>& data, ImageInfo& info) {
    size_t pos = 8;
    while (pos + 8 <= data.size()) {
        uint32_t len = readBE32(&data[pos]);
        std::string type(data.begin() + pos + 4, data.begin() + pos + 8);
        if (type == "pHYs" && pos + 8 + 9 <= data.size()) {
            uint32_t ppmX = readBE32(&data[pos + 8]);
            uint32_t ppmY = readBE32(&data[pos + 12]);
            if (data[pos + 16] == 1 && ppmX > 0 && ppmY > 0) {
                info.dpiX = ppmX * 0.0254f;
                info.dpiY = ppmY * 0.0254f;
            }
            return;
        }
        if (type == "IDAT" || type == "IEND") return;
        pos += 12 + size_t(len);
    }
}

// JFIF APP0 density, units 1 = dots per inch, 2 = dots per cm
void readJfifDensity(const std::vector<unsigned char>& data, ImageInfo& info) {
    size_t pos = 2;
    // a segment body must start inside the buffer
    while (pos + 4 < data.size() && data[pos] == 0xFF) {
        unsigned char marker = data[pos + 1];
        if (marker == 0xFF) {
            pos++;
            continue;
        }
        uint16_t len = readBE16(&data[pos + 2]);
        const unsigned char* seg = &data[pos + 4];
        size_t segLen = len >= 2 ? len - 2 : 0;
        if (pos + 4 + segLen > data.size()) return;

        if (marker == 0xE0 && segLen >= 12 && std::string(seg, seg + 4) == "JFIF") {
            unsigned char units = seg[7];
            uint16_t dx = readBE16(seg + 8);
            uint16_t dy = readBE16(seg + 10);
            if (dx == 0 || dy == 0) return;
            if (units == 1) {
                info.dpiX = dx;
                info.dpiY = dy;
            } else if (units == 2) {
                info.dpiX = dx * 2.54f;
                info.dpiY = dy * 2.54f;
            }
            return;
        }
        if (marker == 0xDA) return;
        pos += 2 + len;
    }
}

//=============================================================================
// Text metrics
//=============================================================================

float charAdvance(char c) {
    static const std::string narrow = "iljtfrI.,;:'!|()[]`";
    static const std::string wide = "mwMW@%";
    if (c == ' ') return 0.278f;
    if (narrow.find(c) != std::string::npos) return 0.3f;
    if (wide.find(c) != std::string::npos) return 0.85f;
    if (c >= 'A' && c <= 'Z') return 0.67f;
    if (c >= '0' && c <= '9') return 0.556f;
    return 0.5f;
}

std::string formatArgs(const std::vector<float>& args) {
    std::string out;
    for (size_t i = 0; i < args.size(); i++) {
        if (i > 0) out += ' ';
        out += fmt::format("{:.2f}", args[i]);
    }
    return out;
}

} // namespace

std::string RecordedOp::describe() const {
    std::string out(static_cast<size_t>(depth) * 2, ' ');
    out += name;
    if (!args.empty()) {
        out += ' ';
        out += formatArgs(args);
    }
    if (!text.empty()) {
        out += fmt::format(" \"{}\"", text);
    }
    if (name == "drawPath" || name == "clipTo") {
        Rect b = path.bounds();
        out += fmt::format(" segments={} bounds=({:.2f},{:.2f} {:.2f}x{:.2f})",
                           path.size(), b.x, b.y, b.width, b.height);
    }
    if (name == "drawPath") {
        if (fill) out += " fill=" + paint.fillColor.toHex();
        if (stroke) out += fmt::format(" stroke={} width={:.2f}", paint.strokeColor.toHex(), paint.lineWidth);
        if (paint.opacity < 1.0f) out += fmt::format(" alpha={:.2f}", paint.opacity);
    }
    if (!stops.empty()) {
        out += " stops=";
        for (size_t i = 0; i < stops.size(); i++) {
            if (i > 0) out += ',';
            out += fmt::format("{:.2f}:{}", stops[i].position, stops[i].color.toHex());
        }
    }
    return out;
}

//=============================================================================
// RecordingSurfaceImpl
//=============================================================================
class RecordingSurfaceImpl : public RecordingSurface {
public:
    explicit RecordingSurfaceImpl(Options options) : _options(std::move(options)) {}

    ~RecordingSurfaceImpl() override = default;

    Result<void> init() {
        _states.push_back(PaintState{});
        return Ok();
    }

    // =========================================================================
    // Pages
    // =========================================================================
    void beginPage(float width, float height) override {
        record("beginPage", {width, height});
    }

    void endPage() override {
        if (_states.size() > 1) {
            ywarn("endPage with {} unrestored states", _states.size() - 1);
        }
        record("endPage", {});
    }

    // =========================================================================
    // Paint state
    // =========================================================================
    void setFillColor(const Color& color) override {
        state().fillColor = color;
        record("setFillColor", {color.r, color.g, color.b});
    }

    void setStrokeColor(const Color& color) override {
        state().strokeColor = color;
        record("setStrokeColor", {color.r, color.g, color.b});
    }

    void setLineWidth(float width) override {
        state().lineWidth = width;
        record("setLineWidth", {width});
    }

    void setDash(const std::vector<float>& pattern) override {
        state().dash = pattern;
        record("setDash", pattern);
    }

    void setOpacity(float alpha) override {
        state().opacity = alpha;
        record("setOpacity", {alpha});
    }

    // =========================================================================
    // State stack and transforms
    // =========================================================================
    void pushState() override {
        record("pushState", {});
        _states.push_back(state());
        _maxDepth = std::max(_maxDepth, depth());
    }

    void popState() override {
        if (_states.size() <= 1) {
            _unbalancedPops++;
            ywarn("popState without matching pushState");
            return;
        }
        _states.pop_back();
        record("popState", {});
    }

    void translate(float dx, float dy) override {
        record("translate", {dx, dy});
    }

    void rotateAbout(float cx, float cy, float degrees) override {
        record("rotateAbout", {cx, cy, degrees});
    }

    // =========================================================================
    // Paths
    // =========================================================================
    void drawPath(const Path& path, bool fill, bool stroke) override {
        RecordedOp op = makeOp("drawPath", {});
        op.path = path;
        op.fill = fill;
        op.stroke = stroke;
        _ops.push_back(std::move(op));
    }

    void clipTo(const Path& path) override {
        state().clipCount++;
        RecordedOp op = makeOp("clipTo", {});
        op.path = path;
        _ops.push_back(std::move(op));
    }

    // =========================================================================
    // Images
    // =========================================================================
    Result<ImageInfo> imageInfo(const std::string& path) override {
        std::error_code ec;
        if (!std::filesystem::exists(path, ec)) {
            return Err<ImageInfo>("Image file not found: " + path);
        }
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return Err<ImageInfo>("Cannot open image file: " + path);
        }
        std::vector<unsigned char> data((std::istreambuf_iterator<char>(file)),
                                        std::istreambuf_iterator<char>());

        if (!isPng(data) && !isJpeg(data)) {
            return Err<ImageInfo>("Cannot read image '" + path + "': Unsupported image format");
        }
        // Header scan only, no pixels are decoded
        int width = 0, height = 0, channels = 0;
        if (!stbi_info_from_memory(data.data(), static_cast<int>(data.size()), &width, &height, &channels)) {
            return Err<ImageInfo>(fmt::format("Cannot read image '{}': {}", path, stbi_failure_reason()));
        }

        ImageInfo info;
        info.pixelWidth = static_cast<uint32_t>(width);
        info.pixelHeight = static_cast<uint32_t>(height);
        if (isPng(data)) {
            readPngDensity(data, info);
        } else {
            readJfifDensity(data, info);
        }
        ydebug("Image {}: {}x{} px at {}x{} dpi", path, width, height, info.dpiX, info.dpiY);
        return Ok(info);
    }

    Result<void> drawImage(const std::string& path, float x, float y,
                           float width, float height, bool preserveAspect) override {
        if (auto res = imageInfo(path); !res) {
            return Err("Failed to draw image", res);
        }
        RecordedOp op = makeOp("drawImage", {x, y, width, height, preserveAspect ? 1.0f : 0.0f});
        op.text = path;
        _ops.push_back(std::move(op));
        return Ok();
    }

    // =========================================================================
    // Text
    // =========================================================================
    float measureTextWidth(const std::string& text, const std::string& fontName,
                           float fontSize) const override {
        if (_options.fixedAdvance) {
            return static_cast<float>(text.size()) * *_options.fixedAdvance * fontSize;
        }
        bool mono = fontName.rfind("Courier", 0) == 0;
        float bold = fontName.find("Bold") != std::string::npos ? 1.05f : 1.0f;
        float width = 0.0f;
        for (char c : text) {
            width += mono ? 0.6f : charAdvance(c) * bold;
        }
        return width * fontSize;
    }

    void setFont(const std::string& fontName, float size) override {
        state().fontName = fontName;
        state().fontSize = size;
        RecordedOp op = makeOp("setFont", {size});
        op.text = fontName;
        _ops.push_back(std::move(op));
    }

    void drawText(const std::string& text, float x, float y, TextAlignment alignment) override {
        RecordedOp op = makeOp("drawText", {x, y});
        op.text = text;
        op.alignment = alignment;
        _ops.push_back(std::move(op));
    }

    // =========================================================================
    // Gradients
    // =========================================================================
    bool supportsGradients() const override { return _options.nativeGradients; }

    Result<void> linearGradient(const Point& start, const Point& end,
                                const std::vector<ColorStop>& stops) override {
        if (!_options.nativeGradients) {
            return Err("Surface has no native gradients");
        }
        if (stops.size() < 2) {
            return Err("Gradient needs at least 2 stops");
        }
        RecordedOp op = makeOp("linearGradient", {start.x, start.y, end.x, end.y});
        op.stops = stops;
        _ops.push_back(std::move(op));
        return Ok();
    }

    Result<void> radialGradient(const Point& center, float radius,
                                const std::vector<ColorStop>& stops) override {
        if (!_options.nativeGradients) {
            return Err("Surface has no native gradients");
        }
        if (stops.size() < 2) {
            return Err("Gradient needs at least 2 stops");
        }
        if (radius <= 0.0f) {
            return Err(fmt::format("Radial gradient radius must be > 0, got {}", radius));
        }
        RecordedOp op = makeOp("radialGradient", {center.x, center.y, radius});
        op.stops = stops;
        _ops.push_back(std::move(op));
        return Ok();
    }

    // =========================================================================
    // Tiles
    // =========================================================================
    bool supportsTiles() const override { return _options.nativeTiles; }

    Result<void> beginTile(const std::string& name, float size) override {
        if (!_options.nativeTiles) {
            return Err("Surface has no native tiles");
        }
        if (!_openTile.empty()) {
            return Err("Tile '" + _openTile + "' is still open");
        }
        if (size <= 0.0f) {
            return Err(fmt::format("Tile size must be > 0, got {}", size));
        }
        _openTile = name;
        RecordedOp op = makeOp("beginTile", {size});
        op.text = name;
        _ops.push_back(std::move(op));
        return Ok();
    }

    Result<void> endTile() override {
        if (_openTile.empty()) {
            return Err("endTile without beginTile");
        }
        _tiles.push_back(_openTile);
        RecordedOp op = makeOp("endTile", {});
        op.text = _openTile;
        _ops.push_back(std::move(op));
        _openTile.clear();
        return Ok();
    }

    Result<void> stampTile(const std::string& name, float x, float y) override {
        if (std::find(_tiles.begin(), _tiles.end(), name) == _tiles.end()) {
            return Err("Unknown tile: " + name);
        }
        RecordedOp op = makeOp("stampTile", {x, y});
        op.text = name;
        _ops.push_back(std::move(op));
        return Ok();
    }

    // =========================================================================
    // Inspection
    // =========================================================================
    const std::vector<RecordedOp>& ops() const override { return _ops; }

    std::vector<RecordedOp> opsNamed(const std::string& name) const override {
        std::vector<RecordedOp> out;
        std::copy_if(_ops.begin(), _ops.end(), std::back_inserter(out),
                     [&](const RecordedOp& op) { return op.name == name; });
        return out;
    }

    void clear() override {
        _ops.clear();
        _states.resize(1);
        _states[0] = PaintState{};
        _maxDepth = 0;
        _unbalancedPops = 0;
        _tiles.clear();
        _openTile.clear();
    }

    int depth() const override { return static_cast<int>(_states.size()) - 1; }
    int maxDepth() const override { return _maxDepth; }
    int unbalancedPops() const override { return _unbalancedPops; }

    std::string dump() const override {
        std::string out;
        for (const auto& op : _ops) {
            out += op.describe();
            out += '\n';
        }
        return out;
    }

private:
    PaintState& state() { return _states.back(); }

    RecordedOp makeOp(const char* name, std::vector<float> args) const {
        RecordedOp op;
        op.name = name;
        op.args = std::move(args);
        op.paint = _states.back();
        op.depth = depth();
        return op;
    }

    void record(const char* name, std::vector<float> args) {
        _ops.push_back(makeOp(name, std::move(args)));
    }

    Options _options;
    std::vector<RecordedOp> _ops;
    std::vector<PaintState> _states;
    int _maxDepth = 0;
    int _unbalancedPops = 0;
    std::vector<std::string> _tiles;
    std::string _openTile;
};

Result<RecordingSurface::Ptr> RecordingSurface::createImpl(ContextType& ctx, Options options) noexcept {
    (void)ctx;
    auto impl = std::make_shared<RecordingSurfaceImpl>(std::move(options));
    if (auto res = impl->init(); !res) {
        return Err<Ptr>("Failed to initialize RecordingSurface", res);
    }
    return Ok<Ptr>(impl);
}

Result<RecordingSurface::Ptr> RecordingSurface::createImpl(ContextType& ctx) noexcept {
    return createImpl(ctx, Options{});
}

} // namespace ycard
