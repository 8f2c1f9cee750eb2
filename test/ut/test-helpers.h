#pragma once

//=============================================================================
// Shared helpers for the ycard unit tests
//=============================================================================

#include <ycard/recording-surface.h>
#include <cmath>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace ycard::test {

inline bool near(float a, float b, float eps = 1e-3f) {
    return std::fabs(a - b) <= eps;
}

// Fresh scratch directory under the system temp dir
inline std::filesystem::path scratchDir(const std::string& name) {
    auto dir = std::filesystem::temp_directory_path() / "ycard-test" / name;
    std::filesystem::remove_all(dir);
    std::filesystem::create_directories(dir);
    return dir;
}

inline void writeFile(const std::filesystem::path& path, const std::string& content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out << content;
}

// Header-only PNG: signature, IHDR and an optional pHYs chunk. Enough for
// surfaces that only read the size; CRCs are left zero.
inline void writePngHeader(const std::filesystem::path& path, uint32_t width, uint32_t height,
                           uint32_t pixelsPerMeter = 0) {
    std::vector<unsigned char> bytes = {0x89, 'P', 'N', 'G', 0x0D, 0x0A, 0x1A, 0x0A};
    auto be32 = [&](uint32_t v) {
        bytes.push_back(static_cast<unsigned char>(v >> 24));
        bytes.push_back(static_cast<unsigned char>(v >> 16));
        bytes.push_back(static_cast<unsigned char>(v >> 8));
        bytes.push_back(static_cast<unsigned char>(v));
    };
    auto tag = [&](const char* t) { bytes.insert(bytes.end(), t, t + 4); };

    be32(13);
    tag("IHDR");
    be32(width);
    be32(height);
    bytes.insert(bytes.end(), {8, 2, 0, 0, 0});
    be32(0);

    if (pixelsPerMeter > 0) {
        be32(9);
        tag("pHYs");
        be32(pixelsPerMeter);
        be32(pixelsPerMeter);
        bytes.push_back(1);
        be32(0);
    }

    be32(0);
    tag("IEND");
    be32(0);

    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary);
    out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
}

// Surface with every character the same advance: "n" characters at
// size s measure n * s * advance points
inline RecordingSurface::Ptr fixedSurface(float advance = 0.5f) {
    RecordingSurface::Options options;
    options.fixedAdvance = advance;
    return *RecordingSurface::create(options);
}

} // namespace ycard::test
