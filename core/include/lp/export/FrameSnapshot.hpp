#pragma once
#include "lp/device/Canvas.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace lp {

// PNG encoding of a panel frame (RGB, 8 bits per channel). Uses stored
// deflate blocks, so no zlib/libpng dependency.
std::vector<std::uint8_t> encodeCanvasPNG(const Canvas& canvas);

bool writeCanvasPNG(const std::string& path, const Canvas& canvas);

// Binary PPM (P6).
bool writeCanvasPPM(const std::string& path, const Canvas& canvas);

} // namespace lp
