#pragma once
#include "lp/device/Canvas.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lp {

// Opaque RGB image, alpha already composited over black.
struct Image {
  int width{0};
  int height{0};
  std::vector<std::uint8_t> rgb;

  bool empty() const { return width <= 0 || height <= 0; }
};

struct AnimatedImage {
  std::vector<Image> frames;
  std::vector<int> delaysMs; // one per frame
};

// Frames with no (or zero) delay play at this rate.
constexpr int kDefaultGifFrameDelayMs = 100;

// Still images (PNG, JPEG, BMP...). Returns false and sets `error` on
// failure.
bool loadImageFile(const std::string& path, Image& out, std::string& error);

bool decodeGif(const std::uint8_t* data, std::size_t len, AnimatedImage& out,
               std::string& error);
bool loadGifFile(const std::string& path, AnimatedImage& out, std::string& error);

// Shrinks `src` (box filter) to fit within maxW x maxH keeping the aspect
// ratio. Images that already fit are returned unchanged; nothing is scaled up.
Image fitWithin(const Image& src, int maxW, int maxH);

// Draws `img` centred on the canvas. Does not clear.
void blitCentered(Canvas& canvas, const Image& img);

} // namespace lp
