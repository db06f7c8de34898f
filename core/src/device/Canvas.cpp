#include "lp/device/Canvas.hpp"

#include <algorithm>

namespace lp {

Canvas::Canvas(int width, int height)
    : width_(std::max(width, 0)), height_(std::max(height, 0)),
      pixels_(static_cast<std::size_t>(width_) * static_cast<std::size_t>(height_) * 3, 0) {}

void Canvas::setPixel(int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b) {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return;
  std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                     static_cast<std::size_t>(x)) * 3;
  pixels_[idx + 0] = r;
  pixels_[idx + 1] = g;
  pixels_[idx + 2] = b;
}

Rgb Canvas::pixel(int x, int y) const {
  if (x < 0 || y < 0 || x >= width_ || y >= height_) return Rgb{};
  std::size_t idx = (static_cast<std::size_t>(y) * static_cast<std::size_t>(width_) +
                     static_cast<std::size_t>(x)) * 3;
  return Rgb{pixels_[idx + 0], pixels_[idx + 1], pixels_[idx + 2]};
}

void Canvas::clear() {
  std::fill(pixels_.begin(), pixels_.end(), static_cast<std::uint8_t>(0));
}

void Canvas::fill(const Rgb& c) {
  for (std::size_t i = 0; i + 2 < pixels_.size(); i += 3) {
    pixels_[i + 0] = c.r;
    pixels_[i + 1] = c.g;
    pixels_[i + 2] = c.b;
  }
}

std::size_t Canvas::litPixelCount() const {
  std::size_t n = 0;
  for (std::size_t i = 0; i + 2 < pixels_.size(); i += 3) {
    if (pixels_[i] || pixels_[i + 1] || pixels_[i + 2]) n++;
  }
  return n;
}

} // namespace lp
