#pragma once
#include "lp/render/Rgb.hpp"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace lp {

// Off-screen RGB frame. Drawing code writes here; a FrameDevice presents
// it on swap(). Out-of-range writes are ignored.
class Canvas {
public:
  Canvas(int width, int height);

  int width() const { return width_; }
  int height() const { return height_; }

  void setPixel(int x, int y, std::uint8_t r, std::uint8_t g, std::uint8_t b);
  void setPixel(int x, int y, const Rgb& c) { setPixel(x, y, c.r, c.g, c.b); }

  // Black for out-of-range coordinates.
  Rgb pixel(int x, int y) const;

  void clear();
  void fill(const Rgb& c);

  // Row-major RGB, width*height*3 bytes.
  const std::uint8_t* data() const { return pixels_.data(); }
  std::size_t sizeBytes() const { return pixels_.size(); }

  std::size_t litPixelCount() const;

private:
  int width_;
  int height_;
  std::vector<std::uint8_t> pixels_;
};

} // namespace lp
