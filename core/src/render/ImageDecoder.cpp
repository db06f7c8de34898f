#include "lp/render/ImageDecoder.hpp"

#define STB_IMAGE_IMPLEMENTATION
#define STB_IMAGE_STATIC
#include "stb_image.h"
#undef STB_IMAGE_IMPLEMENTATION
#undef STB_IMAGE_STATIC

#include <algorithm>
#include <cstdio>

namespace lp {

namespace {

// RGBA -> RGB over black.
Image fromRgba(const std::uint8_t* rgba, int w, int h) {
  Image img;
  img.width = w;
  img.height = h;
  img.rgb.resize(static_cast<std::size_t>(w) * h * 3);
  const std::size_t n = static_cast<std::size_t>(w) * h;
  for (std::size_t i = 0; i < n; i++) {
    const std::uint8_t a = rgba[i * 4 + 3];
    for (int c = 0; c < 3; c++) {
      img.rgb[i * 3 + c] = static_cast<std::uint8_t>(rgba[i * 4 + c] * a / 255);
    }
  }
  return img;
}

bool readWholeFile(const std::string& path, std::vector<std::uint8_t>& out) {
  std::FILE* f = std::fopen(path.c_str(), "rb");
  if (!f) return false;
  std::fseek(f, 0, SEEK_END);
  long len = std::ftell(f);
  std::fseek(f, 0, SEEK_SET);
  if (len <= 0) {
    std::fclose(f);
    return false;
  }
  out.resize(static_cast<std::size_t>(len));
  std::size_t got = std::fread(out.data(), 1, out.size(), f);
  std::fclose(f);
  return got == out.size();
}

} // anonymous namespace

bool loadImageFile(const std::string& path, Image& out, std::string& error) {
  int w = 0, h = 0, channels = 0;
  unsigned char* data = stbi_load(path.c_str(), &w, &h, &channels, 4);
  if (!data) {
    error = "failed to load image " + path + ": " + stbi_failure_reason();
    return false;
  }
  out = fromRgba(data, w, h);
  stbi_image_free(data);
  return true;
}

bool decodeGif(const std::uint8_t* data, std::size_t len, AnimatedImage& out,
               std::string& error) {
  int* delays = nullptr;
  int w = 0, h = 0, frames = 0, comp = 0;
  unsigned char* pixels = stbi_load_gif_from_memory(
      data, static_cast<int>(len), &delays, &w, &h, &frames, &comp, 4);
  if (!pixels) {
    error = std::string("failed to decode gif: ") + stbi_failure_reason();
    return false;
  }

  out.frames.clear();
  out.delaysMs.clear();
  const std::size_t frameBytes = static_cast<std::size_t>(w) * h * 4;
  for (int i = 0; i < frames; i++) {
    out.frames.push_back(fromRgba(pixels + frameBytes * i, w, h));
    int d = delays ? delays[i] : 0;
    out.delaysMs.push_back(d > 0 ? d : kDefaultGifFrameDelayMs);
  }

  stbi_image_free(pixels);
  if (delays) stbi_image_free(delays);

  if (out.frames.empty()) {
    error = "gif has no frames";
    return false;
  }
  return true;
}

bool loadGifFile(const std::string& path, AnimatedImage& out, std::string& error) {
  std::vector<std::uint8_t> bytes;
  if (!readWholeFile(path, bytes)) {
    error = "GIF not found: " + path;
    return false;
  }
  if (!decodeGif(bytes.data(), bytes.size(), out, error)) {
    error += " (" + path + ")";
    return false;
  }
  return true;
}

Image fitWithin(const Image& src, int maxW, int maxH) {
  if (src.empty() || (src.width <= maxW && src.height <= maxH)) return src;

  const double scale = std::min(static_cast<double>(maxW) / src.width,
                                static_cast<double>(maxH) / src.height);
  Image dst;
  dst.width = std::max(1, static_cast<int>(src.width * scale));
  dst.height = std::max(1, static_cast<int>(src.height * scale));
  dst.rgb.resize(static_cast<std::size_t>(dst.width) * dst.height * 3);

  for (int dy = 0; dy < dst.height; dy++) {
    const int sy0 = dy * src.height / dst.height;
    const int sy1 = std::max(sy0 + 1, (dy + 1) * src.height / dst.height);
    for (int dx = 0; dx < dst.width; dx++) {
      const int sx0 = dx * src.width / dst.width;
      const int sx1 = std::max(sx0 + 1, (dx + 1) * src.width / dst.width);

      unsigned sum[3] = {0, 0, 0};
      unsigned count = 0;
      for (int sy = sy0; sy < sy1; sy++) {
        for (int sx = sx0; sx < sx1; sx++) {
          const std::size_t si = (static_cast<std::size_t>(sy) * src.width + sx) * 3;
          sum[0] += src.rgb[si];
          sum[1] += src.rgb[si + 1];
          sum[2] += src.rgb[si + 2];
          count++;
        }
      }
      const std::size_t di = (static_cast<std::size_t>(dy) * dst.width + dx) * 3;
      for (int c = 0; c < 3; c++) {
        dst.rgb[di + c] = static_cast<std::uint8_t>(sum[c] / count);
      }
    }
  }
  return dst;
}

void blitCentered(Canvas& canvas, const Image& img) {
  if (img.empty()) return;
  const int ox = (canvas.width() - img.width) / 2;
  const int oy = (canvas.height() - img.height) / 2;
  for (int y = 0; y < img.height; y++) {
    for (int x = 0; x < img.width; x++) {
      const std::size_t i = (static_cast<std::size_t>(y) * img.width + x) * 3;
      canvas.setPixel(ox + x, oy + y, img.rgb[i], img.rgb[i + 1], img.rgb[i + 2]);
    }
  }
}

} // namespace lp
