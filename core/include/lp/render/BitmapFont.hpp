#pragma once
#include "lp/device/Canvas.hpp"
#include "lp/render/Rgb.hpp"

#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace lp {

// 1-bit text for the LED panel. Glyphs are rasterized from a TTF once at
// load time (ASCII 32..126) and thresholded, since a panel pixel is either
// on or off. Read-only after load, so render threads may share one
// instance.
class BitmapFont {
public:
  BitmapFont() = default;

  bool loadFont(const std::uint8_t* data, std::uint32_t len, int pixelHeight);
  bool loadFontFile(const std::string& path, int pixelHeight);

  bool isLoaded() const { return loaded_; }
  int pixelHeight() const { return pixelHeight_; }

  // Coverage (0..255) at or above which a pixel is lit.
  void setThreshold(std::uint8_t t) { threshold_ = t; }

  int textWidth(const std::string& text) const;

  // `baselineY` is the text baseline. Returns the advance in pixels.
  // Draws nothing when no font is loaded.
  int drawText(Canvas& canvas, int x, int baselineY, const Rgb& color,
               const std::string& text) const;

  // Horizontally centred on `centerX`.
  void drawTextCentered(Canvas& canvas, int centerX, int baselineY, const Rgb& color,
                        const std::string& text) const;

private:
  struct Glyph {
    int advance{0};
    int xoff{0};
    int yoff{0};
    int w{0};
    int h{0};
    std::vector<std::uint8_t> coverage;
  };

  bool rasterizeAscii();

  std::vector<std::uint8_t> fontData_;
  std::unordered_map<std::uint32_t, Glyph> glyphs_;
  int pixelHeight_{10};
  int fallbackAdvance_{6};
  std::uint8_t threshold_{110};
  bool loaded_{false};
};

} // namespace lp
