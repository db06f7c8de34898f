#include "lp/render/BitmapFont.hpp"

#include "lp/debug/Log.hpp"

#include <cmath>
#include <fstream>
#include <utility>

#define STB_TRUETYPE_IMPLEMENTATION
#include "stb_truetype.h"

namespace lp {

bool BitmapFont::loadFont(const std::uint8_t* data, std::uint32_t len, int pixelHeight) {
  fontData_.assign(data, data + len);
  pixelHeight_ = pixelHeight;
  loaded_ = rasterizeAscii();
  return loaded_;
}

bool BitmapFont::loadFontFile(const std::string& path, int pixelHeight) {
  std::ifstream f(path, std::ios::binary | std::ios::ate);
  if (!f) return false;
  auto sz = f.tellg();
  if (sz <= 0) return false;
  fontData_.resize(static_cast<std::size_t>(sz));
  f.seekg(0);
  f.read(reinterpret_cast<char*>(fontData_.data()), sz);
  if (!f) return false;
  pixelHeight_ = pixelHeight;
  loaded_ = rasterizeAscii();
  return loaded_;
}

bool BitmapFont::rasterizeAscii() {
  glyphs_.clear();

  stbtt_fontinfo font;
  if (!stbtt_InitFont(&font, fontData_.data(),
                      stbtt_GetFontOffsetForIndex(fontData_.data(), 0))) {
    logError("Font", "stbtt_InitFont failed");
    return false;
  }

  float scale = stbtt_ScaleForPixelHeight(&font, static_cast<float>(pixelHeight_));

  for (std::uint32_t cp = 32; cp <= 126; cp++) {
    int glyphIdx = stbtt_FindGlyphIndex(&font, static_cast<int>(cp));

    int advW = 0, lsb = 0;
    stbtt_GetGlyphHMetrics(&font, glyphIdx, &advW, &lsb);

    int ix0, iy0, ix1, iy1;
    stbtt_GetGlyphBitmapBox(&font, glyphIdx, scale, scale, &ix0, &iy0, &ix1, &iy1);

    Glyph g;
    g.advance = static_cast<int>(std::lround(static_cast<float>(advW) * scale));
    g.xoff = ix0;
    g.yoff = iy0;
    g.w = ix1 - ix0;
    g.h = iy1 - iy0;
    if (g.w > 0 && g.h > 0) {
      g.coverage.assign(static_cast<std::size_t>(g.w) * static_cast<std::size_t>(g.h), 0);
      stbtt_MakeGlyphBitmap(&font, g.coverage.data(), g.w, g.h, g.w, scale, scale, glyphIdx);
    } else {
      g.w = 0;
      g.h = 0;
    }
    glyphs_[cp] = std::move(g);
  }

  auto space = glyphs_.find(static_cast<std::uint32_t>(' '));
  if (space != glyphs_.end() && space->second.advance > 0) {
    fallbackAdvance_ = space->second.advance;
  }
  return true;
}

int BitmapFont::textWidth(const std::string& text) const {
  if (!loaded_) return static_cast<int>(text.size()) * fallbackAdvance_;
  int w = 0;
  for (char ch : text) {
    auto it = glyphs_.find(static_cast<unsigned char>(ch));
    w += (it != glyphs_.end()) ? it->second.advance : fallbackAdvance_;
  }
  return w;
}

int BitmapFont::drawText(Canvas& canvas, int x, int baselineY, const Rgb& color,
                         const std::string& text) const {
  if (!loaded_) return 0;

  int penX = x;
  for (char ch : text) {
    auto it = glyphs_.find(static_cast<unsigned char>(ch));
    if (it == glyphs_.end()) {
      penX += fallbackAdvance_;
      continue;
    }
    const Glyph& g = it->second;
    for (int row = 0; row < g.h; row++) {
      for (int col = 0; col < g.w; col++) {
        std::uint8_t a = g.coverage[static_cast<std::size_t>(row) * g.w + col];
        if (a >= threshold_) {
          canvas.setPixel(penX + g.xoff + col, baselineY + g.yoff + row, color);
        }
      }
    }
    penX += g.advance;
  }
  return penX - x;
}

void BitmapFont::drawTextCentered(Canvas& canvas, int centerX, int baselineY, const Rgb& color,
                                  const std::string& text) const {
  drawText(canvas, centerX - textWidth(text) / 2, baselineY, color, text);
}

} // namespace lp
