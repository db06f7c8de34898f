#include "lp/render/Painter.hpp"

#include <cmath>
#include <cstdlib>

namespace lp {

namespace {

constexpr double kPi = 3.14159265358979323846;

const char* const kCheckRows[7] = {
  "0000000",
  "0000001",
  "0000010",
  "0000100",
  "0101000",
  "0010000",
  "0000000",
};

} // anonymous namespace

void Painter::fillRect(int x0, int y0, int x1, int y1, const Rgb& c) {
  for (int y = y0; y < y1; y++) {
    for (int x = x0; x < x1; x++) {
      canvas_.setPixel(x, y, c);
    }
  }
}

void Painter::outlineRect(int x0, int y0, int x1, int y1, const Rgb& c) {
  if (x1 <= x0 || y1 <= y0) return;
  for (int x = x0; x < x1; x++) {
    canvas_.setPixel(x, y0, c);
    canvas_.setPixel(x, y1 - 1, c);
  }
  for (int y = y0; y < y1; y++) {
    canvas_.setPixel(x0, y, c);
    canvas_.setPixel(x1 - 1, y, c);
  }
}

void Painter::line(int x0, int y0, int x1, int y1, const Rgb& c) {
  // Bresenham
  int dx = std::abs(x1 - x0);
  int dy = -std::abs(y1 - y0);
  int sx = x0 < x1 ? 1 : -1;
  int sy = y0 < y1 ? 1 : -1;
  int err = dx + dy;
  for (;;) {
    canvas_.setPixel(x0, y0, c);
    if (x0 == x1 && y0 == y1) break;
    int e2 = 2 * err;
    if (e2 >= dy) { err += dy; x0 += sx; }
    if (e2 <= dx) { err += dx; y0 += sy; }
  }
}

void Painter::circle(int cx, int cy, int radius, const Rgb& c) {
  // Midpoint circle
  int x = radius;
  int y = 0;
  int err = 1 - radius;
  while (x >= y) {
    canvas_.setPixel(cx + x, cy + y, c);
    canvas_.setPixel(cx + y, cy + x, c);
    canvas_.setPixel(cx - y, cy + x, c);
    canvas_.setPixel(cx - x, cy + y, c);
    canvas_.setPixel(cx - x, cy - y, c);
    canvas_.setPixel(cx - y, cy - x, c);
    canvas_.setPixel(cx + y, cy - x, c);
    canvas_.setPixel(cx + x, cy - y, c);
    y++;
    if (err < 0) {
      err += 2 * y + 1;
    } else {
      x--;
      err += 2 * (y - x) + 1;
    }
  }
}

void Painter::arc(int cx, int cy, int radius, int fromDeg, int toDeg, int stepDeg, const Rgb& c) {
  if (stepDeg <= 0) return;
  for (int deg = fromDeg; deg <= toDeg; deg += stepDeg) {
    double rad = deg * kPi / 180.0;
    int x = static_cast<int>(cx + radius * std::sin(rad));
    int y = static_cast<int>(cy - radius * std::cos(rad));
    canvas_.setPixel(x, y, c);
  }
}

void Painter::checkBadge(int x, int y, const Rgb& background, const Rgb& mark) {
  for (int row = 0; row < 7; row++) {
    for (int col = 0; col < 7; col++) {
      canvas_.setPixel(x + col, y + row, kCheckRows[row][col] == '1' ? mark : background);
    }
  }
}

} // namespace lp
