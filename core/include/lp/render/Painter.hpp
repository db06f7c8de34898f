#pragma once
#include "lp/device/Canvas.hpp"
#include "lp/render/Rgb.hpp"

namespace lp {

// Primitive drawing on a Canvas. Rectangles are half-open:
// [x0, x1) x [y0, y1). Everything clips at the canvas edge.
class Painter {
public:
  explicit Painter(Canvas& canvas) : canvas_(canvas) {}

  Canvas& canvas() { return canvas_; }

  void fillRect(int x0, int y0, int x1, int y1, const Rgb& c);
  void outlineRect(int x0, int y0, int x1, int y1, const Rgb& c);

  // Inclusive endpoints.
  void line(int x0, int y0, int x1, int y1, const Rgb& c);

  // Outline only.
  void circle(int cx, int cy, int radius, const Rgb& c);

  // Dots on an arc of `radius` centred on (cx, cy); angle 0 points up,
  // positive angles to the right.
  void arc(int cx, int cy, int radius, int fromDeg, int toDeg, int stepDeg, const Rgb& c);

  // 7x7 completion badge with its top-left at (x, y).
  void checkBadge(int x, int y, const Rgb& background, const Rgb& mark);

private:
  Canvas& canvas_;
};

} // namespace lp
