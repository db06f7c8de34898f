#include "lp/render/Animations.hpp"

#include "lp/render/Painter.hpp"

namespace lp {

namespace {

const int kIdlePath[8][2] = {
  {32, 5}, {55, 10}, {58, 32}, {55, 54}, {32, 59}, {9, 54}, {6, 32}, {9, 10}
};

} // anonymous namespace

const char* animationKindName(AnimationKind k) {
  switch (k) {
    case AnimationKind::Boot:          return "boot";
    case AnimationKind::WifiSearching: return "wifi_searching";
    case AnimationKind::Activity:      return "activity";
    case AnimationKind::Idle:          return "idle";
  }
  return "?";
}

bool parseAnimationKind(const std::string& name, AnimationKind& out) {
  if (name == "boot") out = AnimationKind::Boot;
  else if (name == "wifi_searching") out = AnimationKind::WifiSearching;
  else if (name == "activity") out = AnimationKind::Activity;
  else if (name == "idle") out = AnimationKind::Idle;
  else return false;
  return true;
}

int animationFrameDelayMs(AnimationKind k) {
  switch (k) {
    case AnimationKind::Boot:          return 50;
    case AnimationKind::WifiSearching: return 400;
    case AnimationKind::Activity:      return 500;
    case AnimationKind::Idle:          return 300;
  }
  return 200;
}

void drawBootFrame(Canvas& canvas, const BitmapFont* font, const PanelTheme& theme,
                   int percent) {
  if (font) font->drawTextCentered(canvas, canvas.width() / 2, 15, theme.white, "BOOTING...");

  const int barW = 50, barH = 10;
  const int x = (canvas.width() - barW) / 2;
  const int y = 35;

  Painter p(canvas);
  p.line(x, y, x + barW, y, theme.white);
  p.line(x, y + barH, x + barW, y + barH, theme.white);
  p.line(x, y, x, y + barH, theme.white);
  p.line(x + barW, y, x + barW, y + barH, theme.white);

  if (percent < 0) percent = 0;
  if (percent > 100) percent = 100;
  const int fill = percent * (barW - 2) / 100;
  p.fillRect(x + 1, y + 1, x + 1 + fill, y + barH, theme.green);
}

void drawWifiSearchingFrame(Canvas& canvas, const PanelTheme& theme, int frame) {
  Painter p(canvas);
  const int cx = 32, cy = 40;
  p.circle(cx, cy, 2, theme.blue);
  const int stage = frame % 3;
  p.arc(cx, cy, 8, -45, 45, 5, theme.blue);
  if (stage >= 1) p.arc(cx, cy, 14, -60, 60, 4, theme.blue);
  if (stage >= 2) p.arc(cx, cy, 20, -70, 70, 3, theme.blue);
}

void drawActivityFrame(Canvas& canvas, const PanelTheme& theme, bool on) {
  if (on) Painter(canvas).circle(58, 6, 3, theme.green);
}

void drawIdleFrame(Canvas& canvas, const PanelTheme& theme, int frame) {
  const int* pos = kIdlePath[frame % 8];
  Painter(canvas).circle(pos[0], pos[1], 2, theme.blue);
}

void drawAnimationFrame(Canvas& canvas, AnimationKind kind, int frame, int percent,
                        const BitmapFont* font, const PanelTheme& theme) {
  switch (kind) {
    case AnimationKind::Boot:
      drawBootFrame(canvas, font, theme, percent);
      break;
    case AnimationKind::WifiSearching:
      drawWifiSearchingFrame(canvas, theme, frame);
      break;
    case AnimationKind::Activity:
      drawActivityFrame(canvas, theme, frame % 2 == 0);
      break;
    case AnimationKind::Idle:
      drawIdleFrame(canvas, theme, frame);
      break;
  }
}

} // namespace lp
