#include "lp/render/StatusScreens.hpp"

#include "lp/layout/Gauge.hpp"
#include "lp/render/Painter.hpp"

#include <stdexcept>
#include <utility>

namespace lp {

namespace {

const std::pair<const char*, const char*> kAliases[] = {
  {"checkmark", "checkmark"},
  {"check", "checkmark"},
  {"error", "error"},
  {"x", "error"},
  {"wifi", "wifi"},
  {"wifi_connected", "wifi"},
  {"w", "wifi"},
  {"wifi_error", "wifi_error"},
  {"tunnel", "tunnel"},
  {"tunnel_active", "tunnel"},
  {"t", "tunnel"},
  {"discord", "discord"},
  {"discord_active", "discord"},
  {"d", "discord"},
  {"hourglass", "hourglass"},
  {"dot", "dot"},
  {"all_on", "all_on"},
};

constexpr int kWifiCx = 32;
constexpr int kWifiCy = 40;

void wifiArcs(Painter& p, int count, const Rgb& c) {
  p.circle(kWifiCx, kWifiCy, 2, c);
  if (count > 0) p.arc(kWifiCx, kWifiCy, 8, -45, 45, 5, c);
  if (count > 1) p.arc(kWifiCx, kWifiCy, 14, -60, 60, 4, c);
  if (count > 2) p.arc(kWifiCx, kWifiCy, 20, -70, 70, 3, c);
}

void drawDiscord(Canvas& canvas, const PanelTheme& theme, const Image* logo) {
  if (logo && !logo->empty()) {
    blitCentered(canvas, fitWithin(*logo, canvas.width(), canvas.height()));
    return;
  }
  Painter(canvas).circle(32, 32, 10, theme.purple);
}

} // anonymous namespace

const std::vector<std::string>& symbolNames() {
  static const std::vector<std::string> names = {
    "checkmark", "error", "wifi", "wifi_error", "tunnel",
    "discord", "hourglass", "dot", "all_on"
  };
  return names;
}

bool canonicalSymbol(const std::string& name, std::string& canonical) {
  for (const auto& a : kAliases) {
    if (name == a.first) {
      canonical = a.second;
      return true;
    }
  }
  return false;
}

void drawSymbol(Canvas& canvas, const std::string& name, const PanelTheme& theme,
                const Image* discordLogo) {
  std::string sym;
  if (!canonicalSymbol(name, sym)) {
    throw std::invalid_argument("Unknown symbol: " + name);
  }

  Painter p(canvas);
  if (sym == "checkmark") {
    p.line(25, 35, 30, 40, theme.green);
    p.line(30, 40, 40, 20, theme.green);
  } else if (sym == "error") {
    p.line(20, 20, 44, 44, theme.red);
    p.line(44, 20, 20, 44, theme.red);
  } else if (sym == "wifi") {
    wifiArcs(p, 3, theme.green);
  } else if (sym == "wifi_error") {
    wifiArcs(p, 2, theme.red);
    p.line(15, 15, 49, 49, theme.red);
  } else if (sym == "tunnel") {
    p.line(10, 15, 25, 32, theme.blue);
    p.line(54, 15, 39, 32, theme.blue);
    p.line(10, 49, 25, 32, theme.blue);
    p.line(54, 49, 39, 32, theme.blue);
    p.line(25, 25, 39, 25, theme.blue);
    p.line(25, 39, 39, 39, theme.blue);
    p.line(25, 25, 25, 39, theme.blue);
    p.line(39, 25, 39, 39, theme.blue);
  } else if (sym == "discord") {
    drawDiscord(canvas, theme, discordLogo);
  } else if (sym == "hourglass") {
    const int c = 32, s = 15;
    p.line(c - s, c - s, c + s, c - s, theme.yellow);
    p.line(c - s, c - s, c, c, theme.yellow);
    p.line(c + s, c - s, c, c, theme.yellow);
    p.line(c - s, c + s, c + s, c + s, theme.yellow);
    p.line(c - s, c + s, c, c, theme.yellow);
    p.line(c + s, c + s, c, c, theme.yellow);
  } else if (sym == "dot") {
    p.circle(32, 32, 3, theme.white);
  } else if (sym == "all_on") {
    canvas.fill(theme.white);
  }
}

void drawProgressBar(Canvas& canvas, double percentage, const PanelTheme& theme) {
  const int h = canvas.height();
  const int rows = fillWidth(percentage, h);
  Painter p(canvas);
  for (int y = h - rows; y < h; y++) {
    const Rgb& c = (y < h / 3) ? theme.red : (y < 2 * h / 3) ? theme.yellow : theme.green;
    p.fillRect(0, y, canvas.width(), y + 1, c);
  }
}

void drawConnectedTest(Canvas& canvas, const BitmapFont* font, const PanelTheme& theme) {
  if (font) font->drawTextCentered(canvas, canvas.width() / 2, 20, theme.green, "CONNECTED");
  Painter p(canvas);
  p.line(28, 35, 33, 40, theme.green);
  p.line(33, 40, 43, 25, theme.green);
}

} // namespace lp
