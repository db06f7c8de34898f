#pragma once
#include "lp/device/Canvas.hpp"
#include "lp/render/BitmapFont.hpp"
#include "lp/render/ImageDecoder.hpp"
#include "lp/style/PanelTheme.hpp"

#include <string>
#include <vector>

namespace lp {

// Canonical symbol names; aliases (check, x, w, t, d...) map onto these.
const std::vector<std::string>& symbolNames();

// Resolves an alias to its canonical name. Returns false for unknown names.
bool canonicalSymbol(const std::string& name, std::string& canonical);

// Draws one status symbol. `discordLogo` may be null, in which case the
// discord symbol falls back to a purple ring. Throws std::invalid_argument
// for unknown names.
void drawSymbol(Canvas& canvas, const std::string& name, const PanelTheme& theme,
                const Image* discordLogo = nullptr);

// Vertical bar lit from the bottom: green lower third, yellow middle, red
// top. `percentage` is clamped to [0,100].
void drawProgressBar(Canvas& canvas, double percentage, const PanelTheme& theme);

// Green "CONNECTED" caption with a check stroke underneath.
void drawConnectedTest(Canvas& canvas, const BitmapFont* font, const PanelTheme& theme);

} // namespace lp
