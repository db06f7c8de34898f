#pragma once
#include "lp/device/Canvas.hpp"
#include "lp/render/BitmapFont.hpp"
#include "lp/style/PanelTheme.hpp"

#include <string>

namespace lp {

enum class AnimationKind {
  Boot,          // "BOOTING..." with a filling bar, ends after its duration
  WifiSearching, // arcs appearing one by one
  Activity,      // blinking corner dot
  Idle           // dot walking around the border
};

const char* animationKindName(AnimationKind k);
bool parseAnimationKind(const std::string& name, AnimationKind& out);

// Inter-frame delay in milliseconds.
int animationFrameDelayMs(AnimationKind k);

// Boot is the only animation with a built-in length.
constexpr int kBootDefaultDurationMs = 2000;

void drawBootFrame(Canvas& canvas, const BitmapFont* font, const PanelTheme& theme,
                   int percent);
void drawWifiSearchingFrame(Canvas& canvas, const PanelTheme& theme, int frame);
void drawActivityFrame(Canvas& canvas, const PanelTheme& theme, bool on);
void drawIdleFrame(Canvas& canvas, const PanelTheme& theme, int frame);

// Draws frame `frame` of `kind`. For Boot, `percent` is the bar fill.
void drawAnimationFrame(Canvas& canvas, AnimationKind kind, int frame, int percent,
                        const BitmapFont* font, const PanelTheme& theme);

} // namespace lp
