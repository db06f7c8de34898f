#pragma once
#include "lp/render/Rgb.hpp"

namespace lp {

struct PanelTheme {
  // Status colors
  Rgb green{0, 255, 0};
  Rgb red{255, 0, 0};
  Rgb blue{0, 100, 255};
  Rgb white{255, 255, 255};
  Rgb yellow{255, 255, 0};
  Rgb orange{255, 165, 0};
  Rgb purple{128, 0, 255};

  // Gauges
  Rgb gaugeOutline{100, 100, 100};
  Rgb placeholderFill{10, 10, 10};
  Rgb projectFill{0, 100, 255};
  Rgb sprintFill{0, 255, 0};
  Rgb text{255, 255, 255};

  // 7x7 completion badge
  Rgb checkBackground{0, 200, 0};
  Rgb checkForeground{255, 255, 255};

  // Horizontal row colors, by row index
  Rgb rowColors[3] = {
    {0, 255, 0},    // green
    {0, 100, 255},  // blue
    {255, 255, 0}   // yellow
  };

  // Segment colors for sprints inside a project gauge
  Rgb sprintPalette[6] = {
    {0, 255, 0},
    {0, 200, 255},
    {255, 165, 0},
    {255, 0, 100},
    {128, 0, 255},
    {255, 255, 0}
  };

  // Segment colors for stories inside a sprint gauge
  Rgb storyPalette[8] = {
    {0, 100, 255},
    {255, 255, 0},
    {0, 255, 255},
    {255, 0, 255},
    {255, 128, 0},
    {128, 255, 0},
    {255, 0, 128},
    {128, 0, 255}
  };
};

} // namespace lp
