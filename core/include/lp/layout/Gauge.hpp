#pragma once
#include <cstddef>
#include <vector>

namespace lp {

// Clamp to [0, 100]. Non-finite input maps to 0.
double clampPercent(double percentage);

// Filled pixel extent of a gauge `totalWidth` wide (truncating).
int fillWidth(double percentage, int totalWidth);

// Arithmetic mean of the values, 0 for an empty list.
double meanPercent(const std::vector<double>& percentages);

// One coloured run inside a gauge fill.
struct Segment {
  std::size_t childIndex{0}; // selects the palette entry
  int x{0};
  int width{0};
};

// Splits `fill` pixels starting at `xStart` among the children in
// proportion to their percentages. Children at 0% get no segment; the
// last non-zero child absorbs truncation so the widths sum to `fill`.
std::vector<Segment> computeSegments(const std::vector<double>& childPercentages,
                                     int xStart, int fill);

} // namespace lp
