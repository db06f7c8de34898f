// D3.1 - Gauge math test
// Tests: clamping, fill widths, proportional segments, zero children,
//        remainder absorbed by the last visible segment.

#include "lp/layout/Gauge.hpp"

#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static int totalWidth(const std::vector<lp::Segment>& segs) {
  int w = 0;
  for (const auto& s : segs) w += s.width;
  return w;
}

int main() {
  // --- Test 1: clamp and fill ---
  {
    requireTrue(lp::clampPercent(-5) == 0.0, "negative clamps to 0");
    requireTrue(lp::clampPercent(150) == 100.0, "over 100 clamps");
    requireTrue(lp::clampPercent(std::numeric_limits<double>::quiet_NaN()) == 0.0, "NaN is 0");
    requireTrue(lp::fillWidth(50, 58) == 29, "half of 58");
    requireTrue(lp::fillWidth(33, 58) == 19, "33% of 58 truncates to 19");
    requireTrue(lp::fillWidth(150, 58) == 58, "clamped fill");
    requireTrue(lp::fillWidth(-10, 58) == 0, "negative fill");
    requireTrue(lp::fillWidth(50, 0) == 0, "zero width");
    requireTrue(lp::meanPercent({}) == 0.0, "mean of nothing");
    requireTrue(lp::meanPercent({10, 90, 20}) == 40.0, "mean");
    std::printf("  Clamp/fill PASS\n");
  }

  // --- Test 2: [0, 40, 60] at 33% over 58px ---
  {
    int fill = lp::fillWidth(33, 58);
    auto segs = lp::computeSegments({0, 40, 60}, 3, fill);
    requireTrue(segs.size() == 2, "0% child draws nothing");
    requireTrue(segs[0].childIndex == 1 && segs[0].x == 3 && segs[0].width == 7, "first segment");
    requireTrue(segs[1].childIndex == 2 && segs[1].x == 10 && segs[1].width == 12,
                "last segment absorbs rounding");
    requireTrue(totalWidth(segs) == fill, "segments sum to fill");
    std::printf("  Worked example PASS\n");
  }

  // --- Test 3: widths always sum to the fill ---
  {
    const std::vector<std::vector<double>> cases = {
      {33.3, 33.3, 33.4}, {1, 1, 1, 1, 1, 1, 1}, {100}, {5, 95}, {12.5, 0, 0, 87.5, 0}
    };
    for (const auto& c : cases) {
      for (int fill = 1; fill <= 58; fill += 7) {
        auto segs = lp::computeSegments(c, 0, fill);
        requireTrue(totalWidth(segs) == fill, "sum equals fill");
        int x = 0;
        for (const auto& s : segs) {
          requireTrue(s.x == x, "segments are contiguous");
          requireTrue(s.width > 0, "no empty segments");
          requireTrue(c[s.childIndex] > 0, "no segment for a 0% child");
          x += s.width;
        }
      }
    }
    std::printf("  Sum invariant PASS\n");
  }

  // --- Test 4: degenerate inputs ---
  {
    requireTrue(lp::computeSegments({}, 0, 20).empty(), "no children");
    requireTrue(lp::computeSegments({0, 0}, 0, 20).empty(), "all zero children");
    requireTrue(lp::computeSegments({50, 50}, 0, 0).empty(), "zero fill");
    auto segs = lp::computeSegments({-20, 250}, 0, 10);
    requireTrue(segs.size() == 1 && segs[0].childIndex == 1 && segs[0].width == 10,
                "children clamped before sharing");
    std::printf("  Degenerate inputs PASS\n");
  }

  std::printf("\nD3.1 gauge segments PASS\n");
  return 0;
}
