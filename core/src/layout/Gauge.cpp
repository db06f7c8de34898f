#include "lp/layout/Gauge.hpp"

#include <cmath>

namespace lp {

double clampPercent(double percentage) {
  if (!std::isfinite(percentage)) return 0.0;
  if (percentage < 0.0) return 0.0;
  if (percentage > 100.0) return 100.0;
  return percentage;
}

int fillWidth(double percentage, int totalWidth) {
  if (totalWidth <= 0) return 0;
  return static_cast<int>((clampPercent(percentage) / 100.0) * totalWidth);
}

double meanPercent(const std::vector<double>& percentages) {
  if (percentages.empty()) return 0.0;
  double sum = 0.0;
  for (double p : percentages) sum += p;
  return sum / static_cast<double>(percentages.size());
}

std::vector<Segment> computeSegments(const std::vector<double>& childPercentages,
                                     int xStart, int fill) {
  std::vector<Segment> out;
  if (fill <= 0) return out;

  std::vector<double> pcts;
  pcts.reserve(childPercentages.size());
  double total = 0.0;
  for (double p : childPercentages) {
    double c = clampPercent(p);
    pcts.push_back(c);
    total += c;
  }
  if (total <= 0.0) return out;

  std::size_t lastNonZero = 0;
  for (std::size_t i = 0; i < pcts.size(); i++) {
    if (pcts[i] > 0.0) lastNonZero = i;
  }

  int x = xStart;
  const int end = xStart + fill;
  for (std::size_t i = 0; i < pcts.size(); i++) {
    if (pcts[i] <= 0.0) continue;

    int w = static_cast<int>((pcts[i] / total) * fill);
    if (i == lastNonZero) w = end - x;
    if (w <= 0) continue;

    out.push_back(Segment{i, x, w});
    x += w;
  }
  return out;
}

} // namespace lp
