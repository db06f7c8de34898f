#include "lp/layout/LayoutRenderer.hpp"

#include "lp/layout/Gauge.hpp"
#include "lp/render/Painter.hpp"

#include <algorithm>
#include <cmath>

namespace lp {

namespace {

// Single layout gauge
constexpr int kGaugeX0 = 2;
constexpr int kGaugeX1 = 62;
constexpr int kGaugeY0 = 12;
constexpr int kGaugeY1 = 22;

// Row gauges (sprint horizontal, user story)
constexpr int kRowGaugeX0 = 14;
constexpr int kRowGaugeX1 = 38;
constexpr int kRowLabelX = 2;
constexpr int kRowValueX = 40;

// Sprint view
constexpr int kProjectBarHeight = 10;
constexpr int kColumnTop = 13;
constexpr int kColumnLabelBaseline = 16;

std::vector<double> percentagesOf(const std::vector<ProgressNode>& nodes) {
  std::vector<double> out;
  out.reserve(nodes.size());
  for (const auto& n : nodes) out.push_back(n.percentage);
  return out;
}

} // anonymous namespace

LayoutRenderer::LayoutRenderer(const BitmapFont* font, const PanelTheme& theme)
    : font_(font), theme_(theme) {}

std::string LayoutRenderer::percentLabel(double percentage) {
  return std::to_string(static_cast<long>(std::lround(percentage))) + "%";
}

void LayoutRenderer::text(Canvas& canvas, int x, int baseline, const std::string& s) const {
  if (font_) font_->drawText(canvas, x, baseline, theme_.text, s);
}

void LayoutRenderer::textCentered(Canvas& canvas, int cx, int baseline, const std::string& s) const {
  if (font_) font_->drawTextCentered(canvas, cx, baseline, theme_.text, s);
}

void LayoutRenderer::fillSegmented(Canvas& canvas, int x0, int y0, int x1, int y1,
                                   double percentage, const std::vector<ProgressNode>& children,
                                   const Rgb* palette, std::size_t paletteSize) const {
  Painter p(canvas);
  const int fill = fillWidth(percentage, x1 - x0);
  for (const Segment& s : computeSegments(percentagesOf(children), x0, fill)) {
    p.fillRect(s.x, y0, s.x + s.width, y1, palette[s.childIndex % paletteSize]);
  }
}

// ---------------------------------------------------------------------------
// Single
// ---------------------------------------------------------------------------

bool LayoutRenderer::nameScrolls(const SingleLayoutModel& model) {
  return model.projectName.size() > kScrollNameChars;
}

void LayoutRenderer::renderSingle(Canvas& canvas, const SingleLayoutModel& model) const {
  if (nameScrolls(model)) {
    renderSingleAt(canvas, model, canvas.width());
    return;
  }
  int nameX = canvas.width() / 2;
  if (font_) nameX -= font_->textWidth(model.projectName) / 2;
  renderSingleAt(canvas, model, nameX);
}

void LayoutRenderer::renderSingleAt(Canvas& canvas, const SingleLayoutModel& model,
                                    int nameX) const {
  Painter p(canvas);
  const int cx = canvas.width() / 2;

  text(canvas, nameX, 8, model.projectName);

  p.outlineRect(kGaugeX0, kGaugeY0, kGaugeX1, kGaugeY1, theme_.gaugeOutline);
  const int ix0 = kGaugeX0 + 1, ix1 = kGaugeX1 - 1;
  const int iy0 = kGaugeY0 + 1, iy1 = kGaugeY1 - 1;
  if (model.sprints.empty()) {
    p.fillRect(ix0, iy0, ix0 + fillWidth(model.percentage, ix1 - ix0), iy1, theme_.green);
  } else {
    fillSegmented(canvas, ix0, iy0, ix1, iy1, model.percentage, model.sprints,
                  theme_.sprintPalette, 6);
  }

  if (model.percentage >= 100.0) {
    p.checkBadge(cx - 4, 26, theme_.checkBackground, theme_.checkForeground);
  } else {
    textCentered(canvas, cx, 32, percentLabel(model.percentage));
  }

  if (model.totalSprints > 0) {
    textCentered(canvas, cx, 44, "Sprint: " + std::to_string(model.currentSprint));
  }
  if (model.totalStories > 0) {
    textCentered(canvas, cx, 56, "US: " + std::to_string(model.completedStories) + "/" +
                                     std::to_string(model.totalStories));
  }
}

int LayoutRenderer::nextScrollX(const Canvas& canvas, const SingleLayoutModel& model,
                                int nameX) const {
  int textW = font_ ? font_->textWidth(model.projectName)
                    : static_cast<int>(model.projectName.size()) * 6;
  int next = nameX - 1;
  if (next < -textW) next = canvas.width();
  return next;
}

// ---------------------------------------------------------------------------
// Sprint view
// ---------------------------------------------------------------------------

void LayoutRenderer::renderSprintView(Canvas& canvas, const SprintViewModel& model) const {
  Painter p(canvas);
  const int w = canvas.width();
  const int h = canvas.height();

  p.fillRect(0, 0, fillWidth(model.projectPercentage, w), kProjectBarHeight, theme_.projectFill);
  p.outlineRect(0, 0, w, kProjectBarHeight, theme_.gaugeOutline);
  if (model.projectPercentage >= 100.0) {
    p.checkBadge(w / 2 - 4, 1, theme_.checkBackground, theme_.checkForeground);
  } else {
    textCentered(canvas, w / 2, 7, percentLabel(model.projectPercentage));
  }

  const int colW = w / 3;
  for (int i = 0; i < 3; i++) {
    const int x0 = i * colW;
    const int x1 = (i < 2) ? (i + 1) * colW : w;
    const int mid = x0 + (x1 - x0) / 2;

    text(canvas, x0 + 7, kColumnLabelBaseline, "S" + std::to_string(i + 1));

    if (static_cast<std::size_t>(i) >= model.sprints.size()) {
      p.fillRect(x0, kColumnTop, x1, h, theme_.placeholderFill);
      continue;
    }

    const double pct = model.sprints[static_cast<std::size_t>(i)].percentage;
    const int rows = fillWidth(pct, h - kColumnTop);
    p.fillRect(x0, h - rows, x1, h, theme_.sprintFill);

    if (pct >= 100.0) {
      p.checkBadge(mid - 3, 35, theme_.checkBackground, theme_.checkForeground);
    } else if (pct > 0.0) {
      textCentered(canvas, mid, 40, percentLabel(pct));
    }
  }
}

// ---------------------------------------------------------------------------
// Rows (sprint horizontal, user story)
// ---------------------------------------------------------------------------

LayoutRenderer::RowGeometry LayoutRenderer::rowGeometry(int row) {
  const int top = row * kRowHeight;
  RowGeometry g;
  g.labelBaseline = top + kRowHeight / 2 + 3;
  g.gaugeTop = top + 6;
  g.gaugeBottom = top + kRowHeight - 6;
  return g;
}

void LayoutRenderer::drawRowFrame(Canvas& canvas, int row, const std::string& label) const {
  const RowGeometry g = rowGeometry(row);
  text(canvas, kRowLabelX, g.labelBaseline, label);
  Painter(canvas).outlineRect(kRowGaugeX0, g.gaugeTop, kRowGaugeX1, g.gaugeBottom,
                              theme_.gaugeOutline);
}

void LayoutRenderer::drawRowValue(Canvas& canvas, int row, double percentage) const {
  const RowGeometry g = rowGeometry(row);
  if (percentage >= 100.0) {
    Painter(canvas).checkBadge(kRowValueX, g.labelBaseline - 8,
                               theme_.checkBackground, theme_.checkForeground);
  } else {
    text(canvas, kRowValueX, g.labelBaseline, percentLabel(percentage));
  }
}

void LayoutRenderer::fillRowSolid(Canvas& canvas, int row, double percentage,
                                  const Rgb& color) const {
  const RowGeometry g = rowGeometry(row);
  const int x0 = kRowGaugeX0 + 1;
  const int x1 = kRowGaugeX1 - 1;
  Painter(canvas).fillRect(x0, g.gaugeTop + 1, x0 + fillWidth(percentage, x1 - x0),
                           g.gaugeBottom - 1, color);
}

void LayoutRenderer::fillRowSegments(Canvas& canvas, int row,
                                     const std::vector<ProgressNode>& children) const {
  const RowGeometry g = rowGeometry(row);
  // The row's fill is the mean of its children; each child's colour run is
  // sized by its share of that mean.
  fillSegmented(canvas, kRowGaugeX0 + 1, g.gaugeTop + 1, kRowGaugeX1 - 1, g.gaugeBottom - 1,
                meanPercent(percentagesOf(children)), children, theme_.storyPalette, 8);
}

void LayoutRenderer::renderSprintHorizontal(Canvas& canvas,
                                            const std::vector<ProgressNode>& sprints) const {
  for (int i = 0; i < 3; i++) {
    drawRowFrame(canvas, i, "S" + std::to_string(i + 1));

    if (static_cast<std::size_t>(i) >= sprints.size()) {
      const RowGeometry g = rowGeometry(i);
      Painter(canvas).fillRect(kRowGaugeX0 + 1, g.gaugeTop + 1, kRowGaugeX1 - 1,
                               g.gaugeBottom - 1, theme_.placeholderFill);
      continue;
    }

    const ProgressNode& sprint = sprints[static_cast<std::size_t>(i)];
    if (sprint.children.empty()) {
      fillRowSolid(canvas, i, sprint.percentage, theme_.rowColors[i]);
    } else {
      fillRowSegments(canvas, i, sprint.children);
    }
    drawRowValue(canvas, i, sprint.percentage);
  }
}

void LayoutRenderer::renderUserStory(Canvas& canvas, const UserStoryModel& model,
                                     std::size_t windowStart) const {
  drawRowFrame(canvas, 0, "S" + std::to_string(model.sprint.index + 1));
  if (model.stories.empty()) {
    fillRowSolid(canvas, 0, model.sprint.percentage, theme_.rowColors[0]);
  } else {
    fillRowSegments(canvas, 0, model.stories);
  }
  drawRowValue(canvas, 0, model.sprint.percentage);

  for (int line = 1; line <= 2; line++) {
    const std::size_t idx = windowStart + static_cast<std::size_t>(line - 1);
    if (idx >= model.stories.size()) break;

    const ProgressNode& story = model.stories[idx];
    drawRowFrame(canvas, line, "U" + std::to_string(idx + 1));
    fillRowSolid(canvas, line, story.percentage, theme_.rowColors[line]);
    drawRowValue(canvas, line, story.percentage);
  }
}

} // namespace lp
