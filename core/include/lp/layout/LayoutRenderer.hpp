#pragma once
#include "lp/device/Canvas.hpp"
#include "lp/layout/ProgressModel.hpp"
#include "lp/render/BitmapFont.hpp"
#include "lp/style/PanelTheme.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace lp {

// Draws the progress layouts onto a 64x64 canvas. Stateless: it never
// swaps, never owns a thread and never changes its inputs. Text is skipped
// when the font is null or not loaded.
class LayoutRenderer {
public:
  // Names longer than this scroll instead of being centred.
  static constexpr std::size_t kScrollNameChars = 10;
  static constexpr int kRowHeight = 21;

  explicit LayoutRenderer(const BitmapFont* font, const PanelTheme& theme = PanelTheme{});

  const PanelTheme& theme() const { return theme_; }

  // --- single -------------------------------------------------------------
  static bool nameScrolls(const SingleLayoutModel& model);
  void renderSingle(Canvas& canvas, const SingleLayoutModel& model) const;
  // Same frame with the name drawn starting at `nameX`.
  void renderSingleAt(Canvas& canvas, const SingleLayoutModel& model, int nameX) const;
  // Next scroll position: one pixel left, wrapping to the right edge once
  // the name has fully left the panel.
  int nextScrollX(const Canvas& canvas, const SingleLayoutModel& model, int nameX) const;

  // --- sprint ---------------------------------------------------------------
  // Project bar on top, three vertical sprint columns below.
  void renderSprintView(Canvas& canvas, const SprintViewModel& model) const;
  // Three 21px rows S1..S3. Rows without data are dim placeholders.
  void renderSprintHorizontal(Canvas& canvas, const std::vector<ProgressNode>& sprints) const;

  // --- user story -----------------------------------------------------------
  // Sprint row plus stories[windowStart] and stories[windowStart + 1]. The
  // sprint gauge always uses every story.
  void renderUserStory(Canvas& canvas, const UserStoryModel& model,
                       std::size_t windowStart = 0) const;

  // "N%" with N rounded.
  static std::string percentLabel(double percentage);

private:
  struct RowGeometry {
    int labelBaseline;
    int gaugeTop;
    int gaugeBottom;
  };
  static RowGeometry rowGeometry(int row);

  void drawRowFrame(Canvas& canvas, int row, const std::string& label) const;
  void drawRowValue(Canvas& canvas, int row, double percentage) const;
  void fillRowSolid(Canvas& canvas, int row, double percentage, const Rgb& color) const;
  void fillRowSegments(Canvas& canvas, int row, const std::vector<ProgressNode>& children) const;

  void fillSegmented(Canvas& canvas, int x0, int y0, int x1, int y1, double percentage,
                     const std::vector<ProgressNode>& children,
                     const Rgb* palette, std::size_t paletteSize) const;

  void text(Canvas& canvas, int x, int baseline, const std::string& s) const;
  void textCentered(Canvas& canvas, int cx, int baseline, const std::string& s) const;

  const BitmapFont* font_;
  PanelTheme theme_;
};

} // namespace lp
