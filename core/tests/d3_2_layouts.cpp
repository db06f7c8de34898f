// D3.2 - Layout renderer test (no font, pure pixel checks)
// Tests: single gauge fills and segments, checkmark at 100%, sprint rows
//        with dim placeholders, user story windows, sprint view columns,
//        checkmarks on completed stories and the project bar.

#include "lp/device/Canvas.hpp"
#include "lp/layout/LayoutRenderer.hpp"
#include "lp/style/PanelTheme.hpp"

#include <cstdio>
#include <cstdlib>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

static void requirePixel(const lp::Canvas& c, int x, int y, const lp::Rgb& want, const char* msg) {
  lp::Rgb got = c.pixel(x, y);
  if (got != want) {
    std::fprintf(stderr, "ASSERT FAIL: %s at (%d,%d): got (%d,%d,%d) want (%d,%d,%d)\n", msg, x,
                 y, got.r, got.g, got.b, want.r, want.g, want.b);
    std::exit(1);
  }
}

static lp::ProgressNode node(int index, double pct) {
  lp::ProgressNode n;
  n.index = index;
  n.percentage = pct;
  return n;
}

int main() {
  const lp::PanelTheme theme;
  const lp::Rgb black{0, 0, 0};
  lp::LayoutRenderer r(nullptr, theme);

  // --- Test 1: single layout, plain green fill ---
  {
    lp::Canvas c(64, 64);
    lp::SingleLayoutModel m;
    m.projectName = "Apollo";
    m.percentage = 50;
    r.renderSingle(c, m);

    requirePixel(c, 2, 12, theme.gaugeOutline, "outline top-left");
    requirePixel(c, 61, 21, theme.gaugeOutline, "outline bottom-right");
    requirePixel(c, 3, 13, theme.green, "fill starts inside outline");
    requirePixel(c, 31, 20, theme.green, "fill last column (29 px)");
    requirePixel(c, 32, 13, black, "past fill is dark");
    requirePixel(c, 28, 26, black, "no checkmark below 100%");
    std::printf("  Single plain PASS\n");
  }

  // --- Test 2: single layout at 100% shows the check badge ---
  {
    lp::Canvas c(64, 64);
    lp::SingleLayoutModel m;
    m.projectName = "Done";
    m.percentage = 100;
    r.renderSingle(c, m);
    requirePixel(c, 60, 13, theme.green, "full fill");
    requirePixel(c, 28, 26, theme.checkBackground, "badge background");
    requirePixel(c, 34, 27, theme.checkForeground, "badge tick");
    std::printf("  Single checkmark PASS\n");
  }

  // --- Test 3: single layout, sprint segments with a 0% child ---
  {
    lp::Canvas c(64, 64);
    lp::SingleLayoutModel m;
    m.projectName = "Segments";
    m.percentage = 50;
    m.sprints = {node(0, 100), node(1, 0), node(2, 50)};
    r.renderSingle(c, m);
    // fill 29 px, shares 100:50 -> 19 + 10
    requirePixel(c, 3, 15, theme.sprintPalette[0], "first sprint colour");
    requirePixel(c, 21, 15, theme.sprintPalette[0], "first sprint end");
    requirePixel(c, 22, 15, theme.sprintPalette[2], "third sprint starts (second is 0%)");
    requirePixel(c, 31, 15, theme.sprintPalette[2], "third sprint absorbs remainder");
    requirePixel(c, 32, 15, black, "fill ends");
    std::printf("  Single segments PASS\n");
  }

  // --- Test 4: single layout with a long name scrolls ---
  {
    lp::SingleLayoutModel m;
    m.projectName = "Short name";
    requireTrue(!lp::LayoutRenderer::nameScrolls(m), "10 chars does not scroll");
    m.projectName = "A much longer project";
    requireTrue(lp::LayoutRenderer::nameScrolls(m), "long name scrolls");

    lp::Canvas c(64, 64);
    // Without a font each character advances 6 px.
    int w = static_cast<int>(m.projectName.size()) * 6;
    requireTrue(r.nextScrollX(c, m, -w + 1) == -w, "still partly visible");
    requireTrue(r.nextScrollX(c, m, -w) == 64, "wraps to the right edge after leaving");
    requireTrue(r.nextScrollX(c, m, 10) == 9, "moves one pixel left");
    std::printf("  Scrolling name PASS\n");
  }

  // --- Test 5: sprint horizontal, one sprint, dim placeholders below ---
  {
    lp::Canvas c(64, 64);
    r.renderSprintHorizontal(c, {node(0, 100)});

    requirePixel(c, 14, 6, theme.gaugeOutline, "row 0 outline");
    requirePixel(c, 15, 7, theme.rowColors[0], "row 0 fill");
    requirePixel(c, 36, 13, theme.rowColors[0], "row 0 full");
    requirePixel(c, 40, 5, theme.checkBackground, "row 0 checkmark");

    requirePixel(c, 14, 27, theme.gaugeOutline, "row 1 outline");
    requirePixel(c, 15, 28, theme.placeholderFill, "row 1 placeholder");
    requirePixel(c, 36, 34, theme.placeholderFill, "row 1 placeholder far corner");
    requirePixel(c, 15, 49, theme.placeholderFill, "row 2 placeholder");
    std::printf("  Sprint horizontal placeholders PASS\n");
  }

  // --- Test 6: sprint horizontal row colours and story segments ---
  {
    lp::Canvas c(64, 64);
    lp::ProgressNode withStories = node(1, 50);
    withStories.children = {node(0, 100), node(1, 0), node(2, 50)};
    r.renderSprintHorizontal(c, {node(0, 0), withStories, node(2, 50)});

    requirePixel(c, 15, 7, black, "0% row stays dark");
    // mean 50 -> 11 px, shares 100:50 -> 7 + 4
    requirePixel(c, 15, 29, theme.storyPalette[0], "story segment 0");
    requirePixel(c, 22, 29, theme.storyPalette[2], "story segment 2");
    requirePixel(c, 25, 29, theme.storyPalette[2], "story segment 2 end");
    requirePixel(c, 26, 29, black, "row fill ends");
    requirePixel(c, 15, 49, theme.rowColors[2], "row 2 yellow");
    requirePixel(c, 25, 49, theme.rowColors[2], "row 2 half");
    requirePixel(c, 26, 49, black, "row 2 ends");
    std::printf("  Sprint horizontal colours PASS\n");
  }

  // --- Test 7: user story window, parent uses every story ---
  {
    lp::UserStoryModel m;
    m.sprint = node(2, 40);
    m.stories = {node(0, 10), node(1, 20), node(2, 30), node(3, 40), node(4, 50)};

    lp::Canvas c(64, 64);
    r.renderUserStory(c, m, 2);
    // parent: mean 30 -> 6 px; shares 10:20:30:40:50 of 150 -> 0,0,1,1,4
    requirePixel(c, 15, 8, theme.storyPalette[2], "parent segment 2");
    requirePixel(c, 16, 8, theme.storyPalette[3], "parent segment 3");
    requirePixel(c, 17, 8, theme.storyPalette[4], "parent segment 4");
    requirePixel(c, 20, 8, theme.storyPalette[4], "parent segment 4 end");
    requirePixel(c, 21, 8, black, "parent fill ends");
    requirePixel(c, 15, 28, theme.rowColors[1], "story 3 blue");
    requirePixel(c, 20, 28, theme.rowColors[1], "story 3 30%");
    requirePixel(c, 21, 28, black, "story 3 ends");
    requirePixel(c, 22, 49, theme.rowColors[2], "story 4 yellow 40%");
    requirePixel(c, 23, 49, black, "story 4 ends");

    lp::Canvas c2(64, 64);
    r.renderUserStory(c2, m, 4);
    requirePixel(c2, 15, 8, theme.storyPalette[2], "parent unchanged by window");
    requirePixel(c2, 14, 27, theme.gaugeOutline, "last story row drawn");
    requirePixel(c2, 14, 48, black, "no third line past the end");
    std::printf("  User story window PASS\n");
  }

  // --- Test 8: sprint view ---
  {
    lp::Canvas c(64, 64);
    lp::SprintViewModel m;
    m.projectPercentage = 50;
    m.sprints = {node(0, 100), node(1, 50)};
    r.renderSprintView(c, m);

    requirePixel(c, 0, 0, theme.gaugeOutline, "project outline");
    requirePixel(c, 10, 5, theme.projectFill, "project fill");
    requirePixel(c, 40, 5, black, "project fill ends at half");
    requirePixel(c, 7, 35, theme.checkBackground, "done column check");
    requirePixel(c, 2, 60, theme.sprintFill, "done column filled");
    requirePixel(c, 25, 38, black, "half column above fill");
    requirePixel(c, 25, 39, theme.sprintFill, "half column fill top");
    requirePixel(c, 50, 30, theme.placeholderFill, "missing column dim");
    requirePixel(c, 63, 63, theme.placeholderFill, "last column reaches the edge");
    std::printf("  Sprint view PASS\n");
  }

  // --- Test 8b: checkmarks on completed stories and a finished project ---
  {
    lp::UserStoryModel m;
    m.sprint = node(1, 100);
    m.stories = {node(0, 100), node(1, 60)};

    lp::Canvas c(64, 64);
    r.renderUserStory(c, m, 0);
    requirePixel(c, 40, 5, theme.checkBackground, "parent check badge");
    requirePixel(c, 46, 6, theme.checkForeground, "parent check mark");
    requirePixel(c, 40, 26, theme.checkBackground, "story 0 check badge");
    requirePixel(c, 46, 27, theme.checkForeground, "story 0 check mark");
    requirePixel(c, 40, 47, black, "story 1 at 60% has no badge");
    requirePixel(c, 46, 48, black, "story 1 at 60% has no mark");

    lp::Canvas c2(64, 64);
    lp::SprintViewModel v;
    v.projectPercentage = 100;
    v.sprints = {node(0, 20)};
    r.renderSprintView(c2, v);
    requirePixel(c2, 20, 5, theme.projectFill, "project bar full");
    requirePixel(c2, 28, 1, theme.checkBackground, "project check badge");
    requirePixel(c2, 34, 2, theme.checkForeground, "project check mark");

    lp::Canvas c3(64, 64);
    v.projectPercentage = 99;
    r.renderSprintView(c3, v);
    requirePixel(c3, 28, 1, theme.projectFill, "no project badge below 100%");
    std::printf("  Checkmarks at 100%% PASS\n");
  }

  // --- Test 9: percent labels round ---
  {
    requireTrue(lp::LayoutRenderer::percentLabel(42.5) == "43%", "rounds half up");
    requireTrue(lp::LayoutRenderer::percentLabel(42.4) == "42%", "rounds down");
    requireTrue(lp::LayoutRenderer::percentLabel(0) == "0%", "zero");
    std::printf("  Percent labels PASS\n");
  }

  std::printf("\nD3.2 layouts PASS\n");
  return 0;
}
