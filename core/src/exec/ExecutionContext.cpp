#include "lp/exec/ExecutionContext.hpp"

#include "lp/debug/Log.hpp"
#include "lp/protocol/Params.hpp"
#include "lp/render/StatusScreens.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>
#include <vector>

namespace lp {

namespace {

using Clock = std::chrono::steady_clock;
using std::chrono::milliseconds;

long long elapsedMs(Clock::time_point since) {
  return std::chrono::duration_cast<milliseconds>(Clock::now() - since).count();
}

int secondsToMs(double s) {
  return saturateToInt(s * 1000.0);
}

} // anonymous namespace

ExecutionContext::ExecutionContext(FrameDevice& device, const DaemonConfig& cfg,
                                   const PanelTheme& theme)
    : device_(device), cfg_(cfg), theme_(theme), layout_(&font_, theme_) {
  if (cfg_.fontPath.empty() || !font_.loadFontFile(cfg_.fontPath, cfg_.fontPx)) {
    logWarn("Exec", "font '%s' not loaded, text disabled", cfg_.fontPath.c_str());
  }

  std::string logoPath = cfg_.assetDir + "/discord_logo.png";
  std::string err;
  if (!loadImageFile(logoPath, discordLogo_, err)) {
    logDebug("Exec", "no discord logo: %s", err.c_str());
    discordLogo_ = Image{};
  }
}

ExecutionContext::~ExecutionContext() {
  stopAll();
}

// ---------------------------------------------------------------------------
// Slots
// ---------------------------------------------------------------------------

void ExecutionContext::stopSlot(std::unique_ptr<RenderTask>& slot) {
  std::unique_ptr<RenderTask> task;
  {
    std::lock_guard<std::mutex> lock(slotMtx_);
    task = std::move(slot);
  }
  if (!task) return;

  JoinResult r = task->cancelAndJoin(milliseconds(cfg_.joinTimeoutMs));
  if (r == JoinResult::TimedOut) {
    std::uint64_t n = ++leaked_;
    logWarn("Exec", "render task '%s' did not stop within %d ms; detached (%llu leaked)",
            task->name().c_str(), cfg_.joinTimeoutMs, static_cast<unsigned long long>(n));
  } else if (r == JoinResult::Joined) {
    logDebug("Exec", "render task '%s' stopped", task->name().c_str());
  }
}

void ExecutionContext::stopAll() {
  stopSlot(cycling_);
  stopSlot(simple_);
}

void ExecutionContext::startSimple(const std::string& name, RenderTask::Body body) {
  stopSlot(simple_);
  auto task = std::make_unique<RenderTask>(name, std::move(body));
  std::lock_guard<std::mutex> lock(slotMtx_);
  simple_ = std::move(task);
}

void ExecutionContext::startCycling(const std::string& name, RenderTask::Body body) {
  stopSlot(cycling_);
  auto task = std::make_unique<RenderTask>(name, std::move(body));
  std::lock_guard<std::mutex> lock(slotMtx_);
  cycling_ = std::move(task);
}

int ExecutionContext::activeRenderThreads() const {
  std::lock_guard<std::mutex> lock(slotMtx_);
  int n = 0;
  if (simple_ && !simple_->isFinished()) n++;
  if (cycling_ && !cycling_->isFinished()) n++;
  return n;
}

bool ExecutionContext::simpleTaskRunning() const {
  std::lock_guard<std::mutex> lock(slotMtx_);
  return simple_ && !simple_->isFinished();
}

bool ExecutionContext::cyclingTaskRunning() const {
  std::lock_guard<std::mutex> lock(slotMtx_);
  return cycling_ && !cycling_->isFinished();
}

void ExecutionContext::drawFrame(const std::function<void(Canvas&)>& draw) {
  std::lock_guard<std::mutex> lock(frameMtx_);
  Canvas canvas = device_.createCanvas();
  draw(canvas);
  device_.swap(canvas);
}

// ---------------------------------------------------------------------------
// Dispatch
// ---------------------------------------------------------------------------

RenderOutcome ExecutionContext::execute(const QueueEntry& entry) {
  RenderOutcome out;
  out.sequence = entry.sequence;
  out.kind = entry.command.kind();

  const char* kindName = commandKindName(out.kind);
  logInfo("Exec", "executing #%llu %s (%s)", static_cast<unsigned long long>(entry.sequence),
          kindName, priorityName(entry.priority));

  if (out.kind != CommandKind::ShowUserStoryLayoutCycling) {
    stopAll();
  }

  try {
    dispatch(entry.command);
  } catch (const std::exception& e) {
    out.ok = false;
    out.error = e.what();
    logError("Exec", "%s failed: %s", kindName, e.what());
  }

  if (onOutcome_) onOutcome_(out);
  return out;
}

void ExecutionContext::dispatch(const Command& cmd) {
  const rapidjson::Value& params = cmd.params();
  switch (cmd.kind()) {
    case CommandKind::ShowSymbol:                 showSymbol(params); break;
    case CommandKind::ShowAnimation:              showAnimation(params); break;
    case CommandKind::ShowProgress:               showProgress(params); break;
    case CommandKind::ShowSprintProgress:         showSprintProgress(params); break;
    case CommandKind::ShowSprintHorizontal:       showSprintHorizontal(params); break;
    case CommandKind::ShowSingleLayout:           showSingleLayout(params); break;
    case CommandKind::ShowUserStoryLayout:        showUserStoryLayout(params); break;
    case CommandKind::ShowUserStoryLayoutCycling: showUserStoryLayoutCycling(params); break;
    case CommandKind::ShowGif:                    showGif(params); break;
    case CommandKind::StopAnimation:
      // Both tasks were already stopped; the last frame stays up.
      break;
    case CommandKind::Clear:
      drawFrame([](Canvas&) {});
      break;
    case CommandKind::Test:
      startTestSequence();
      break;
    case CommandKind::ShowConnectedTest:
      drawFrame([this](Canvas& c) { drawConnectedTest(c, &font_, theme_); });
      break;
    case CommandKind::Shutdown:
      if (onShutdown_) onShutdown_();
      break;
  }
}

// ---------------------------------------------------------------------------
// Static screens
// ---------------------------------------------------------------------------

void ExecutionContext::showSymbol(const rapidjson::Value& params) {
  std::string symbol = stringOr(params, "symbol", "");
  std::string canonical;
  if (!canonicalSymbol(symbol, canonical)) {
    throw std::invalid_argument("Unknown symbol: " + symbol);
  }
  const Image* logo = discordLogo_.empty() ? nullptr : &discordLogo_;
  drawFrame([&](Canvas& c) { drawSymbol(c, canonical, theme_, logo); });
}

void ExecutionContext::showProgress(const rapidjson::Value& params) {
  double pct = numberOr(params, "percentage", 0.0);
  drawFrame([&](Canvas& c) { drawProgressBar(c, pct, theme_); });
}

void ExecutionContext::showSprintProgress(const rapidjson::Value& params) {
  SprintViewModel model = sprintViewFromParams(params);
  drawFrame([&](Canvas& c) { layout_.renderSprintView(c, model); });
}

void ExecutionContext::showSprintHorizontal(const rapidjson::Value& params) {
  std::vector<ProgressNode> sprints = sprintRowsFromParams(params);
  drawFrame([&](Canvas& c) { layout_.renderSprintHorizontal(c, sprints); });
}

void ExecutionContext::showUserStoryLayout(const rapidjson::Value& params) {
  UserStoryModel model = userStoryFromParams(params);
  drawFrame([&](Canvas& c) { layout_.renderUserStory(c, model, 0); });
}

// ---------------------------------------------------------------------------
// Async shapes
// ---------------------------------------------------------------------------

void ExecutionContext::showSingleLayout(const rapidjson::Value& params) {
  SingleLayoutModel model = singleLayoutFromParams(params);
  if (!LayoutRenderer::nameScrolls(model)) {
    drawFrame([&](Canvas& c) { layout_.renderSingle(c, model); });
    return;
  }

  startSimple("single_layout", [this, model](CancellationToken& token) {
    int x = device_.width();
    while (!token.isCancelled()) {
      int next = x;
      drawFrame([&](Canvas& c) {
        layout_.renderSingleAt(c, model, x);
        next = layout_.nextScrollX(c, model, x);
      });
      x = next;
      if (token.waitFor(milliseconds(150))) break;
    }
  });
}

void ExecutionContext::showUserStoryLayoutCycling(const rapidjson::Value& params) {
  UserStoryModel model = userStoryFromParams(params);
  double intervalSec = numberOr(params, "cycle_interval", cfg_.defaultCycleIntervalMs / 1000.0);
  int intervalMs = secondsToMs(intervalSec);
  if (intervalMs <= 0) {
    throw std::invalid_argument("cycle_interval must be positive");
  }

  if (model.stories.size() <= 2) {
    stopSlot(cycling_);
    drawFrame([&](Canvas& c) { layout_.renderUserStory(c, model, 0); });
    return;
  }

  logInfo("Exec", "cycling %zu user stories every %d ms", model.stories.size(), intervalMs);
  startCycling("user_story_cycling", [this, model, intervalMs](CancellationToken& token) {
    std::size_t start = 0;
    while (!token.isCancelled()) {
      drawFrame([&](Canvas& c) { layout_.renderUserStory(c, model, start); });
      logDebug("Exec", "cycling: stories %zu-%zu of %zu", start + 1,
               std::min(start + 2, model.stories.size()), model.stories.size());
      if (token.waitFor(milliseconds(intervalMs))) break;
      start += 2;
      if (start >= model.stories.size()) start = 0;
    }
  });
}

bool ExecutionContext::runAnimation(CancellationToken& token, AnimationKind kind,
                                    int durationMs) {
  const int delay = animationFrameDelayMs(kind);
  const Clock::time_point started = Clock::now();
  int frame = 0;
  while (!token.isCancelled()) {
    long long elapsed = elapsedMs(started);
    if (durationMs > 0 && elapsed >= durationMs) return true;

    int percent = durationMs > 0 ? static_cast<int>(elapsed * 100 / durationMs) : 0;
    drawFrame([&](Canvas& c) {
      drawAnimationFrame(c, kind, frame, percent, &font_, theme_);
    });
    frame++;
    if (token.waitFor(milliseconds(delay))) return false;
  }
  return false;
}

void ExecutionContext::showAnimation(const rapidjson::Value& params) {
  std::string name = stringOr(params, "animation", "");
  AnimationKind kind;
  if (!parseAnimationKind(name, kind)) {
    throw std::invalid_argument("Unknown animation: " + name);
  }

  // frame_delay is accepted for compatibility; each animation has its own
  // cadence.
  double durationSec = numberOr(params, "duration", 0.0);
  int durationMs = secondsToMs(durationSec);
  if (kind == AnimationKind::Boot && durationMs <= 0) durationMs = kBootDefaultDurationMs;

  startSimple(name, [this, kind, durationMs](CancellationToken& token) {
    runAnimation(token, kind, durationMs);
  });
}

void ExecutionContext::showGif(const rapidjson::Value& params) {
  std::string name = stringOr(params, "gif_name", "");
  if (name.empty()) {
    throw std::invalid_argument("gif_name is required");
  }
  bool loop = boolOr(params, "loop", true);

  AnimatedImage gif;
  std::string err;
  if (!loadGifFile(cfg_.gifDir + "/" + name + ".gif", gif, err)) {
    throw std::runtime_error(err);
  }
  for (Image& f : gif.frames) {
    f = fitWithin(f, device_.width(), device_.height());
  }
  logInfo("Exec", "gif %s: %zu frames, loop=%s", name.c_str(), gif.frames.size(),
          loop ? "true" : "false");

  startSimple("gif:" + name, [this, gif, loop](CancellationToken& token) {
    std::size_t i = 0;
    while (!token.isCancelled()) {
      drawFrame([&](Canvas& c) { blitCentered(c, gif.frames[i]); });
      if (token.waitFor(milliseconds(gif.delaysMs[i]))) break;
      if (++i >= gif.frames.size()) {
        if (!loop) break;
        i = 0;
      }
    }
  });
}

// ---------------------------------------------------------------------------
// Diagnostic sequence
// ---------------------------------------------------------------------------

void ExecutionContext::startTestSequence() {
  startSimple("test", [this](CancellationToken& token) { runTestSequence(token); });
}

void ExecutionContext::runTestSequence(CancellationToken& token) {
  logInfo("Exec", "test: all on");
  drawFrame([this](Canvas& c) { drawSymbol(c, "all_on", theme_); });
  if (token.waitFor(milliseconds(1500))) return;

  logInfo("Exec", "test: all off");
  drawFrame([](Canvas&) {});
  if (token.waitFor(milliseconds(500))) return;

  static const char* const kSymbols[] = {
    "checkmark", "error", "wifi", "wifi_error", "tunnel", "discord"
  };
  const Image* logo = discordLogo_.empty() ? nullptr : &discordLogo_;
  for (const char* sym : kSymbols) {
    logInfo("Exec", "test: symbol %s", sym);
    drawFrame([&](Canvas& c) { drawSymbol(c, sym, theme_, logo); });
    if (token.waitFor(milliseconds(1000))) return;
  }

  for (int pct = 0; pct <= 100; pct += 25) {
    logInfo("Exec", "test: progress %d%%", pct);
    drawFrame([&](Canvas& c) { drawProgressBar(c, pct, theme_); });
    if (token.waitFor(milliseconds(800))) return;
  }

  logInfo("Exec", "test: boot");
  if (!runAnimation(token, AnimationKind::Boot, 2000)) return;
  if (token.waitFor(milliseconds(500))) return;

  logInfo("Exec", "test: wifi searching");
  if (!runAnimation(token, AnimationKind::WifiSearching, 3000)) return;
  if (token.waitFor(milliseconds(500))) return;

  drawFrame([](Canvas&) {});
  logInfo("Exec", "test sequence complete");
}

} // namespace lp
