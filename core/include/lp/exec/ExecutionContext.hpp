#pragma once
#include "lp/config/DaemonConfig.hpp"
#include "lp/device/FrameDevice.hpp"
#include "lp/dispatch/CommandQueue.hpp"
#include "lp/exec/RenderTask.hpp"
#include "lp/layout/LayoutRenderer.hpp"
#include "lp/render/Animations.hpp"
#include "lp/render/BitmapFont.hpp"
#include "lp/render/ImageDecoder.hpp"
#include "lp/style/PanelTheme.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace lp {

// Owns what is on the panel. Runs dequeued commands one at a time (from the
// worker thread) and holds at most one "simple" render task (animations,
// GIFs, scrolling text, the test sequence) and one "cycling" task (user
// story rotation).
//
// Every command except show_user_story_layout_cycling first cancels and
// joins both tasks. The cycling command replaces only the previous cycling
// task.
class ExecutionContext {
public:
  using OutcomeListener = std::function<void(const RenderOutcome&)>;
  using ShutdownHandler = std::function<void()>;

  ExecutionContext(FrameDevice& device, const DaemonConfig& cfg,
                   const PanelTheme& theme = PanelTheme{});
  ~ExecutionContext();

  ExecutionContext(const ExecutionContext&) = delete;
  ExecutionContext& operator=(const ExecutionContext&) = delete;

  // Called after every execute(), on the worker thread.
  void setOutcomeListener(OutcomeListener fn) { onOutcome_ = std::move(fn); }
  // Called when a shutdown command is executed.
  void setShutdownHandler(ShutdownHandler fn) { onShutdown_ = std::move(fn); }

  // Never throws: failures come back as ok=false.
  RenderOutcome execute(const QueueEntry& entry);

  // Cancels and joins both tasks.
  void stopAll();

  // Tasks in either slot whose body has not returned yet.
  int activeRenderThreads() const;
  bool simpleTaskRunning() const;
  bool cyclingTaskRunning() const;

  // Threads detached after failing to stop within the join timeout.
  std::uint64_t leakedCount() const { return leaked_.load(); }

  const BitmapFont& font() const { return font_; }
  const LayoutRenderer& layout() const { return layout_; }

  // Draws one frame onto a fresh canvas and swaps it, holding the frame
  // lock throughout.
  void drawFrame(const std::function<void(Canvas&)>& draw);

private:
  void dispatch(const Command& cmd);

  void showSymbol(const rapidjson::Value& params);
  void showAnimation(const rapidjson::Value& params);
  void showProgress(const rapidjson::Value& params);
  void showSprintProgress(const rapidjson::Value& params);
  void showSprintHorizontal(const rapidjson::Value& params);
  void showSingleLayout(const rapidjson::Value& params);
  void showUserStoryLayout(const rapidjson::Value& params);
  void showUserStoryLayoutCycling(const rapidjson::Value& params);
  void showGif(const rapidjson::Value& params);
  void startTestSequence();

  // Loops `kind` until cancelled or `durationMs` (<= 0: forever) elapses.
  // Returns false if cancelled.
  bool runAnimation(CancellationToken& token, AnimationKind kind, int durationMs);
  void runTestSequence(CancellationToken& token);

  void startSimple(const std::string& name, RenderTask::Body body);
  void startCycling(const std::string& name, RenderTask::Body body);
  void stopSlot(std::unique_ptr<RenderTask>& slot);

  FrameDevice& device_;
  DaemonConfig cfg_;
  PanelTheme theme_;
  BitmapFont font_;
  LayoutRenderer layout_;
  Image discordLogo_;

  std::mutex frameMtx_;

  mutable std::mutex slotMtx_;
  std::unique_ptr<RenderTask> simple_;
  std::unique_ptr<RenderTask> cycling_;
  std::atomic<std::uint64_t> leaked_{0};

  OutcomeListener onOutcome_;
  ShutdownHandler onShutdown_;
};

} // namespace lp
