#include "lp/exec/RenderTask.hpp"

#include "lp/debug/Log.hpp"

#include <exception>
#include <utility>

namespace lp {

const char* joinResultName(JoinResult r) {
  switch (r) {
    case JoinResult::Joined:     return "joined";
    case JoinResult::TimedOut:   return "timed out";
    case JoinResult::NotRunning: return "not running";
  }
  return "unknown";
}

RenderTask::RenderTask(std::string name, Body body)
    : name_(std::move(name)), shared_(std::make_shared<Shared>()) {
  std::shared_ptr<Shared> shared = shared_;
  std::string taskName = name_;
  thread_ = std::thread([shared, taskName, body]() {
    try {
      body(shared->token);
    } catch (const std::exception& e) {
      logError("RenderTask", "%s failed: %s", taskName.c_str(), e.what());
    }
    {
      std::lock_guard<std::mutex> lock(shared->mtx);
      shared->finished = true;
    }
    shared->cv.notify_all();
  });
}

RenderTask::~RenderTask() {
  if (thread_.joinable()) {
    JoinResult r = cancelAndJoin(std::chrono::milliseconds(1000));
    if (r == JoinResult::TimedOut) {
      logWarn("RenderTask", "%s still running at destruction, detached", name_.c_str());
    }
  }
}

bool RenderTask::isFinished() const {
  std::lock_guard<std::mutex> lock(shared_->mtx);
  return shared_->finished;
}

bool RenderTask::waitFinished(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(shared_->mtx);
  return shared_->cv.wait_for(lock, timeout, [this] { return shared_->finished; });
}

JoinResult RenderTask::cancelAndJoin(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) return JoinResult::NotRunning;

  shared_->token.cancel();
  if (!waitFinished(timeout)) {
    thread_.detach();
    return JoinResult::TimedOut;
  }
  thread_.join();
  return JoinResult::Joined;
}

} // namespace lp
