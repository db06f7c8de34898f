#pragma once
#include "lp/exec/CancellationToken.hpp"

#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace lp {

enum class JoinResult {
  Joined,
  TimedOut,   // thread detached and left running
  NotRunning
};

const char* joinResultName(JoinResult r);

// One background render loop: a thread plus the token it polls. The
// completion state is shared with the thread, so a detached (leaked)
// thread can still be observed finishing.
class RenderTask {
public:
  using Body = std::function<void(CancellationToken&)>;

  // Starts the thread immediately. Exceptions escaping `body` are logged.
  RenderTask(std::string name, Body body);
  ~RenderTask();

  RenderTask(const RenderTask&) = delete;
  RenderTask& operator=(const RenderTask&) = delete;

  const std::string& name() const { return name_; }

  // True once the body has returned (whether joined, detached or not).
  bool isFinished() const;

  // Signals cancellation, then waits up to `timeout` for the body to
  // return. On timeout the thread is detached.
  JoinResult cancelAndJoin(std::chrono::milliseconds timeout);

  // Waits up to `timeout` for the body to return on its own.
  bool waitFinished(std::chrono::milliseconds timeout) const;

private:
  struct Shared {
    CancellationToken token;
    mutable std::mutex mtx;
    mutable std::condition_variable cv;
    bool finished{false};
  };

  std::string name_;
  std::shared_ptr<Shared> shared_;
  std::thread thread_;
};

} // namespace lp
