// D2.2 - Cancellation test
// Tests: token wakes waiters, render task join, bounded join on a stuck
//        body, exceptions inside a body.

#include "lp/exec/CancellationToken.hpp"
#include "lp/exec/RenderTask.hpp"

#include <atomic>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <thread>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

using std::chrono::milliseconds;

int main() {
  // --- Test 1: waitFor returns false on timeout, true once cancelled ---
  {
    lp::CancellationToken tok;
    requireTrue(!tok.isCancelled(), "starts uncancelled");
    requireTrue(!tok.waitFor(milliseconds(10)), "timeout returns false");

    std::thread t([&tok]() {
      std::this_thread::sleep_for(milliseconds(20));
      tok.cancel();
    });
    auto t0 = std::chrono::steady_clock::now();
    requireTrue(tok.waitFor(milliseconds(5000)), "cancel wakes the waiter");
    requireTrue(std::chrono::steady_clock::now() - t0 < milliseconds(2000), "woke promptly");
    t.join();
    requireTrue(tok.waitFor(milliseconds(1000)), "stays cancelled");
    std::printf("  Token PASS\n");
  }

  // --- Test 2: cooperative loop stops on cancelAndJoin ---
  {
    std::atomic<int> frames{0};
    lp::RenderTask task("loop", [&frames](lp::CancellationToken& tok) {
      while (!tok.isCancelled()) {
        frames++;
        if (tok.waitFor(milliseconds(5))) break;
      }
    });
    std::this_thread::sleep_for(milliseconds(30));
    requireTrue(!task.isFinished(), "running until cancelled");
    requireTrue(task.cancelAndJoin(milliseconds(1000)) == lp::JoinResult::Joined, "joined");
    requireTrue(task.isFinished(), "finished after join");
    requireTrue(frames.load() > 0, "loop ran");
    requireTrue(task.cancelAndJoin(milliseconds(10)) == lp::JoinResult::NotRunning,
                "second join is a no-op");
    std::printf("  Cooperative stop PASS\n");
  }

  // --- Test 3: a body that ignores its token is detached after the timeout ---
  {
    std::atomic<bool> release{false};
    lp::RenderTask task("stuck", [&release](lp::CancellationToken&) {
      while (!release.load()) std::this_thread::sleep_for(milliseconds(5));
    });
    auto t0 = std::chrono::steady_clock::now();
    requireTrue(task.cancelAndJoin(milliseconds(50)) == lp::JoinResult::TimedOut, "timed out");
    requireTrue(std::chrono::steady_clock::now() - t0 < milliseconds(1000), "bounded wait");
    requireTrue(!task.isFinished(), "still running after detach");

    release.store(true);
    requireTrue(task.waitFinished(milliseconds(2000)), "detached thread observed finishing");
    std::printf("  Bounded join PASS\n");
  }

  // --- Test 4: body that finishes on its own ---
  {
    lp::RenderTask task("short", [](lp::CancellationToken&) {});
    requireTrue(task.waitFinished(milliseconds(2000)), "finishes by itself");
    requireTrue(task.cancelAndJoin(milliseconds(100)) == lp::JoinResult::Joined, "joins");
    std::printf("  Self-finishing body PASS\n");
  }

  // --- Test 5: exceptions are contained ---
  {
    lp::RenderTask task("throws", [](lp::CancellationToken&) {
      throw std::runtime_error("boom");
    });
    requireTrue(task.waitFinished(milliseconds(2000)), "finished despite throw");
    requireTrue(task.cancelAndJoin(milliseconds(100)) == lp::JoinResult::Joined, "joins");
    std::printf("  Exception containment PASS\n");
  }

  std::printf("\nD2.2 cancellation PASS\n");
  return 0;
}
