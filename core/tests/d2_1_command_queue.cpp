// D2.1 - Priority queue test
// Tests: drain order by priority then submission, timed pop, close,
//        concurrent producers.

#include "lp/dispatch/CommandQueue.hpp"
#include "lp/protocol/CommandBuilders.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <thread>
#include <vector>

static void requireTrue(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "ASSERT FAIL: %s\n", msg);
    std::exit(1);
  }
}

int main() {
  // --- Test 1: strict priority, FIFO among equals ---
  {
    lp::CommandQueue q;
    q.push(lp::makeShowProgress(10, lp::Priority::Low));      // 1
    q.push(lp::makeShowSymbol("x", lp::Priority::Medium));    // 2
    q.push(lp::makeClear(lp::Priority::High));                // 3
    q.push(lp::makeShowProgress(20, lp::Priority::Low));      // 4
    q.push(lp::makeShowSymbol("w", lp::Priority::Medium));    // 5
    q.push(lp::makeStopAnimation(lp::Priority::High));        // 6
    requireTrue(q.size() == 6, "six queued");

    const std::uint64_t expected[] = {3, 6, 2, 5, 1, 4};
    for (std::uint64_t seq : expected) {
      lp::QueueEntry e;
      requireTrue(q.tryPop(e), "pop succeeds");
      requireTrue(e.sequence == seq, "drain order");
      requireTrue(e.priority == e.command.priority(), "entry priority matches command");
    }
    lp::QueueEntry e;
    requireTrue(!q.tryPop(e), "empty afterwards");
    std::printf("  Drain order PASS\n");
  }

  // --- Test 2: sequence numbers are monotonic ---
  {
    lp::CommandQueue q;
    std::uint64_t a = q.push(lp::makeClear());
    std::uint64_t b = q.push(lp::makeClear());
    requireTrue(b > a, "monotonic");
    q.clear();
    requireTrue(q.size() == 0, "clear empties");
    requireTrue(q.push(lp::makeClear()) > b, "still monotonic after clear");
    std::printf("  Sequence PASS\n");
  }

  // --- Test 3: popFor times out, then wakes on push ---
  {
    lp::CommandQueue q;
    lp::QueueEntry e;
    auto t0 = std::chrono::steady_clock::now();
    requireTrue(!q.popFor(e, std::chrono::milliseconds(50)), "times out when empty");
    auto waited = std::chrono::steady_clock::now() - t0;
    requireTrue(waited >= std::chrono::milliseconds(40), "waited roughly the timeout");

    std::thread producer([&q]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      q.push(lp::makeShowSymbol("dot"));
    });
    requireTrue(q.popFor(e, std::chrono::milliseconds(2000)), "woken by push");
    requireTrue(e.command.kind() == lp::CommandKind::ShowSymbol, "got the pushed command");
    producer.join();
    std::printf("  Timed pop PASS\n");
  }

  // --- Test 4: close wakes a waiting consumer ---
  {
    lp::CommandQueue q;
    std::thread closer([&q]() {
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
      q.close();
    });
    lp::QueueEntry e;
    auto t0 = std::chrono::steady_clock::now();
    requireTrue(!q.popFor(e, std::chrono::milliseconds(5000)), "close returns false");
    requireTrue(std::chrono::steady_clock::now() - t0 < std::chrono::milliseconds(2000),
                "close wakes promptly");
    closer.join();
    std::printf("  Close PASS\n");
  }

  // --- Test 5: many producers, each producer's order preserved ---
  {
    lp::CommandQueue q;
    const int kProducers = 4, kEach = 50;
    std::vector<std::thread> ts;
    for (int p = 0; p < kProducers; p++) {
      ts.emplace_back([&q, p]() {
        for (int i = 0; i < kEach; i++) {
          q.push(lp::makeShowProgress(p * 1000 + i, lp::Priority::Medium));
        }
      });
    }
    for (auto& t : ts) t.join();
    requireTrue(q.size() == static_cast<std::size_t>(kProducers * kEach), "all queued");

    int last[kProducers] = {-1, -1, -1, -1};
    std::uint64_t prevSeq = 0;
    lp::QueueEntry e;
    while (q.tryPop(e)) {
      requireTrue(e.sequence > prevSeq, "ascending sequence among equals");
      prevSeq = e.sequence;
      int v = static_cast<int>(e.command.params()["percentage"].GetDouble());
      int p = v / 1000, i = v % 1000;
      requireTrue(i > last[p], "per-producer FIFO");
      last[p] = i;
    }
    std::printf("  Concurrent producers PASS\n");
  }

  std::printf("\nD2.1 command queue PASS\n");
  return 0;
}
