#pragma once
#include <chrono>
#include <condition_variable>
#include <mutex>

namespace lp {

// Cooperative stop signal for one render loop. Loops use waitFor() as
// their inter-frame delay so a cancel wakes them immediately.
class CancellationToken {
public:
  CancellationToken() = default;

  CancellationToken(const CancellationToken&) = delete;
  CancellationToken& operator=(const CancellationToken&) = delete;

  void cancel();
  bool isCancelled() const;

  // Blocks for up to `d`. Returns true if cancelled.
  bool waitFor(std::chrono::milliseconds d);

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  bool cancelled_{false};
};

} // namespace lp
