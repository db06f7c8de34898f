#include "lp/exec/CancellationToken.hpp"

namespace lp {

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    cancelled_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::isCancelled() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return cancelled_;
}

bool CancellationToken::waitFor(std::chrono::milliseconds d) {
  std::unique_lock<std::mutex> lock(mtx_);
  return cv_.wait_for(lock, d, [this] { return cancelled_; });
}

} // namespace lp
