#include "lp/dispatch/CommandQueue.hpp"

#include <utility>

namespace lp {

std::uint64_t CommandQueue::push(Command cmd) {
  std::uint64_t seq;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    seq = nextSeq_++;
    QueueEntry e;
    e.priority = cmd.priority();
    e.sequence = seq;
    e.command = std::move(cmd);
    heap_.push(std::move(e));
  }
  cv_.notify_one();
  return seq;
}

bool CommandQueue::tryPop(QueueEntry& out) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (heap_.empty()) return false;
  out = heap_.top();
  heap_.pop();
  return true;
}

bool CommandQueue::popFor(QueueEntry& out, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mtx_);
  cv_.wait_for(lock, timeout, [this] { return !heap_.empty() || closed_; });
  if (heap_.empty()) return false;
  out = heap_.top();
  heap_.pop();
  return true;
}

void CommandQueue::close() {
  {
    std::lock_guard<std::mutex> lock(mtx_);
    closed_ = true;
  }
  cv_.notify_all();
}

std::size_t CommandQueue::size() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return heap_.size();
}

void CommandQueue::clear() {
  std::lock_guard<std::mutex> lock(mtx_);
  while (!heap_.empty()) heap_.pop();
}

} // namespace lp
