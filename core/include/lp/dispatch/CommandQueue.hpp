#pragma once
#include "lp/protocol/Command.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <queue>
#include <vector>

namespace lp {

struct QueueEntry {
  Priority priority{Priority::Medium};
  std::uint64_t sequence{0};
  Command command;
};

// Many producers, one consumer. Pops the highest priority first; equal
// priorities come out in submission order (ascending sequence).
class CommandQueue {
public:
  CommandQueue() = default;

  CommandQueue(const CommandQueue&) = delete;
  CommandQueue& operator=(const CommandQueue&) = delete;

  // Returns the sequence number assigned to the command.
  std::uint64_t push(Command cmd);

  // Non-blocking.
  bool tryPop(QueueEntry& out);

  // Waits up to `timeout` for an entry. Returns false on timeout or once
  // close() has been called and the queue is drained.
  bool popFor(QueueEntry& out, std::chrono::milliseconds timeout);

  // Wakes any waiting consumer. Further pushes are still accepted.
  void close();

  std::size_t size() const;
  void clear();

private:
  struct Order {
    bool operator()(const QueueEntry& a, const QueueEntry& b) const {
      if (a.priority != b.priority) {
        return static_cast<int>(a.priority) < static_cast<int>(b.priority);
      }
      return a.sequence > b.sequence;
    }
  };

  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::priority_queue<QueueEntry, std::vector<QueueEntry>, Order> heap_;
  std::uint64_t nextSeq_{1};
  bool closed_{false};
};

} // namespace lp
