#pragma once
#include "lp/config/DaemonConfig.hpp"
#include "lp/device/FrameDevice.hpp"
#include "lp/dispatch/CommandQueue.hpp"
#include "lp/exec/ExecutionContext.hpp"
#include "lp/ipc/SocketServer.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lp {

// The LED daemon: one socket server feeding one priority queue drained by
// one worker into the execution context.
class Daemon {
public:
  // With no device, one is chosen by createFrameDevice(cfg).
  explicit Daemon(const DaemonConfig& cfg, std::unique_ptr<FrameDevice> device = nullptr);
  ~Daemon();

  Daemon(const Daemon&) = delete;
  Daemon& operator=(const Daemon&) = delete;

  // Decodes one payload and queues it. This is the whole of what a client
  // connection does besides I/O.
  Response handlePayload(const std::string& payload);

  std::uint64_t submit(Command cmd);

  // Starts the worker and, when `listen` is set, the socket server. A
  // stopped daemon cannot be started again.
  bool start(bool listen = true);

  // start(), then blocks until shutdown is requested (shutdown command or
  // SIGINT/SIGTERM), then stop(). Returns false if start() failed.
  bool run();

  // Thread-safe; returns immediately.
  void requestShutdown();
  bool waitForShutdown(std::chrono::milliseconds timeout);

  // Stops the server and the worker, cancels render tasks, blanks the
  // panel. Idempotent.
  void stop();

  bool isRunning() const { return running_.load(); }

  const DaemonConfig& config() const { return cfg_; }
  FrameDevice& device() { return *device_; }
  CommandQueue& queue() { return queue_; }
  ExecutionContext& context() { return *context_; }

  // Most recent outcomes, oldest first.
  std::vector<RenderOutcome> recentOutcomes() const;
  std::size_t outcomeCount() const;
  bool waitForOutcomes(std::size_t count, std::chrono::milliseconds timeout) const;

  // Routes SIGINT and SIGTERM to a flag that run() polls.
  static void installSignalHandlers();
  static bool signalReceived();

private:
  void workerLoop();
  void handleConnection(UnixSocket& client);
  void recordOutcome(const RenderOutcome& outcome);

  static constexpr std::size_t kOutcomeHistory = 64;

  DaemonConfig cfg_;
  std::unique_ptr<FrameDevice> device_;
  CommandQueue queue_;
  std::unique_ptr<ExecutionContext> context_;
  SocketServer server_;

  std::thread worker_;
  std::atomic<bool> running_{false};
  std::atomic<bool> stopped_{false};

  std::mutex stateMtx_;
  std::condition_variable stateCv_;

  mutable std::mutex outcomeMtx_;
  mutable std::condition_variable outcomeCv_;
  std::deque<RenderOutcome> outcomes_;
  std::size_t outcomeTotal_{0};
};

} // namespace lp
