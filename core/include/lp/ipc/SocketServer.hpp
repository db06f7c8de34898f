#pragma once
#include "lp/ipc/UnixSocket.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <set>
#include <string>
#include <thread>

namespace lp {

struct SocketServerConfig {
  std::string path{"/tmp/led-manager.sock"};
  int backlog{5};
  unsigned mode{0666};
  int acceptPollMs{200};
};

// Listens on a Unix stream socket and hands each accepted connection to
// `handler` on its own short-lived thread. The connection is closed when
// the handler returns; the handler must not close it itself.
class SocketServer {
public:
  using Handler = std::function<void(UnixSocket& client)>;

  explicit SocketServer(const SocketServerConfig& config);
  ~SocketServer();

  SocketServer(const SocketServer&) = delete;
  SocketServer& operator=(const SocketServer&) = delete;

  // Creates the parent directory if needed, replaces any stale socket file,
  // binds, listens and starts the accept thread.
  bool start(Handler handler);

  // Stops accepting, shuts down every open client connection, waits for
  // their handlers to return, closes the listener and unlinks the socket
  // file. No handler runs after stop() returns.
  void stop();

  bool isRunning() const { return running_.load(); }
  const std::string& path() const { return config_.path; }
  int inFlight() const;

private:
  void acceptLoop();

  SocketServerConfig config_;
  Handler handler_;
  UnixSocket listener_;
  std::thread acceptThread_;
  std::atomic<bool> running_{false};

  mutable std::mutex flightMtx_;
  std::condition_variable flightCv_;
  int inFlight_{0};
  std::set<int> clientFds_;
};

// mkdir -p for the directory part of `path`. True if it exists afterwards.
bool ensureParentDirectory(const std::string& path);

} // namespace lp
