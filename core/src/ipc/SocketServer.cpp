#include "lp/ipc/SocketServer.hpp"

#include "lp/debug/Log.hpp"

#include <cerrno>
#include <cstring>
#include <exception>
#include <poll.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

namespace lp {

bool ensureParentDirectory(const std::string& path) {
  std::string::size_type slash = path.find_last_of('/');
  if (slash == std::string::npos || slash == 0) return true;
  std::string dir = path.substr(0, slash);

  for (std::string::size_type pos = 1; pos != std::string::npos;) {
    pos = dir.find('/', pos);
    std::string part = (pos == std::string::npos) ? dir : dir.substr(0, pos);
    if (::mkdir(part.c_str(), 0755) != 0 && errno != EEXIST) {
      logError("SocketServer", "mkdir %s: %s", part.c_str(), std::strerror(errno));
      return false;
    }
    if (pos != std::string::npos) pos++;
  }
  return true;
}

SocketServer::SocketServer(const SocketServerConfig& config) : config_(config) {}

SocketServer::~SocketServer() { stop(); }

bool SocketServer::start(Handler handler) {
  if (running_.load()) return true;

  sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  if (config_.path.size() >= sizeof(addr.sun_path)) {
    logError("SocketServer", "socket path too long: %s", config_.path.c_str());
    return false;
  }
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, config_.path.c_str(), sizeof(addr.sun_path) - 1);

  if (!ensureParentDirectory(config_.path)) return false;
  if (::unlink(config_.path.c_str()) != 0 && errno != ENOENT) {
    logWarn("SocketServer", "unlink %s: %s", config_.path.c_str(), std::strerror(errno));
  }

  UnixSocket listener(::socket(AF_UNIX, SOCK_STREAM, 0));
  if (!listener.valid()) {
    logError("SocketServer", "socket: %s", std::strerror(errno));
    return false;
  }
  if (::bind(listener.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    logError("SocketServer", "bind %s: %s", config_.path.c_str(), std::strerror(errno));
    return false;
  }
  if (::chmod(config_.path.c_str(), static_cast<mode_t>(config_.mode)) != 0) {
    logWarn("SocketServer", "chmod %s: %s", config_.path.c_str(), std::strerror(errno));
  }
  if (::listen(listener.fd(), config_.backlog) != 0) {
    logError("SocketServer", "listen: %s", std::strerror(errno));
    ::unlink(config_.path.c_str());
    return false;
  }

  listener_ = std::move(listener);
  handler_ = std::move(handler);
  running_.store(true);
  acceptThread_ = std::thread(&SocketServer::acceptLoop, this);
  logInfo("SocketServer", "listening on %s", config_.path.c_str());
  return true;
}

void SocketServer::stop() {
  bool wasRunning = running_.exchange(false);
  if (acceptThread_.joinable()) acceptThread_.join();
  if (!wasRunning) return;

  {
    std::unique_lock<std::mutex> lock(flightMtx_);
    if (!clientFds_.empty()) {
      logInfo("SocketServer", "closing %zu open connection(s)", clientFds_.size());
    }
    // The fds stay open until their handler erases them, so none of these
    // can have been reused.
    for (int fd : clientFds_) ::shutdown(fd, SHUT_RDWR);
    flightCv_.wait(lock, [this] { return inFlight_ == 0; });
  }

  listener_.close();
  if (::unlink(config_.path.c_str()) != 0 && errno != ENOENT) {
    logWarn("SocketServer", "unlink %s: %s", config_.path.c_str(), std::strerror(errno));
  }
  logInfo("SocketServer", "stopped, %s removed", config_.path.c_str());
}

int SocketServer::inFlight() const {
  std::lock_guard<std::mutex> lock(flightMtx_);
  return inFlight_;
}

void SocketServer::acceptLoop() {
  while (running_.load()) {
    pollfd pfd;
    pfd.fd = listener_.fd();
    pfd.events = POLLIN;
    pfd.revents = 0;

    int r = ::poll(&pfd, 1, config_.acceptPollMs);
    if (r < 0) {
      if (errno == EINTR) continue;
      logError("SocketServer", "poll: %s", std::strerror(errno));
      break;
    }
    if (r == 0 || !(pfd.revents & POLLIN)) continue;

    UnixSocket client(::accept(listener_.fd(), nullptr, nullptr));
    if (!client.valid()) {
      if (errno != EINTR && errno != EAGAIN) {
        logWarn("SocketServer", "accept: %s", std::strerror(errno));
      }
      continue;
    }

    const int fd = client.fd();
    {
      std::lock_guard<std::mutex> lock(flightMtx_);
      inFlight_++;
      clientFds_.insert(fd);
    }
    std::thread([this, fd](UnixSocket c) {
      try {
        handler_(c);
      } catch (const std::exception& e) {
        logError("SocketServer", "connection handler failed: %s", e.what());
      }
      // Notify under the lock: once stop() sees zero it may destroy us.
      std::lock_guard<std::mutex> lock(flightMtx_);
      clientFds_.erase(fd);
      c.close();
      inFlight_--;
      flightCv_.notify_all();
    }, std::move(client)).detach();
  }
}

} // namespace lp
