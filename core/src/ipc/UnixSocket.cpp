#include "lp/ipc/UnixSocket.hpp"

#include "lp/protocol/JsonObjectAssembler.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/un.h>
#include <unistd.h>

namespace lp {

const char* readStatusName(UnixSocket::ReadStatus s) {
  switch (s) {
    case UnixSocket::ReadStatus::Complete: return "complete";
    case UnixSocket::ReadStatus::Eof:      return "eof";
    case UnixSocket::ReadStatus::Invalid:  return "invalid";
    case UnixSocket::ReadStatus::TooLarge: return "too large";
    case UnixSocket::ReadStatus::Error:    return "error";
  }
  return "unknown";
}

UnixSocket& UnixSocket::operator=(UnixSocket&& other) noexcept {
  if (this != &other) {
    close();
    fd_ = other.fd_;
    other.fd_ = -1;
  }
  return *this;
}

void UnixSocket::close() {
  if (fd_ >= 0) {
    ::close(fd_);
    fd_ = -1;
  }
}

UnixSocket UnixSocket::connectTo(const std::string& path, std::string& error) {
  sockaddr_un addr;
  std::memset(&addr, 0, sizeof(addr));
  if (path.size() >= sizeof(addr.sun_path)) {
    error = "socket path too long: " + path;
    return UnixSocket();
  }
  addr.sun_family = AF_UNIX;
  std::strncpy(addr.sun_path, path.c_str(), sizeof(addr.sun_path) - 1);

  UnixSocket s(::socket(AF_UNIX, SOCK_STREAM, 0));
  if (!s.valid()) {
    error = std::string("socket: ") + std::strerror(errno);
    return UnixSocket();
  }
  if (::connect(s.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
    error = "connect " + path + ": " + std::strerror(errno);
    return UnixSocket();
  }
  return s;
}

bool UnixSocket::setTimeouts(int timeoutMs) {
  timeval tv;
  tv.tv_sec = timeoutMs / 1000;
  tv.tv_usec = (timeoutMs % 1000) * 1000;
  return ::setsockopt(fd_, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) == 0 &&
         ::setsockopt(fd_, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) == 0;
}

bool UnixSocket::writeAll(const std::string& data) {
  std::size_t off = 0;
  while (off < data.size()) {
    ssize_t n = ::send(fd_, data.data() + off, data.size() - off, MSG_NOSIGNAL);
    if (n < 0) {
      if (errno == EINTR) continue;
      return false;
    }
    off += static_cast<std::size_t>(n);
  }
  return true;
}

void UnixSocket::shutdownWrite() {
  if (fd_ >= 0) ::shutdown(fd_, SHUT_WR);
}

UnixSocket::ReadStatus UnixSocket::readObject(std::string& out, std::size_t maxBytes,
                                              std::chrono::milliseconds deadline) {
  using Clock = std::chrono::steady_clock;
  const bool bounded = deadline.count() > 0;
  const Clock::time_point giveUp = Clock::now() + deadline;

  JsonObjectAssembler assembler(maxBytes);
  char buf[4096];
  for (;;) {
    if (bounded) {
      auto left = std::chrono::duration_cast<std::chrono::milliseconds>(giveUp - Clock::now());
      if (left.count() <= 0) {
        out = assembler.text();
        return ReadStatus::Error;
      }
      pollfd pfd;
      pfd.fd = fd_;
      pfd.events = POLLIN;
      pfd.revents = 0;
      int waitMs = static_cast<int>(std::min<long long>(left.count(), 60000));
      int r = ::poll(&pfd, 1, waitMs);
      if (r == 0 || (r < 0 && errno == EINTR)) continue;
      if (r < 0) {
        out = assembler.text();
        return ReadStatus::Error;
      }
    }

    ssize_t n = ::recv(fd_, buf, sizeof(buf), 0);
    if (n < 0) {
      if (errno == EINTR) continue;
      out = assembler.text();
      return ReadStatus::Error;
    }
    if (n == 0) {
      out = assembler.text();
      return ReadStatus::Eof;
    }
    switch (assembler.feed(buf, static_cast<std::size_t>(n))) {
      case JsonObjectAssembler::State::Complete:
        out = assembler.text();
        return ReadStatus::Complete;
      case JsonObjectAssembler::State::Invalid:
        out = assembler.text();
        return ReadStatus::Invalid;
      case JsonObjectAssembler::State::TooLarge:
        out.clear();
        return ReadStatus::TooLarge;
      case JsonObjectAssembler::State::Incomplete:
        break;
    }
  }
}

} // namespace lp
