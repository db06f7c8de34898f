#pragma once
#include <chrono>
#include <cstddef>
#include <string>

namespace lp {

// Owning wrapper around a Unix stream socket descriptor.
class UnixSocket {
public:
  UnixSocket() = default;
  explicit UnixSocket(int fd) : fd_(fd) {}
  ~UnixSocket() { close(); }

  UnixSocket(const UnixSocket&) = delete;
  UnixSocket& operator=(const UnixSocket&) = delete;
  UnixSocket(UnixSocket&& other) noexcept : fd_(other.fd_) { other.fd_ = -1; }
  UnixSocket& operator=(UnixSocket&& other) noexcept;

  bool valid() const { return fd_ >= 0; }
  int fd() const { return fd_; }
  void close();

  // Connects to `path`. Returns an invalid socket and sets `error` on
  // failure.
  static UnixSocket connectTo(const std::string& path, std::string& error);

  // SO_RCVTIMEO / SO_SNDTIMEO.
  bool setTimeouts(int timeoutMs);

  bool writeAll(const std::string& data);

  // Half-closes the write side so the peer sees EOF.
  void shutdownWrite();

  enum class ReadStatus {
    Complete,  // one full JSON object in `out`
    Eof,       // peer closed first; `out` holds whatever arrived
    Invalid,   // not a JSON object
    TooLarge,
    Error      // read error or timeout
  };

  // Reads until one top-level JSON object has been received. A non-zero
  // `deadline` bounds the whole read, not just each recv (Error when it
  // passes).
  ReadStatus readObject(std::string& out, std::size_t maxBytes,
                        std::chrono::milliseconds deadline = std::chrono::milliseconds(0));

private:
  int fd_{-1};
};

const char* readStatusName(UnixSocket::ReadStatus s);

} // namespace lp
