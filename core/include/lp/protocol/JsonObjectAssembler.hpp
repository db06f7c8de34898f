#pragma once
#include <cstddef>
#include <string>

namespace lp {

// Accumulates stream bytes until one top-level JSON object is closed.
// The payload carries no length prefix, so completion is detected by
// tracking brace depth outside of string literals.
class JsonObjectAssembler {
public:
  enum class State { Incomplete, Complete, Invalid, TooLarge };

  explicit JsonObjectAssembler(std::size_t maxBytes = 64 * 1024);

  // Feed a chunk. Bytes after the closing brace are ignored.
  State feed(const char* data, std::size_t len);

  State state() const { return state_; }

  // The accumulated object text (valid once state() == Complete).
  const std::string& text() const { return buf_; }

  void reset();

private:
  std::size_t maxBytes_;
  std::string buf_;
  State state_{State::Incomplete};
  int depth_{0};
  bool started_{false};
  bool inString_{false};
  bool escape_{false};
};

} // namespace lp
