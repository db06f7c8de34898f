#include "lp/protocol/JsonObjectAssembler.hpp"

namespace lp {

JsonObjectAssembler::JsonObjectAssembler(std::size_t maxBytes)
    : maxBytes_(maxBytes) {}

void JsonObjectAssembler::reset() {
  buf_.clear();
  state_ = State::Incomplete;
  depth_ = 0;
  started_ = false;
  inString_ = false;
  escape_ = false;
}

JsonObjectAssembler::State JsonObjectAssembler::feed(const char* data, std::size_t len) {
  if (state_ != State::Incomplete) return state_;

  for (std::size_t i = 0; i < len; i++) {
    char c = data[i];

    if (!started_) {
      if (c == ' ' || c == '\t' || c == '\r' || c == '\n') continue;
      if (c != '{') {
        state_ = State::Invalid;
        return state_;
      }
      started_ = true;
    }

    if (buf_.size() >= maxBytes_) {
      state_ = State::TooLarge;
      return state_;
    }
    buf_.push_back(c);

    if (inString_) {
      if (escape_) {
        escape_ = false;
      } else if (c == '\\') {
        escape_ = true;
      } else if (c == '"') {
        inString_ = false;
      }
      continue;
    }

    if (c == '"') {
      inString_ = true;
    } else if (c == '{' || c == '[') {
      depth_++;
    } else if (c == '}' || c == ']') {
      depth_--;
      if (depth_ == 0) {
        state_ = (c == '}') ? State::Complete : State::Invalid;
        return state_;
      }
      if (depth_ < 0) {
        state_ = State::Invalid;
        return state_;
      }
    }
  }
  return state_;
}

} // namespace lp
