#pragma once
#include <cstdint>

namespace lp {

struct Rgb {
  std::uint8_t r{0};
  std::uint8_t g{0};
  std::uint8_t b{0};

  bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
  bool operator!=(const Rgb& o) const { return !(*this == o); }
  bool isBlack() const { return r == 0 && g == 0 && b == 0; }
};

} // namespace lp
