#pragma once
#include "lp/device/FrameDevice.hpp"

#include <cstdint>
#include <mutex>
#include <vector>

namespace lp {

// Holds the most recent frame for a desktop preview window to pick up.
// Swaps come from render threads; takeFrame() is called from the window's
// (main) thread.
class PreviewFrameDevice : public FrameDevice {
public:
  PreviewFrameDevice(int width, int height);

  bool init() override { return true; }
  void swap(const Canvas& canvas) override;

  int width() const override { return width_; }
  int height() const override { return height_; }
  const char* name() const override { return "preview"; }

  // Copies the latest RGB frame into `out` if one arrived since the last
  // call.
  bool takeFrame(std::vector<std::uint8_t>& out);

private:
  int width_;
  int height_;
  std::mutex mtx_;
  std::vector<std::uint8_t> latest_;
  bool fresh_{false};
};

} // namespace lp
