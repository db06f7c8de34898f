#pragma once
#include "lp/device/FrameDevice.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>

namespace lp {

// Stand-in for the panel: every swap is logged and retained, and
// optionally written to `snapshotDir` as frame_NNNNNN.png.
class MockFrameDevice : public FrameDevice {
public:
  MockFrameDevice(int width, int height, std::string snapshotDir = {});

  bool init() override { return true; }
  void swap(const Canvas& canvas) override;

  int width() const override { return width_; }
  int height() const override { return height_; }
  const char* name() const override { return "mock"; }
  bool isMock() const override { return true; }

  std::uint64_t frameCount() const;
  Canvas lastFrame() const;

  // Blocks until at least `count` frames have been swapped in total.
  bool waitForFrames(std::uint64_t count, std::chrono::milliseconds timeout) const;

private:
  int width_;
  int height_;
  std::string snapshotDir_;

  mutable std::mutex mtx_;
  mutable std::condition_variable cv_;
  Canvas last_;
  std::uint64_t frames_{0};
};

} // namespace lp
