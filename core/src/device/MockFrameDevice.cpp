#include "lp/device/MockFrameDevice.hpp"

#include "lp/debug/Log.hpp"
#include "lp/export/FrameSnapshot.hpp"

#include <cstdio>
#include <utility>

namespace lp {

MockFrameDevice::MockFrameDevice(int width, int height, std::string snapshotDir)
    : width_(width), height_(height), snapshotDir_(std::move(snapshotDir)),
      last_(width, height) {}

void MockFrameDevice::swap(const Canvas& canvas) {
  std::uint64_t frameNo;
  {
    std::lock_guard<std::mutex> lock(mtx_);
    last_ = canvas;
    frameNo = ++frames_;
  }
  cv_.notify_all();

  logDebug("MockDevice", "swap #%llu (%zu lit pixels)",
           static_cast<unsigned long long>(frameNo), canvas.litPixelCount());

  if (!snapshotDir_.empty()) {
    char file[32];
    std::snprintf(file, sizeof(file), "frame_%06llu.png",
                  static_cast<unsigned long long>(frameNo));
    std::string path = snapshotDir_ + "/" + file;
    if (!writeCanvasPNG(path, canvas)) {
      logWarn("MockDevice", "could not write snapshot %s", path.c_str());
    }
  }
}

std::uint64_t MockFrameDevice::frameCount() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return frames_;
}

Canvas MockFrameDevice::lastFrame() const {
  std::lock_guard<std::mutex> lock(mtx_);
  return last_;
}

bool MockFrameDevice::waitForFrames(std::uint64_t count, std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(mtx_);
  return cv_.wait_for(lock, timeout, [&] { return frames_ >= count; });
}

} // namespace lp
