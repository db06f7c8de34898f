#include "lp/device/PreviewFrameDevice.hpp"

namespace lp {

PreviewFrameDevice::PreviewFrameDevice(int width, int height)
    : width_(width), height_(height) {}

void PreviewFrameDevice::swap(const Canvas& canvas) {
  std::lock_guard<std::mutex> lock(mtx_);
  latest_.assign(canvas.data(), canvas.data() + canvas.sizeBytes());
  fresh_ = true;
}

bool PreviewFrameDevice::takeFrame(std::vector<std::uint8_t>& out) {
  std::lock_guard<std::mutex> lock(mtx_);
  if (!fresh_) return false;
  out = latest_;
  fresh_ = false;
  return true;
}

} // namespace lp
