#include "lp/device/DeviceFactory.hpp"

#include "lp/debug/Log.hpp"
#include "lp/device/MockFrameDevice.hpp"
#include "lp/device/PreviewFrameDevice.hpp"
#include "lp/device/RgbMatrixDevice.hpp"

namespace lp {

namespace {

std::unique_ptr<FrameDevice> mockDevice(const DaemonConfig& cfg) {
  const int w = cfg.matrix.cols * cfg.matrix.chainLength;
  const int h = cfg.matrix.rows * cfg.matrix.parallel;
  return std::make_unique<MockFrameDevice>(w, h, cfg.snapshotDir);
}

} // anonymous namespace

std::unique_ptr<FrameDevice> createFrameDevice(const DaemonConfig& cfg) {
  if (cfg.preview) {
#ifdef LP_HAS_GLFW
    logInfo("Device", "using preview window backend");
    return std::make_unique<PreviewFrameDevice>(cfg.matrix.cols * cfg.matrix.chainLength,
                                                cfg.matrix.rows * cfg.matrix.parallel);
#else
    logWarn("Device", "preview requested but this build has no GLFW; using mock");
    return mockDevice(cfg);
#endif
  }

  if (cfg.mockMode) {
    logInfo("Device", "mock mode enabled");
    return mockDevice(cfg);
  }

#ifdef LP_HAS_RGBMATRIX
  auto hw = std::make_unique<RgbMatrixDevice>(cfg.matrix);
  if (hw->init()) return hw;
  logError("Device", "matrix init failed; running in mock mode");
#else
  logWarn("Device", "built without rgb-matrix support; running in mock mode");
#endif
  return mockDevice(cfg);
}

} // namespace lp
