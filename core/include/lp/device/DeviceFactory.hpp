#pragma once
#include "lp/config/DaemonConfig.hpp"
#include "lp/device/FrameDevice.hpp"

#include <memory>

namespace lp {

// Picks the panel backend: preview window (LED_PREVIEW, GLFW builds),
// mock (LED_MOCK_MODE), else the matrix hardware. Any backend that fails
// init() or is not compiled in falls back to a MockFrameDevice, so this
// never returns null.
std::unique_ptr<FrameDevice> createFrameDevice(const DaemonConfig& cfg);

} // namespace lp
