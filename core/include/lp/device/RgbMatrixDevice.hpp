#pragma once
#include "lp/config/DaemonConfig.hpp"
#include "lp/device/FrameDevice.hpp"

#ifdef LP_HAS_RGBMATRIX

#include <memory>

namespace rgb_matrix {
class RGBMatrix;
class FrameCanvas;
}

namespace lp {

// HUB75 panel driven through the rpi-rgb-led-matrix library.
class RgbMatrixDevice : public FrameDevice {
public:
  explicit RgbMatrixDevice(const MatrixConfig& config);
  ~RgbMatrixDevice() override;

  RgbMatrixDevice(const RgbMatrixDevice&) = delete;
  RgbMatrixDevice& operator=(const RgbMatrixDevice&) = delete;

  bool init() override;
  void swap(const Canvas& canvas) override;

  int width() const override { return config_.cols * config_.chainLength; }
  int height() const override { return config_.rows * config_.parallel; }
  const char* name() const override { return "rgb-matrix"; }

private:
  MatrixConfig config_;
  std::unique_ptr<rgb_matrix::RGBMatrix> matrix_;
  rgb_matrix::FrameCanvas* offscreen_{nullptr};
};

} // namespace lp

#endif // LP_HAS_RGBMATRIX
