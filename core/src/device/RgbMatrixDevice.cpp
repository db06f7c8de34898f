#ifdef LP_HAS_RGBMATRIX

#include "lp/device/RgbMatrixDevice.hpp"
#include "lp/debug/Log.hpp"

#include <led-matrix.h>

#include <algorithm>
#include <string>

namespace lp {

RgbMatrixDevice::RgbMatrixDevice(const MatrixConfig& config)
    : config_(config) {}

RgbMatrixDevice::~RgbMatrixDevice() {
  if (matrix_) matrix_->Clear();
}

bool RgbMatrixDevice::init() {
  rgb_matrix::RGBMatrix::Options options;
  options.rows = config_.rows;
  options.cols = config_.cols;
  options.chain_length = config_.chainLength;
  options.parallel = config_.parallel;
  options.brightness = config_.brightness;
  options.pwm_bits = config_.pwmBits;
  options.pwm_lsb_nanoseconds = config_.pwmLsbNanoseconds;
  options.scan_mode = config_.scanMode;
  options.hardware_mapping = config_.hardwareMapping.c_str();
  options.led_rgb_sequence = config_.ledRgbSequence.c_str();
  options.disable_hardware_pulsing = config_.disableHardwarePulsing;

  std::string why;
  if (!options.Validate(&why)) {
    logError("RgbMatrix", "invalid matrix options: %s", why.c_str());
    return false;
  }

  rgb_matrix::RuntimeOptions runtime;
  runtime.gpio_slowdown = config_.gpioSlowdown;

  matrix_.reset(rgb_matrix::RGBMatrix::CreateFromOptions(options, runtime));
  if (!matrix_) {
    logError("RgbMatrix", "CreateFromOptions failed (GPIO access?)");
    return false;
  }

  offscreen_ = matrix_->CreateFrameCanvas();
  logInfo("RgbMatrix", "matrix ready: %dx%d, brightness %d, mapping %s",
          width(), height(), config_.brightness, config_.hardwareMapping.c_str());
  return true;
}

void RgbMatrixDevice::swap(const Canvas& canvas) {
  if (!matrix_ || !offscreen_) return;

  offscreen_->Clear();
  const int w = std::min(canvas.width(), width());
  const int h = std::min(canvas.height(), height());
  for (int y = 0; y < h; y++) {
    for (int x = 0; x < w; x++) {
      Rgb c = canvas.pixel(x, y);
      if (!c.isBlack()) offscreen_->SetPixel(x, y, c.r, c.g, c.b);
    }
  }
  offscreen_ = matrix_->SwapOnVSync(offscreen_);
}

} // namespace lp

#endif // LP_HAS_RGBMATRIX
