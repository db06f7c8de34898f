#pragma once
#include "lp/device/Canvas.hpp"

namespace lp {

// The panel. Drawing happens on a Canvas obtained from createCanvas();
// swap() presents it.
class FrameDevice {
public:
  virtual ~FrameDevice() = default;

  // Returns false if the hardware could not be brought up.
  virtual bool init() = 0;
  virtual void swap(const Canvas& canvas) = 0;

  virtual int width() const = 0;
  virtual int height() const = 0;
  virtual const char* name() const = 0;
  virtual bool isMock() const { return false; }

  // A cleared canvas sized to the panel.
  Canvas createCanvas() const { return Canvas(width(), height()); }
};

} // namespace lp
