#pragma once
#ifdef LP_HAS_GLFW

#include "lp/device/PreviewFrameDevice.hpp"
#include "lp/gl/ShaderProgram.hpp"

#include <functional>
#include <vector>

struct GLFWwindow;

namespace lp {

// Desktop window that shows a PreviewFrameDevice scaled up with nearest
// filtering. Must be created and run on the main thread.
class PanelPreviewWindow {
public:
  PanelPreviewWindow() = default;
  ~PanelPreviewWindow();

  PanelPreviewWindow(const PanelPreviewWindow&) = delete;
  PanelPreviewWindow& operator=(const PanelPreviewWindow&) = delete;

  bool init(int panelWidth, int panelHeight, int scale = 8);

  // Presents frames until the window is closed or keepRunning() returns
  // false.
  void run(PreviewFrameDevice& device, const std::function<bool()>& keepRunning);

private:
  void upload(const std::vector<std::uint8_t>& rgb);
  void draw();

  GLFWwindow* window_{nullptr};
  int panelW_{0};
  int panelH_{0};
  ShaderProgram prog_;
  GLuint vao_{0};
  GLuint vbo_{0};
  GLuint tex_{0};
};

} // namespace lp

#endif // LP_HAS_GLFW
