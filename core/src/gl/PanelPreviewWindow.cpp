#ifdef LP_HAS_GLFW

#include "lp/gl/PanelPreviewWindow.hpp"
#include "lp/debug/Log.hpp"

#include <glad/gl.h>
#include <GLFW/glfw3.h>

#include <chrono>
#include <thread>

namespace lp {

namespace {

const char* kVert = R"(#version 330 core
in vec2 a_pos;
out vec2 v_uv;
void main() {
  v_uv = vec2((a_pos.x + 1.0) * 0.5, (1.0 - a_pos.y) * 0.5);
  gl_Position = vec4(a_pos, 0.0, 1.0);
}
)";

const char* kFrag = R"(#version 330 core
in vec2 v_uv;
uniform sampler2D u_frame;
out vec4 o_color;
void main() {
  o_color = vec4(texture(u_frame, v_uv).rgb, 1.0);
}
)";

} // anonymous namespace

PanelPreviewWindow::~PanelPreviewWindow() {
  if (window_) {
    if (tex_) glDeleteTextures(1, &tex_);
    if (vbo_) glDeleteBuffers(1, &vbo_);
    if (vao_) glDeleteVertexArrays(1, &vao_);
    glfwDestroyWindow(window_);
  }
  glfwTerminate();
}

bool PanelPreviewWindow::init(int panelWidth, int panelHeight, int scale) {
  if (!glfwInit()) {
    logError("Preview", "glfwInit failed");
    return false;
  }

  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GLFW_TRUE);
  glfwWindowHint(GLFW_RESIZABLE, GLFW_FALSE);

  window_ = glfwCreateWindow(panelWidth * scale, panelHeight * scale,
                             "LED panel preview", nullptr, nullptr);
  if (!window_) {
    logError("Preview", "glfwCreateWindow failed");
    return false;
  }
  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  if (!gladLoadGL((GLADloadfunc)glfwGetProcAddress)) {
    logError("Preview", "gladLoadGL failed");
    glfwDestroyWindow(window_);
    window_ = nullptr;
    return false;
  }

  if (!prog_.build(kVert, kFrag)) return false;

  panelW_ = panelWidth;
  panelH_ = panelHeight;

  const float quad[] = {-1.f, -1.f, 1.f, -1.f, -1.f, 1.f, 1.f, 1.f};
  glGenVertexArrays(1, &vao_);
  glBindVertexArray(vao_);
  glGenBuffers(1, &vbo_);
  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  glBufferData(GL_ARRAY_BUFFER, sizeof(quad), quad, GL_STATIC_DRAW);
  GLint posLoc = prog_.attribLocation("a_pos");
  glEnableVertexAttribArray(static_cast<GLuint>(posLoc));
  glVertexAttribPointer(static_cast<GLuint>(posLoc), 2, GL_FLOAT, GL_FALSE, 0, nullptr);

  glGenTextures(1, &tex_);
  glBindTexture(GL_TEXTURE_2D, tex_);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_NEAREST);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);

  std::vector<std::uint8_t> black(static_cast<std::size_t>(panelW_) * panelH_ * 3, 0);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGB8, panelW_, panelH_, 0, GL_RGB,
               GL_UNSIGNED_BYTE, black.data());

  logInfo("Preview", "preview window %dx%d (x%d)", panelW_, panelH_, scale);
  return true;
}

void PanelPreviewWindow::upload(const std::vector<std::uint8_t>& rgb) {
  if (rgb.size() < static_cast<std::size_t>(panelW_) * panelH_ * 3) return;
  glBindTexture(GL_TEXTURE_2D, tex_);
  glTexSubImage2D(GL_TEXTURE_2D, 0, 0, 0, panelW_, panelH_, GL_RGB,
                  GL_UNSIGNED_BYTE, rgb.data());
}

void PanelPreviewWindow::draw() {
  int fbW = 0, fbH = 0;
  glfwGetFramebufferSize(window_, &fbW, &fbH);
  glViewport(0, 0, fbW, fbH);
  glClearColor(0.f, 0.f, 0.f, 1.f);
  glClear(GL_COLOR_BUFFER_BIT);

  prog_.use();
  glActiveTexture(GL_TEXTURE0);
  glBindTexture(GL_TEXTURE_2D, tex_);
  prog_.setUniformInt(prog_.uniformLocation("u_frame"), 0);
  glBindVertexArray(vao_);
  glDrawArrays(GL_TRIANGLE_STRIP, 0, 4);
  glfwSwapBuffers(window_);
}

void PanelPreviewWindow::run(PreviewFrameDevice& device,
                             const std::function<bool()>& keepRunning) {
  if (!window_) return;

  std::vector<std::uint8_t> frame;
  while (!glfwWindowShouldClose(window_) && keepRunning()) {
    glfwPollEvents();
    if (device.takeFrame(frame)) upload(frame);
    draw();
    std::this_thread::sleep_for(std::chrono::milliseconds(16));
  }
}

} // namespace lp

#endif // LP_HAS_GLFW
