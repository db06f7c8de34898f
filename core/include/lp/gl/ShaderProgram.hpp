#pragma once
#ifdef LP_HAS_GLFW

#include <glad/gl.h>

namespace lp {

class ShaderProgram {
public:
  ShaderProgram() = default;
  ~ShaderProgram();

  ShaderProgram(const ShaderProgram&) = delete;
  ShaderProgram& operator=(const ShaderProgram&) = delete;

  // Compile and link. Returns false on failure (errors are logged).
  bool build(const char* vertSrc, const char* fragSrc);

  void use() const;

  GLint attribLocation(const char* name) const;
  GLint uniformLocation(const char* name) const;
  void setUniformInt(GLint loc, int v) const;

  GLuint id() const { return program_; }

private:
  GLuint program_{0};
};

} // namespace lp

#endif // LP_HAS_GLFW
