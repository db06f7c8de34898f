#ifdef LP_HAS_GLFW

#include "lp/gl/ShaderProgram.hpp"
#include "lp/debug/Log.hpp"

#include <vector>

namespace lp {

namespace {

GLuint compileStage(GLenum stage, const char* src) {
  GLuint s = glCreateShader(stage);
  glShaderSource(s, 1, &src, nullptr);
  glCompileShader(s);

  GLint ok = 0;
  glGetShaderiv(s, GL_COMPILE_STATUS, &ok);
  if (ok) return s;

  GLint len = 0;
  glGetShaderiv(s, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> info(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  glGetShaderInfoLog(s, len, nullptr, info.data());
  logError("Shader", "%s stage failed to compile: %s",
           stage == GL_VERTEX_SHADER ? "vertex" : "fragment", info.data());
  glDeleteShader(s);
  return 0;
}

} // anonymous namespace

ShaderProgram::~ShaderProgram() {
  if (program_) glDeleteProgram(program_);
}

bool ShaderProgram::build(const char* vertSrc, const char* fragSrc) {
  GLuint vs = compileStage(GL_VERTEX_SHADER, vertSrc);
  if (!vs) return false;
  GLuint fs = compileStage(GL_FRAGMENT_SHADER, fragSrc);
  if (!fs) {
    glDeleteShader(vs);
    return false;
  }

  program_ = glCreateProgram();
  glAttachShader(program_, vs);
  glAttachShader(program_, fs);
  glLinkProgram(program_);
  glDeleteShader(vs);
  glDeleteShader(fs);

  GLint ok = 0;
  glGetProgramiv(program_, GL_LINK_STATUS, &ok);
  if (ok) return true;

  GLint len = 0;
  glGetProgramiv(program_, GL_INFO_LOG_LENGTH, &len);
  std::vector<char> info(static_cast<std::size_t>(len > 0 ? len : 1), '\0');
  glGetProgramInfoLog(program_, len, nullptr, info.data());
  logError("Shader", "link failed: %s", info.data());
  glDeleteProgram(program_);
  program_ = 0;
  return false;
}

void ShaderProgram::use() const {
  glUseProgram(program_);
}

GLint ShaderProgram::attribLocation(const char* name) const {
  return glGetAttribLocation(program_, name);
}

GLint ShaderProgram::uniformLocation(const char* name) const {
  return glGetUniformLocation(program_, name);
}

void ShaderProgram::setUniformInt(GLint loc, int v) const {
  glUniform1i(loc, v);
}

} // namespace lp

#endif // LP_HAS_GLFW
