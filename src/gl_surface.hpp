#ifndef __GL_SURFACE_HPP__
#define __GL_SURFACE_HPP__

#include <memory>
#include <vector>
#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include <glm/glm.hpp>
#include "config.hpp"
#include "path.hpp"
#include "shaders.hpp"
#include "surface.hpp"

using namespace std;
using namespace glm;

// Surface backed by the current OpenGL context. Paths are accumulated on the
// CPU and turned into triangles on Stroke and Fill.
class GlSurface : public Surface {
  shared_ptr<Configs> configs_;
  unique_ptr<Shader> shader_;
  GLuint vao_ = 0;
  GLuint vbo_ = 0;
  int width_;
  int height_;
  mat4 projection_;
  vec2 origin_ = vec2(0);
  Path path_;

  vec3 ToWindow(const vec2& p) const;
  void DrawTriangles(const vector<vec3>& vertices, const vec4& color);

 public:
  GlSurface(shared_ptr<Configs> configs, int width, int height);
  ~GlSurface();

  ivec2 GetViewport() const override;
  void Resize(int width, int height) override;

  void Clear() override;
  void SetOrigin(const vec2& origin) override;

  void BeginPath() override;
  void MoveTo(const vec2& p) override;
  void LineTo(const vec2& p) override;
  void ClosePath() override;
  void Stroke(const vec4& color, float width) override;
  void Fill(const vec4& color) override;
};

#endif // __GL_SURFACE_HPP__
