#ifndef __SURFACE_HPP__
#define __SURFACE_HPP__

#include <glm/glm.hpp>

using namespace glm;

// 2D drawing target. Coordinates are pixels with y pointing down, offset by
// the current origin. Paths follow the HTML canvas rules (see Path).
class Surface {
 public:
  virtual ~Surface() {}

  virtual ivec2 GetViewport() const = 0;
  virtual void Resize(int width, int height) = 0;

  virtual void Clear() = 0;
  virtual void SetOrigin(const vec2& origin) = 0;

  virtual void BeginPath() = 0;
  virtual void MoveTo(const vec2& p) = 0;
  virtual void LineTo(const vec2& p) = 0;
  virtual void ClosePath() = 0;
  virtual void Stroke(const vec4& color, float width) = 0;
  virtual void Fill(const vec4& color) = 0;
};

#endif // __SURFACE_HPP__
