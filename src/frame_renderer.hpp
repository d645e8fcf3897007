#ifndef __FRAME_RENDERER_HPP__
#define __FRAME_RENDERER_HPP__

#include <memory>
#include <vector>
#include "config.hpp"
#include "session.hpp"
#include "surface.hpp"

using namespace std;
using namespace glm;

class FrameRenderer {
  shared_ptr<Surface> surface_;
  shared_ptr<Configs> configs_;

  vector<vec4> TransformVertices(Session& session);
  vec2 Project(const vec4& v, const ivec2& viewport);

  void DrawFaces(int dimension, const vector<vec4>& vertices,
    const ivec2& viewport);
  void DrawEdge(const vec4& a, const vec4& b, const ivec2& viewport);
  void DrawShadedEdge(Session& session, const vec4& a, const vec4& b,
    const ivec2& viewport);

 public:
  FrameRenderer(shared_ptr<Surface> surface, shared_ptr<Configs> configs);

  void Draw(Session& session);
};

#endif // __FRAME_RENDERER_HPP__
