#include "gl_surface.hpp"

#include <glm/gtc/matrix_transform.hpp>

GlSurface::GlSurface(shared_ptr<Configs> configs, int width, int height)
  : configs_(configs), width_(width), height_(height) {
  shader_ = unique_ptr<Shader>(new Shader(configs_->shaders_dir, "polygon"));

  glGenVertexArrays(1, &vao_);
  glGenBuffers(1, &vbo_);
  Resize(width, height);
}

GlSurface::~GlSurface() {
  glDeleteBuffers(1, &vbo_);
  glDeleteVertexArrays(1, &vao_);
}

ivec2 GlSurface::GetViewport() const {
  return ivec2(width_, height_);
}

void GlSurface::Resize(int width, int height) {
  width_ = width;
  height_ = height;
  projection_ = ortho(0.0f, float(width_), 0.0f, float(height_));
  glViewport(0, 0, width_, height_);
}

void GlSurface::Clear() {
  const vec4& c = configs_->clear_color;
  glClearColor(c.x, c.y, c.z, c.w);
  glClear(GL_COLOR_BUFFER_BIT);
  path_.Clear();
}

void GlSurface::SetOrigin(const vec2& origin) {
  origin_ = origin;
}

void GlSurface::BeginPath() {
  path_.Clear();
}

void GlSurface::MoveTo(const vec2& p) {
  path_.MoveTo(p);
}

void GlSurface::LineTo(const vec2& p) {
  path_.LineTo(p);
}

void GlSurface::ClosePath() {
  path_.Close();
}

// Surface coordinates grow downwards, OpenGL window coordinates upwards.
vec3 GlSurface::ToWindow(const vec2& p) const {
  vec2 q = origin_ + p;
  return vec3(q.x, height_ - q.y, 0);
}

void GlSurface::DrawTriangles(const vector<vec3>& vertices,
  const vec4& color) {
  if (vertices.empty()) return;

  glBindVertexArray(vao_);
  glDisable(GL_DEPTH_TEST);
  glDisable(GL_CULL_FACE);
  glEnable(GL_BLEND);
  glBlendFunc(GL_SRC_ALPHA, GL_ONE_MINUS_SRC_ALPHA);
  glUseProgram(shader_->program_id());

  glUniform4f(shader_->GetUniformId("lineColor"), color.x, color.y, color.z,
    color.w);
  glUniformMatrix4fv(shader_->GetUniformId("projection"), 1, GL_FALSE,
    &projection_[0][0]);

  glBindBuffer(GL_ARRAY_BUFFER, vbo_);
  glBufferData(GL_ARRAY_BUFFER, vertices.size() * sizeof(vec3), &vertices[0],
    GL_DYNAMIC_DRAW);
  shader_->BindBuffer(vbo_, 0, 3);

  glDrawArrays(GL_TRIANGLES, 0, vertices.size());

  shader_->Clear();
  glDisable(GL_BLEND);
  glBindVertexArray(0);
}

void GlSurface::Stroke(const vec4& color, float width) {
  const float s = width / 2.0f;

  vector<vec3> triangles;
  for (const auto& sub_path : path_.sub_paths()) {
    vector<vec2> points = sub_path.points;
    if (sub_path.closed && points.size() > 2) {
      points.push_back(points.front());
    }

    for (int i = 0; i + 1 < int(points.size()); i++) {
      vec2 p1 = points[i];
      vec2 p2 = points[i + 1];
      if (p1 == p2) continue;

      // Each segment becomes a quad of the line width.
      vec2 step = normalize(p2 - p1);
      vec2 n = s * vec2(-step.y, step.x);

      vector<vec3> v {
        ToWindow(p1 + n), ToWindow(p1 - n),
        ToWindow(p2 + n), ToWindow(p2 - n)
      };
      triangles.insert(triangles.end(), { v[0], v[1], v[2], v[2], v[1], v[3] });
    }
  }
  DrawTriangles(triangles, color);
}

void GlSurface::Fill(const vec4& color) {
  vector<vec3> triangles;
  for (const auto& sub_path : path_.sub_paths()) {
    const vector<vec2>& points = sub_path.points;
    if (points.size() < 3) continue;

    // Fan around the first point. Projected faces are convex quads.
    for (int i = 1; i + 1 < int(points.size()); i++) {
      triangles.push_back(ToWindow(points[0]));
      triangles.push_back(ToWindow(points[i]));
      triangles.push_back(ToWindow(points[i + 1]));
    }
  }
  DrawTriangles(triangles, color);
}
