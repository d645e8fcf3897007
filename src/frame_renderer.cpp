#include "frame_renderer.hpp"
#include "4d.hpp"

FrameRenderer::FrameRenderer(shared_ptr<Surface> surface,
  shared_ptr<Configs> configs) : surface_(surface), configs_(configs) {
}

vector<vec4> FrameRenderer::TransformVertices(Session& session) {
  const int dimension = session.dimension();
  vector<vec4> vertices(NumVertices(dimension));
  for (int i = 0; i < NumVertices(dimension); i++) {
    vertices[i] = session.Transform(GetVertex(i, dimension));
  }
  return vertices;
}

vec2 FrameRenderer::Project(const vec4& v, const ivec2& viewport) {
  return ToScreen(ToPlane(ToSpace(v)), viewport);
}

void FrameRenderer::DrawFaces(int dimension, const vector<vec4>& vertices,
  const ivec2& viewport) {
  for (const auto& f : GetFaces(dimension)) {
    surface_->BeginPath();
    surface_->MoveTo(Project(vertices[f.v[0]], viewport));
    surface_->LineTo(Project(vertices[f.v[1]], viewport));
    surface_->LineTo(Project(vertices[f.v[2]], viewport));
    surface_->LineTo(Project(vertices[f.v[3]], viewport));
    surface_->ClosePath();
    surface_->Fill(configs_->face_color);
  }
}

void FrameRenderer::DrawEdge(const vec4& a, const vec4& b,
  const ivec2& viewport) {
  surface_->BeginPath();
  surface_->MoveTo(Project(a, viewport));
  surface_->LineTo(Project(b, viewport));
  surface_->Stroke(configs_->edge_color, configs_->line_width);
}

// The edge is split in 3D space, after the 4D projection, and every piece
// is shaded by the depth of its first point.
void FrameRenderer::DrawShadedEdge(Session& session, const vec4& a,
  const vec4& b, const ivec2& viewport) {
  const vec3 a3 = ToSpace(a);
  const vec3 b3 = ToSpace(b);
  const vec3 step = (b3 - a3) / float(kEdgeSegments);

  for (int i = 0; i < kEdgeSegments; i++) {
    vec3 c = a3 + step * float(i);
    vec3 d = a3 + step * float(i + 1);
    DepthStyle style = session.depth_shading().Shade(session.dimension(), c.z);

    surface_->BeginPath();
    surface_->MoveTo(ToScreen(ToPlane(c), viewport));
    surface_->LineTo(ToScreen(ToPlane(d), viewport));
    surface_->Stroke(vec4(vec3(configs_->edge_color), style.opacity),
      style.thickness);
  }
}

void FrameRenderer::Draw(Session& session) {
  const ivec2 viewport = surface_->GetViewport();
  surface_->Clear();
  surface_->SetOrigin(vec2(viewport) / 2.0f);

  const int dimension = session.dimension();
  vector<vec4> vertices = TransformVertices(session);

  if (configs_->fill_faces) {
    DrawFaces(dimension, vertices, viewport);
  }

  for (const auto& e : GetEdges(dimension)) {
    if (configs_->shading) {
      DrawShadedEdge(session, vertices[e.a], vertices[e.b], viewport);
    } else {
      DrawEdge(vertices[e.a], vertices[e.b], viewport);
    }
  }
}
