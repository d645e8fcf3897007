#include "4d.hpp"

#include <algorithm>
#include <cmath>

mat4 GetPlaneRotation(int i, int j, float alpha) {
  float s = sin(alpha);
  float c = cos(alpha);

  // glm is column major: m[col][row].
  mat4 m(1.0f);
  m[i][i] = c;
  m[j][i] = -s;
  m[i][j] = s;
  m[j][j] = c;
  return m;
}

void RotateAroundPlane(const mat4& m, vec4& v) {
  v = m * v;
}

vec4 Rotate(const vec4& v, int dimension, const vector<float>& speeds,
  float time) {
  vec4 result = v;
  int plane = 0;
  for (const auto& p : GetRotationPlanes(dimension)) {
    if (plane >= int(speeds.size())) break;
    float alpha = speeds[plane++] * time / 1000.0f;
    RotateAroundPlane(GetPlaneRotation(p.i, p.j, alpha), result);
  }
  return result;
}

vec4 Translate(const vec4& v) {
  vec4 result = v;
  result.z += kCubeDistZ;
  result.w += kCubeDistW;
  return result;
}

vec3 ToSpace(const vec4& v) {
  if (v.w == 0.0f) {
    return vec3(v.x, v.y, v.z);
  }
  return vec3(v.x, v.y, v.z) / v.w * kCamDistW;
}

vec2 ToPlane(const vec3& v) {
  if (v.z == 0.0f) {
    return vec2(v.x, v.y);
  }
  return vec2(v.x, v.y) / v.z * kCamDistZ;
}

vec2 ToScreen(const vec2& v, const ivec2& viewport) {
  const float s = std::min(viewport.x, viewport.y) / 2.0f;
  return v * s;
}
