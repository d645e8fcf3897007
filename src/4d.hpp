#ifndef __4D_HPP__
#define __4D_HPP__

#include <vector>
#include <glm/glm.hpp>
#include "hypercube.hpp"

using namespace std;
using namespace glm;

// Camera distances along z and w. The cube is pushed 2.5 camera distances
// away on both axes so that it sits in front of the projection origin.
const float kCamDistZ = 2.0f;
const float kCamDistW = 2.0f;
const float kCubeDistZ = kCamDistZ * 2.5f;
const float kCubeDistW = kCamDistW * 2.5f;

// Rotation by alpha radians in the plane spanned by axes i and j:
// v[i]' = v[i] cos - v[j] sin, v[j]' = v[i] sin + v[j] cos.
mat4 GetPlaneRotation(int i, int j, float alpha);

void RotateAroundPlane(const mat4& m, vec4& v);

// Rotates v through every rotation plane of the dimension in row-major order,
// one plane after the other. Plane p turns by speeds[p] * time / 1000 radians,
// with time in milliseconds.
vec4 Rotate(const vec4& v, int dimension, const vector<float>& speeds,
  float time);

vec4 Translate(const vec4& v);

// 4D -> 3D. Bypassed when w is exactly zero.
vec3 ToSpace(const vec4& v);

// 3D -> 2D. Bypassed when z is exactly zero.
vec2 ToPlane(const vec3& v);

// 2D -> screen pixels, relative to the viewport center.
vec2 ToScreen(const vec2& v, const ivec2& viewport);

#endif // __4D_HPP__
