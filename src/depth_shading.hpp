#ifndef __DEPTH_SHADING_HPP__
#define __DEPTH_SHADING_HPP__

#include <unordered_map>
#include <glm/glm.hpp>

using namespace std;
using namespace glm;

const int kEdgeSegments = 10;
const float kMinOpacity = 0.1f;
const float kMaxOpacity = 0.7f;
const float kMinThickness = 2.0f;
const float kMaxThickness = 3.0f;

struct DepthRange {
  bool populated = false;
  float min = 0.0f;
  float max = 0.0f;

  void Update(float z);
};

struct DepthStyle {
  float opacity;
  float thickness;
};

// Running depth bounds per dimension. Ranges only ever grow during a
// session, so the shading of an edge settles once the cube has been seen
// from every side.
class DepthShading {
  unordered_map<int, DepthRange> ranges_;

 public:
  DepthShading() {}

  // Widens the range of the dimension with z, then maps z into the style
  // bounds. Nearer (smaller z) gives more opacity and thicker lines.
  DepthStyle Shade(int dimension, float z);

  DepthRange GetRange(int dimension) const;
  void Reset(int dimension);
};

#endif // __DEPTH_SHADING_HPP__
