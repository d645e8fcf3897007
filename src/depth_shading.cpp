#include "depth_shading.hpp"
#include "util.hpp"

#include <algorithm>

void DepthRange::Update(float z) {
  if (!populated) {
    min = z;
    max = z;
    populated = true;
    return;
  }
  min = std::min(min, z);
  max = std::max(max, z);
}

DepthStyle DepthShading::Shade(int dimension, float z) {
  DepthRange& range = ranges_[dimension];
  range.Update(z);

  DepthStyle style;
  style.opacity = MapRange(z, range.max, range.min, kMinOpacity, kMaxOpacity);
  style.thickness = MapRange(z, range.max, range.min, kMinThickness,
    kMaxThickness);
  return style;
}

DepthRange DepthShading::GetRange(int dimension) const {
  auto it = ranges_.find(dimension);
  if (it == ranges_.end()) return DepthRange();
  return it->second;
}

void DepthShading::Reset(int dimension) {
  ranges_.erase(dimension);
}
