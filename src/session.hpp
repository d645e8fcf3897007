#ifndef __SESSION_HPP__
#define __SESSION_HPP__

#include <memory>
#include <random>
#include <vector>
#include <glm/glm.hpp>
#include "config.hpp"
#include "depth_shading.hpp"

using namespace std;
using namespace glm;

// State that lives for the whole run: selected dimension, rotation speeds,
// animation clock and depth ranges. Everything else is recomputed per frame.
class Session {
  shared_ptr<Configs> configs_;
  shared_ptr<Preferences> preferences_;

  int dimension_ = kDefaultDimensions;
  vector<float> rotation_speeds_;
  mt19937 generator_;

  double clock_ = 0.0;
  double last_timestamp_ = 0.0;
  bool has_timestamp_ = false;

  DepthShading depth_shading_;

 public:
  Session(shared_ptr<Configs> configs, shared_ptr<Preferences> preferences);

  // Ignores anything outside [kMinDimensions, kMaxDimensions].
  bool SetDimension(int dimension);

  // Per-frame entry point. The first timestamp only sets the reference.
  void Tick(double timestamp);
  void Advance(double delta_time);

  // Clock minus the warm-up delay, never negative.
  float GetClampedTime() const;

  void RollRotationSpeeds();
  void SetRotationSpeeds(const vector<float>& speeds);

  vec4 Transform(const vec4& v) const;

  int dimension() const { return dimension_; }
  double clock() const { return clock_; }
  const vector<float>& rotation_speeds() const { return rotation_speeds_; }
  DepthShading& depth_shading() { return depth_shading_; }
};

#endif // __SESSION_HPP__
