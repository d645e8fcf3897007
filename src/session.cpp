#include "session.hpp"
#include "4d.hpp"

#include <algorithm>
#include <iostream>

Session::Session(shared_ptr<Configs> configs,
  shared_ptr<Preferences> preferences) : configs_(configs),
  preferences_(preferences) {
  if (configs_->rotation_seed != 0) {
    generator_.seed(configs_->rotation_seed);
  } else {
    random_device rd;
    generator_.seed(rd());
  }

  RollRotationSpeeds();

  if (preferences_) {
    dimension_ = preferences_->LoadDimension();
  }
  cout << "Dimension: " << dimension_ << endl;
}

bool Session::SetDimension(int dimension) {
  if (!IsValidDimension(dimension)) {
    cerr << "ERROR::SESSION: Invalid dimension " << dimension << endl;
    return false;
  }

  if (configs_->reset_on_dimension_change && dimension != dimension_) {
    RollRotationSpeeds();
    depth_shading_.Reset(dimension);
  }

  dimension_ = dimension;
  if (preferences_) {
    preferences_->SaveDimension(dimension);
  }
  cout << "Dimension: " << dimension_ << endl;
  return true;
}

void Session::Tick(double timestamp) {
  double delta_time = 0.0;
  if (has_timestamp_) {
    delta_time = timestamp - last_timestamp_;
  }
  last_timestamp_ = timestamp;
  has_timestamp_ = true;
  Advance(delta_time);
}

void Session::Advance(double delta_time) {
  clock_ += delta_time;
}

float Session::GetClampedTime() const {
  return float(std::max(0.0, clock_ - configs_->warmup_delay));
}

void Session::RollRotationSpeeds() {
  const float range = configs_->max_rotation_speed;
  uniform_real_distribution<float> dist(-range / 2.0f, range / 2.0f);

  rotation_speeds_.resize(NumRotationPlanes(kMaxDimensions));
  for (auto& speed : rotation_speeds_) {
    speed = dist(generator_);
  }
}

void Session::SetRotationSpeeds(const vector<float>& speeds) {
  rotation_speeds_ = speeds;
  rotation_speeds_.resize(NumRotationPlanes(kMaxDimensions), 0.0f);
}

vec4 Session::Transform(const vec4& v) const {
  return Translate(Rotate(v, dimension_, rotation_speeds_, GetClampedTime()));
}
