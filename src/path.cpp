#include "path.hpp"

void Path::Clear() {
  sub_paths_.clear();
}

void Path::MoveTo(const vec2& p) {
  SubPath sub_path;
  sub_path.points.push_back(p);
  sub_paths_.push_back(sub_path);
}

void Path::LineTo(const vec2& p) {
  if (sub_paths_.empty()) {
    MoveTo(p);
    return;
  }

  if (sub_paths_.back().closed) {
    const vec2 start = sub_paths_.back().points.front();
    MoveTo(start);
  }
  sub_paths_.back().points.push_back(p);
}

void Path::Close() {
  if (sub_paths_.empty()) return;
  sub_paths_.back().closed = true;
}
