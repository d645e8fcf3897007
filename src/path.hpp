#ifndef __PATH_HPP__
#define __PATH_HPP__

#include <vector>
#include <glm/glm.hpp>

using namespace std;
using namespace glm;

struct SubPath {
  vector<vec2> points;
  bool closed = false;
};

// Polyline builder with HTML canvas path rules. LineTo on an empty path acts
// as MoveTo, and LineTo after Close starts a new subpath at the first point
// of the closed one.
class Path {
  vector<SubPath> sub_paths_;

 public:
  void Clear();
  void MoveTo(const vec2& p);
  void LineTo(const vec2& p);
  void Close();

  const vector<SubPath>& sub_paths() const { return sub_paths_; }
};

#endif // __PATH_HPP__
