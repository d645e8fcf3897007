#ifndef __SHADERS_H__
#define __SHADERS_H__

#include <string>
#include <fstream>
#include <vector>
#include <map>
#include <GL/glew.h>
#include <GLFW/glfw3.h>

using namespace std;

class Shader {
  std::string name_;
  GLuint program_id_ = 0;
  std::map<std::string, GLint> glsl_variables_;
  std::vector<int> buffer_slots_;

  void Load(const std::string&, const std::string&);

 public:
  // Loads <dir>/<name>.vert and <dir>/<name>.frag.
  Shader(const std::string& dir, const std::string& name);
  ~Shader();

  Shader(const Shader&) = delete;
  Shader& operator=(const Shader&) = delete;

  GLint GetUniformId(const std::string&);
  void BindBuffer(const GLuint&, int, int dimension = 3);
  void Clear();

  const GLuint program_id() const { return program_id_; }
};

#endif
