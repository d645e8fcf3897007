#include "shaders.hpp"
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace {

string ReadShaderFile(const string& filename) {
  ifstream f(filename, std::ios::in);
  if (!f.good()) {
    throw runtime_error(string("Shader ") + filename + " does not exist.");
  }

  stringstream ss;
  ss << f.rdbuf();
  return ss.str();
}

GLuint CompileShader(GLenum type, const string& filename) {
  const string code = ReadShaderFile(filename);

  cout << "Compiling shader : " << filename << endl;
  GLuint shader_id = glCreateShader(type);
  char const* source_pointer = code.c_str();
  glShaderSource(shader_id, 1, &source_pointer, NULL);
  glCompileShader(shader_id);

  GLint result = GL_FALSE;
  int info_log_length;
  glGetShaderiv(shader_id, GL_COMPILE_STATUS, &result);
  glGetShaderiv(shader_id, GL_INFO_LOG_LENGTH, &info_log_length);
  if (result != GL_TRUE) {
    std::vector<char> error_message(info_log_length + 1);
    if (info_log_length > 0) {
      glGetShaderInfoLog(shader_id, info_log_length, NULL, &error_message[0]);
    }
    glDeleteShader(shader_id);
    throw runtime_error(string("Failed to compile ") + filename + ": " +
      &error_message[0]);
  }
  return shader_id;
}

} // End of namespace

Shader::Shader(const std::string& dir, const std::string& name)
  : name_(name) {
  Load(dir + "/" + name + ".vert", dir + "/" + name + ".frag");
}

Shader::~Shader() {
  if (program_id_) {
    glDeleteProgram(program_id_);
  }
}

void Shader::Load(
  const std::string& vertex_file_path,
  const std::string& fragment_file_path
) {
  GLuint vertex_shader_id = CompileShader(GL_VERTEX_SHADER, vertex_file_path);
  GLuint fragment_shader_id = 0;
  try {
    fragment_shader_id = CompileShader(GL_FRAGMENT_SHADER,
      fragment_file_path);
  } catch (runtime_error const& e) {
    glDeleteShader(vertex_shader_id);
    throw;
  }

  cout << "Linking program " << name_ << endl;
  program_id_ = glCreateProgram();
  glAttachShader(program_id_, vertex_shader_id);
  glAttachShader(program_id_, fragment_shader_id);
  glLinkProgram(program_id_);

  glDetachShader(program_id_, vertex_shader_id);
  glDetachShader(program_id_, fragment_shader_id);
  glDeleteShader(vertex_shader_id);
  glDeleteShader(fragment_shader_id);

  GLint result = GL_FALSE;
  int info_log_length;
  glGetProgramiv(program_id_, GL_LINK_STATUS, &result);
  glGetProgramiv(program_id_, GL_INFO_LOG_LENGTH, &info_log_length);
  if (result != GL_TRUE) {
    std::vector<char> error_message(info_log_length + 1);
    if (info_log_length > 0) {
      glGetProgramInfoLog(program_id_, info_log_length, NULL,
        &error_message[0]);
    }
    glDeleteProgram(program_id_);
    program_id_ = 0;
    throw runtime_error(string("Failed to link program ") + name_ + ": " +
      &error_message[0]);
  }
}

GLint Shader::GetUniformId(const std::string& name) {
  auto it = glsl_variables_.find(name);
  if (it == glsl_variables_.end()) {
    GLint id = glGetUniformLocation(program_id_, name.c_str());
    it = glsl_variables_.insert(std::make_pair(name, id)).first;
  }
  return it->second;
}

void Shader::BindBuffer(const GLuint& buffer_id, int slot, int dimension) {
  glEnableVertexAttribArray(slot);
  glBindBuffer(GL_ARRAY_BUFFER, buffer_id);
  glVertexAttribPointer(slot, dimension, GL_FLOAT, GL_FALSE, 0, (void*) 0);
  buffer_slots_.push_back(slot);
}

void Shader::Clear() {
  for (auto slot : buffer_slots_)
    glDisableVertexAttribArray(slot);
  buffer_slots_.clear();
}
