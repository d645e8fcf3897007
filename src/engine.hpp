#ifndef __ENGINE_HPP__
#define __ENGINE_HPP__

#include <memory>
#include <GL/glew.h>
#include <GLFW/glfw3.h>
#include "config.hpp"
#include "frame_renderer.hpp"
#include "gl_surface.hpp"
#include "input.hpp"
#include "session.hpp"

using namespace std;
using namespace glm;

class Engine {
  shared_ptr<Configs> configs_;
  shared_ptr<Session> session_;
  shared_ptr<GlSurface> surface_;
  shared_ptr<FrameRenderer> frame_renderer_;
  GLFWwindow* window_;

 public:
  Engine(
    shared_ptr<Configs> configs,
    shared_ptr<Session> session,
    shared_ptr<GlSurface> surface,
    shared_ptr<FrameRenderer> frame_renderer,
    GLFWwindow* window
  );

  void PressKeyCallback(int key, int scancode, int action, int mods);
  void ResizeCallback(int width, int height);

  void Run();
};

#endif
