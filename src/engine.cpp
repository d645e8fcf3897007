#include "engine.hpp"

#include <iostream>

Engine::Engine(
  shared_ptr<Configs> configs,
  shared_ptr<Session> session,
  shared_ptr<GlSurface> surface,
  shared_ptr<FrameRenderer> frame_renderer,
  GLFWwindow* window
) : configs_(configs),
    session_(session),
    surface_(surface),
    frame_renderer_(frame_renderer),
    window_(window) {
}

void Engine::PressKeyCallback(int key, int scancode, int action, int mods) {
  if (action != GLFW_PRESS) return;

  if (key == GLFW_KEY_ESCAPE) {
    glfwSetWindowShouldClose(window_, GLFW_TRUE);
    return;
  }

  int dimension = KeyToDimension(key);
  if (dimension != 0) {
    session_->SetDimension(dimension);
  }
}

void Engine::ResizeCallback(int width, int height) {
  // Minimized windows report a zero sized framebuffer.
  if (width == 0 || height == 0) return;
  surface_->Resize(width, height);
}

void Engine::Run() {
  GLint major_version, minor_version;
  glGetIntegerv(GL_MAJOR_VERSION, &major_version);
  glGetIntegerv(GL_MINOR_VERSION, &minor_version);
  cout << "Open GL version is " << major_version << "." << minor_version
    << endl;

  int frames = 0;
  double next_print_time = glfwGetTime();
  do {
    frames++;

    double current_time = glfwGetTime();
    if (current_time >= next_print_time) {
      cout << 1000.0 / double(frames) << " ms / frame" << endl;
      next_print_time = current_time + 1.0;
      frames = 0;
    }

    session_->Tick(current_time * 1000.0);
    frame_renderer_->Draw(*session_);

    glfwSwapBuffers(window_);
    glfwPollEvents();
  } while (glfwWindowShouldClose(window_) == 0);
}
