#include <iostream>
#include <boost/filesystem.hpp>
#include "config.hpp"
#include "engine.hpp"
#include "frame_renderer.hpp"
#include "gl_surface.hpp"
#include "session.hpp"

shared_ptr<Configs> configs = nullptr;
shared_ptr<Preferences> preferences = nullptr;
shared_ptr<Session> session = nullptr;
shared_ptr<GlSurface> surface = nullptr;
shared_ptr<FrameRenderer> frame_renderer = nullptr;
shared_ptr<Engine> engine = nullptr;

int window_width_ = WINDOW_WIDTH;
int window_height_ = WINDOW_HEIGHT;
GLFWwindow* window_;

void PressKeyCallback(GLFWwindow* window, int key, int scancode, int action,
  int mods) {
  engine->PressKeyCallback(key, scancode, action, mods);
}

void ResizeCallback(GLFWwindow* window, int width, int height) {
  engine->ResizeCallback(width, height);
}

void InitOpenGl() {
  if (!glfwInit()) {
    throw runtime_error("Failed to initialize GLFW");
  }

  glfwWindowHint(GLFW_SAMPLES, 4);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MAJOR, 3);
  glfwWindowHint(GLFW_CONTEXT_VERSION_MINOR, 3);
  glfwWindowHint(GLFW_OPENGL_PROFILE, GLFW_OPENGL_CORE_PROFILE);

  // To make MacOS happy; should not be needed.
  glfwWindowHint(GLFW_OPENGL_FORWARD_COMPAT, GL_TRUE);

  GLFWmonitor* monitor = configs->fullscreen ? glfwGetPrimaryMonitor() : NULL;
  window_ = glfwCreateWindow(window_width_, window_height_, APP_NAME,
    monitor, NULL);

  if (window_ == NULL) {
    glfwTerminate();
    throw runtime_error("Failed to open GLFW window");
  }

  // On retina screens the framebuffer is larger than the window.
  glfwGetFramebufferSize(window_, &window_width_, &window_height_);
  glfwMakeContextCurrent(window_);
  glfwSwapInterval(1);

  // Needed for core profile.
  glewExperimental = true;
  if (glewInit() != GLEW_OK) {
    glfwTerminate();
    throw runtime_error("Failed to initialize GLEW");
  }
}

// GL objects must go before the context.
void Cleanup() {
  engine = nullptr;
  frame_renderer = nullptr;
  surface = nullptr;
  glfwTerminate();
}

int main() {
  const string resources_dir = "resources";

  try {
    configs = LoadConfigs(resources_dir, "config.xml");
    window_width_ = configs->window_width;
    window_height_ = configs->window_height;

    InitOpenGl();

    boost::filesystem::path preferences_path =
      boost::filesystem::path(resources_dir) / configs->preferences_file;
    preferences = make_shared<Preferences>(preferences_path.string());

    session = make_shared<Session>(configs, preferences);
    surface = make_shared<GlSurface>(configs, window_width_, window_height_);
    frame_renderer = make_shared<FrameRenderer>(surface, configs);
    engine = make_shared<Engine>(configs, session, surface, frame_renderer,
      window_);

    glfwSetKeyCallback(window_, PressKeyCallback);
    glfwSetFramebufferSizeCallback(window_, ResizeCallback);

    engine->Run();
  } catch (runtime_error const& e) {
    cerr << "ERROR::MAIN: " << e.what() << endl;
    Cleanup();
    return 1;
  }

  Cleanup();
  return 0;
}
