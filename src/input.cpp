#include "input.hpp"

#define GLFW_INCLUDE_NONE
#include <GLFW/glfw3.h>

int KeyToDimension(int key) {
  switch (key) {
    case GLFW_KEY_2: return 2;
    case GLFW_KEY_3: return 3;
    case GLFW_KEY_4: return 4;
    default: return 0;
  }
}
