#ifndef __CONFIG_HPP__
#define __CONFIG_HPP__

#include <memory>
#include <string>
#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>
#include "hypercube.hpp"

#define APP_NAME "tesseract"
#define WINDOW_WIDTH 1024
#define WINDOW_HEIGHT 768

using namespace std;
using namespace glm;

struct Configs {
  int window_width = WINDOW_WIDTH;
  int window_height = WINDOW_HEIGHT;
  bool fullscreen = false;

  // Rendering variants.
  bool shading = true;
  bool fill_faces = true;

  // Re-roll rotation speeds and clear the depth range of the new dimension
  // whenever the selected dimension changes.
  bool reset_on_dimension_change = false;

  // Speeds are drawn from [-max_rotation_speed / 2, max_rotation_speed / 2]
  // in radians per second.
  float max_rotation_speed = glm::pi<float>() / 4.0f;

  // Milliseconds before the rotation starts.
  float warmup_delay = 100.0f;

  // Zero seeds from std::random_device.
  int rotation_seed = 0;

  float line_width = 2.0f;
  vec4 edge_color = vec4(0, 0, 0, 1);
  vec4 face_color = vec4(0, 40.0f / 255.0f, 70.0f / 255.0f, 0.04f);
  vec4 clear_color = vec4(1, 1, 1, 1);

  string preferences_file = "preferences.xml";
  string shaders_dir = "shaders";
};

// Reads <directory>/<filename>. A missing file gives the defaults, which are
// written back to that path for editing. A file that exists but does not
// parse throws.
shared_ptr<Configs> LoadConfigs(const string& directory,
  const string& filename);

void SaveConfigs(const Configs& configs, const string& xml_filename);

// Persists the last selected dimension across runs.
class Preferences {
  string filename_;

 public:
  Preferences(const string& filename);

  // Falls back to kDefaultDimensions when the file is missing, unreadable
  // or holds an invalid dimension.
  int LoadDimension() const;
  bool SaveDimension(int dimension);
};

#endif // __CONFIG_HPP__
