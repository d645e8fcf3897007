#include "config.hpp"
#include "util.hpp"

#include <boost/filesystem.hpp>
#include <pugixml.hpp>

shared_ptr<Configs> LoadConfigs(const string& directory,
  const string& filename) {
  shared_ptr<Configs> configs = make_shared<Configs>();

  boost::filesystem::path p = boost::filesystem::path(directory) / filename;
  const string xml_filename = p.string();
  if (!boost::filesystem::exists(p)) {
    cout << "No config at " << xml_filename << ", using defaults" << endl;
    try {
      SaveConfigs(*configs, xml_filename);
    } catch (runtime_error const& e) {
      cerr << "ERROR::CONFIG: " << e.what() << endl;
    }
    return configs;
  }

  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_file(xml_filename.c_str());
  if (!result) {
    ThrowError("Could not load xml file: ", xml_filename);
  }

  const pugi::xml_node& xml = doc.child("xml");
  if (!xml) {
    ThrowError("Missing <xml> root in config: ", xml_filename);
  }

  configs->window_width = LoadIntFromXmlOr(xml, "window-width",
    configs->window_width);
  configs->window_height = LoadIntFromXmlOr(xml, "window-height",
    configs->window_height);
  configs->fullscreen = LoadBoolFromXmlOr(xml, "fullscreen",
    configs->fullscreen);
  configs->shading = LoadBoolFromXmlOr(xml, "shading", configs->shading);
  configs->fill_faces = LoadBoolFromXmlOr(xml, "fill-faces",
    configs->fill_faces);
  configs->reset_on_dimension_change = LoadBoolFromXmlOr(xml,
    "reset-on-dimension-change", configs->reset_on_dimension_change);
  configs->max_rotation_speed = LoadFloatFromXmlOr(xml, "max-rotation-speed",
    configs->max_rotation_speed);
  configs->warmup_delay = LoadFloatFromXmlOr(xml, "warmup-delay",
    configs->warmup_delay);
  configs->rotation_seed = LoadIntFromXmlOr(xml, "rotation-seed",
    configs->rotation_seed);
  configs->line_width = LoadFloatFromXmlOr(xml, "line-width",
    configs->line_width);
  configs->edge_color = LoadVec4FromXmlOr(xml, "edge-color",
    configs->edge_color);
  configs->face_color = LoadVec4FromXmlOr(xml, "face-color",
    configs->face_color);
  configs->clear_color = LoadVec4FromXmlOr(xml, "clear-color",
    configs->clear_color);
  configs->preferences_file = LoadStringFromXmlOr(xml, "preferences-file",
    configs->preferences_file);
  configs->shaders_dir = LoadStringFromXmlOr(xml, "shaders-dir",
    configs->shaders_dir);

  cout << "Loaded config: " << xml_filename << endl;
  return configs;
}

void SaveConfigs(const Configs& configs, const string& xml_filename) {
  pugi::xml_document doc;
  pugi::xml_node xml = doc.append_child("xml");
  AppendXmlTextNode(xml, "window-width", configs.window_width);
  AppendXmlTextNode(xml, "window-height", configs.window_height);
  AppendXmlTextNode(xml, "fullscreen",
    string(configs.fullscreen ? "true" : "false"));
  AppendXmlTextNode(xml, "shading",
    string(configs.shading ? "true" : "false"));
  AppendXmlTextNode(xml, "fill-faces",
    string(configs.fill_faces ? "true" : "false"));
  AppendXmlTextNode(xml, "reset-on-dimension-change",
    string(configs.reset_on_dimension_change ? "true" : "false"));
  AppendXmlTextNode(xml, "max-rotation-speed", configs.max_rotation_speed);
  AppendXmlTextNode(xml, "warmup-delay", configs.warmup_delay);
  AppendXmlTextNode(xml, "rotation-seed", configs.rotation_seed);
  AppendXmlTextNode(xml, "line-width", configs.line_width);
  AppendXmlNode(xml, "edge-color", configs.edge_color);
  AppendXmlNode(xml, "face-color", configs.face_color);
  AppendXmlNode(xml, "clear-color", configs.clear_color);
  AppendXmlTextNode(xml, "preferences-file", configs.preferences_file);
  AppendXmlTextNode(xml, "shaders-dir", configs.shaders_dir);

  if (!doc.save_file(xml_filename.c_str())) {
    ThrowError("Could not save config: ", xml_filename);
  }
  cout << "Saved config: " << xml_filename << endl;
}

Preferences::Preferences(const string& filename) : filename_(filename) {
}

int Preferences::LoadDimension() const {
  if (!boost::filesystem::exists(filename_)) {
    return kDefaultDimensions;
  }

  pugi::xml_document doc;
  pugi::xml_parse_result result = doc.load_file(filename_.c_str());
  if (!result) {
    cerr << "ERROR::PREFERENCES: Could not parse " << filename_ << endl;
    return kDefaultDimensions;
  }

  pugi::xml_node xml_node = doc.child("xml").child("dimension");
  if (!xml_node) return kDefaultDimensions;

  int dimension = 0;
  try {
    dimension = LoadIntFromXml(xml_node);
  } catch (runtime_error const& e) {
    cerr << "ERROR::PREFERENCES: " << e.what() << endl;
    return kDefaultDimensions;
  }

  if (!IsValidDimension(dimension)) {
    return kDefaultDimensions;
  }
  return dimension;
}

bool Preferences::SaveDimension(int dimension) {
  pugi::xml_document doc;
  pugi::xml_node xml = doc.append_child("xml");
  AppendXmlTextNode(xml, "dimension", dimension);

  if (!doc.save_file(filename_.c_str())) {
    cerr << "ERROR::PREFERENCES: Could not save " << filename_ << endl;
    return false;
  }
  return true;
}
