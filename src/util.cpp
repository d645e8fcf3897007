#include "util.hpp"

#include <boost/algorithm/string.hpp>

void ThrowError(const string& message, const string& detail) {
  throw runtime_error(message + detail);
}

vec4 LoadVec4FromXml(const pugi::xml_node& node) {
  vec4 v;
  try {
    v.x = boost::lexical_cast<float>(node.attribute("x").value());
    v.y = boost::lexical_cast<float>(node.attribute("y").value());
    v.z = boost::lexical_cast<float>(node.attribute("z").value());
    v.w = boost::lexical_cast<float>(node.attribute("w").value());
  } catch (boost::bad_lexical_cast const& e) {
    ThrowError("Invalid vec4 in xml node: ", node.name());
  }
  return v;
}

string LoadStringFromXml(const pugi::xml_node& node) {
  string s = node.text().get();
  boost::algorithm::trim(s);
  return s;
}

int LoadIntFromXml(const pugi::xml_node& node) {
  try {
    return boost::lexical_cast<int>(LoadStringFromXml(node));
  } catch (boost::bad_lexical_cast const& e) {
    ThrowError("Invalid int in xml node: ", node.name());
  }
  return 0;
}

float LoadFloatFromXml(const pugi::xml_node& node) {
  try {
    return boost::lexical_cast<float>(LoadStringFromXml(node));
  } catch (boost::bad_lexical_cast const& e) {
    ThrowError("Invalid float in xml node: ", node.name());
  }
  return 0.0f;
}

bool LoadBoolFromXml(const pugi::xml_node& node) {
  const string s = boost::algorithm::to_lower_copy(LoadStringFromXml(node));
  if (s == "true" || s == "1") return true;
  if (s == "false" || s == "0") return false;
  ThrowError("Invalid bool in xml node: ", node.name());
  return false;
}

int LoadIntFromXmlOr(const pugi::xml_node& node, const string& name,
  int def) {
  pugi::xml_node child = node.child(name.c_str());
  if (!child) return def;
  return LoadIntFromXml(child);
}

float LoadFloatFromXmlOr(const pugi::xml_node& node, const string& name,
  float def) {
  pugi::xml_node child = node.child(name.c_str());
  if (!child) return def;
  return LoadFloatFromXml(child);
}

bool LoadBoolFromXmlOr(const pugi::xml_node& node, const string& name,
  bool def) {
  pugi::xml_node child = node.child(name.c_str());
  if (!child) return def;
  return LoadBoolFromXml(child);
}

string LoadStringFromXmlOr(const pugi::xml_node& node, const string& name,
  const string& def) {
  pugi::xml_node child = node.child(name.c_str());
  if (!child) return def;
  return LoadStringFromXml(child);
}

vec4 LoadVec4FromXmlOr(const pugi::xml_node& node, const string& name,
  const vec4& def) {
  pugi::xml_node child = node.child(name.c_str());
  if (!child) return def;
  return LoadVec4FromXml(child);
}

void AppendXmlAttr(pugi::xml_node& node, const vec4& v) {
  node.append_attribute("x") = boost::lexical_cast<string>(v.x).c_str();
  node.append_attribute("y") = boost::lexical_cast<string>(v.y).c_str();
  node.append_attribute("z") = boost::lexical_cast<string>(v.z).c_str();
  node.append_attribute("w") = boost::lexical_cast<string>(v.w).c_str();
}

void AppendXmlNode(pugi::xml_node& node, const string& name, const vec4& v) {
  pugi::xml_node new_node = node.append_child(name.c_str());
  AppendXmlAttr(new_node, v);
}

void AppendXmlTextNode(pugi::xml_node& node, const string& name,
  const float f) {
  pugi::xml_node new_node = node.append_child(name.c_str());
  string s = boost::lexical_cast<string>(f);
  new_node.append_child(pugi::node_pcdata).set_value(s.c_str());
}

void AppendXmlTextNode(pugi::xml_node& node, const string& name,
  const int i) {
  pugi::xml_node new_node = node.append_child(name.c_str());
  string s = boost::lexical_cast<string>(i);
  new_node.append_child(pugi::node_pcdata).set_value(s.c_str());
}

void AppendXmlTextNode(pugi::xml_node& node, const string& name,
  const string& s) {
  pugi::xml_node new_node = node.append_child(name.c_str());
  new_node.append_child(pugi::node_pcdata).set_value(s.c_str());
}

int Combination(int n, int k) {
  if (k < 0 || k > n) return 0;
  if (k > n - k) k = n - k;

  int result = 1;
  for (int i = 1; i <= k; i++) {
    result = result * (n - k + i) / i;
  }
  return result;
}

float MapRange(float value, float old_min, float old_max, float new_min,
  float new_max) {
  const float old_range = old_max - old_min;
  const float new_range = new_max - new_min;

  // A single sample has no extent to map from.
  if (old_range == 0.0f) return new_max;
  return new_min + (value - old_min) / old_range * new_range;
}
