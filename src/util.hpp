#ifndef __UTIL_HPP__
#define __UTIL_HPP__

#include <stdio.h>
#include <iostream>
#include <exception>
#include <stdexcept>
#include <memory>
#include <string>
#include <vector>
#include <glm/glm.hpp>
#include <boost/lexical_cast.hpp>
#include "pugixml.hpp"

using namespace std;
using namespace glm;

void ThrowError(const string& message, const string& detail);

vec4 LoadVec4FromXml(const pugi::xml_node& node);
string LoadStringFromXml(const pugi::xml_node& node);

int LoadIntFromXml(const pugi::xml_node& node);
float LoadFloatFromXml(const pugi::xml_node& node);
bool LoadBoolFromXml(const pugi::xml_node& node);

int LoadIntFromXmlOr(const pugi::xml_node& node, const string& name, int def);
float LoadFloatFromXmlOr(const pugi::xml_node& node, const string& name, float def);
bool LoadBoolFromXmlOr(const pugi::xml_node& node, const string& name, bool def);
string LoadStringFromXmlOr(const pugi::xml_node& node, const string& name, const string& def);
vec4 LoadVec4FromXmlOr(const pugi::xml_node& node, const string& name, const vec4& def);

void AppendXmlAttr(pugi::xml_node& node, const vec4& v);
void AppendXmlNode(pugi::xml_node& node, const string& name, const vec4& v);
void AppendXmlTextNode(pugi::xml_node& node, const string& name, const float f);
void AppendXmlTextNode(pugi::xml_node& node, const string& name, const int i);
void AppendXmlTextNode(pugi::xml_node& node, const string& name,
  const string& s);

int Combination(int n, int k);

// Maps value linearly from [old_min, old_max] onto [new_min, new_max]. The
// source interval may be inverted (old_min > old_max).
float MapRange(float value, float old_min, float old_max, float new_min,
  float new_max);

#endif // __UTIL_HPP__
