#include <iostream>
#include "gtest/gtest.h"
#include "gmock/gmock.h"
#include "util.hpp"

using namespace std;

namespace {

TEST(Combination, ShouldSucceeed) {
  EXPECT_EQ(1, Combination(2, 2));
  EXPECT_EQ(3, Combination(3, 2));
  EXPECT_EQ(6, Combination(4, 2));
  EXPECT_EQ(10, Combination(5, 3));
  EXPECT_EQ(1, Combination(4, 0));
  EXPECT_EQ(0, Combination(2, 3));
}

TEST(MapRange, ShouldSucceeed) {
  EXPECT_FLOAT_EQ(5.0f, MapRange(0.5f, 0.0f, 1.0f, 0.0f, 10.0f));
  EXPECT_FLOAT_EQ(2.0f, MapRange(1.0f, 1.0f, 3.0f, 2.0f, 3.0f));
  EXPECT_FLOAT_EQ(3.0f, MapRange(3.0f, 1.0f, 3.0f, 2.0f, 3.0f));

  // Inverted source interval.
  EXPECT_FLOAT_EQ(0.7f, MapRange(1.0f, 3.0f, 1.0f, 0.1f, 0.7f));
  EXPECT_FLOAT_EQ(0.1f, MapRange(3.0f, 3.0f, 1.0f, 0.1f, 0.7f));
}

TEST(MapRange, DegenerateRange) {
  EXPECT_FLOAT_EQ(0.7f, MapRange(2.0f, 2.0f, 2.0f, 0.1f, 0.7f));
}

TEST(Xml, LoadValues) {
  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string(
    "<xml>"
    "  <count> 12 </count>"
    "  <ratio>0.25</ratio>"
    "  <enabled>True</enabled>"
    "  <name>  tesseract </name>"
    "  <color x=\"1\" y=\"2\" z=\"3\" w=\"4\" />"
    "</xml>"));
  pugi::xml_node xml = doc.child("xml");

  EXPECT_EQ(12, LoadIntFromXml(xml.child("count")));
  EXPECT_FLOAT_EQ(0.25f, LoadFloatFromXml(xml.child("ratio")));
  EXPECT_TRUE(LoadBoolFromXml(xml.child("enabled")));
  EXPECT_EQ("tesseract", LoadStringFromXml(xml.child("name")));
  EXPECT_EQ(vec4(1, 2, 3, 4), LoadVec4FromXml(xml.child("color")));

  EXPECT_EQ(5, LoadIntFromXmlOr(xml, "missing", 5));
  EXPECT_FALSE(LoadBoolFromXmlOr(xml, "missing", false));
  EXPECT_EQ(12, LoadIntFromXmlOr(xml, "count", 5));
}

TEST(Xml, InvalidValuesThrow) {
  pugi::xml_document doc;
  ASSERT_TRUE(doc.load_string(
    "<xml><count>many</count><flag>yes</flag><color x=\"1\" /></xml>"));
  pugi::xml_node xml = doc.child("xml");

  EXPECT_THROW(LoadIntFromXml(xml.child("count")), runtime_error);
  EXPECT_THROW(LoadFloatFromXml(xml.child("count")), runtime_error);
  EXPECT_THROW(LoadBoolFromXml(xml.child("flag")), runtime_error);
  EXPECT_THROW(LoadVec4FromXml(xml.child("color")), runtime_error);
}

TEST(Xml, AppendNodes) {
  pugi::xml_document doc;
  pugi::xml_node xml = doc.append_child("xml");
  AppendXmlTextNode(xml, "dimension", 3);
  AppendXmlTextNode(xml, "delay", 12.5f);
  AppendXmlTextNode(xml, "file", string("a.xml"));
  AppendXmlNode(xml, "color", vec4(0.5, 0, 1, 0.25));

  EXPECT_EQ(3, LoadIntFromXml(xml.child("dimension")));
  EXPECT_FLOAT_EQ(12.5f, LoadFloatFromXml(xml.child("delay")));
  EXPECT_EQ("a.xml", LoadStringFromXml(xml.child("file")));
  EXPECT_EQ(vec4(0.5, 0, 1, 0.25), LoadVec4FromXml(xml.child("color")));
}

} // End of namespace

int main(int argc, char **argv) {
  ::testing::InitGoogleTest(&argc, argv);
  return RUN_ALL_TESTS();
}
