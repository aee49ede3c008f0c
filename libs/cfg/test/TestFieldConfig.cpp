#include <gtest/gtest.h>

#include <cmath>
#include <stdexcept>
#include <string>

#include <Eigen/Dense>

#include "FieldConfig.h"

namespace {
std::string ResourcePath(const std::string& file_name) {
  return std::string(FIELDMESH_RESOURCES_DIR) + "/" + file_name;
}
}  // namespace

TEST(SizeClassTest, TestParseKnownValues) {
  EXPECT_EQ(cfg::ParseSizeClass("adult"), cfg::SizeClass::ADULT);
  EXPECT_EQ(cfg::ParseSizeClass("kid"), cfg::SizeClass::KID);
}

TEST(SizeClassTest, TestParseRejectsUnknownValues) {
  EXPECT_THROW(cfg::ParseSizeClass("teen"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseSizeClass("Adult"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseSizeClass(""), std::invalid_argument);
}

TEST(SizeClassTest, TestNameRoundTrip) {
  EXPECT_EQ(cfg::SizeClassName(cfg::SizeClass::ADULT), "adult");
  EXPECT_EQ(cfg::SizeClassName(cfg::SizeClass::KID), "kid");
  EXPECT_EQ(cfg::ParseSizeClass(cfg::SizeClassName(cfg::SizeClass::KID)), cfg::SizeClass::KID);
}

TEST(FieldConfigTest, TestDefaults) {
  cfg::FieldConfig config;

  EXPECT_EQ(config.name, "soccer_field");
  EXPECT_EQ(config.size, cfg::SizeClass::ADULT);
  EXPECT_TRUE(config.turf_physics);
  EXPECT_EQ(config.translation, Eigen::Vector3d::Zero());
  EXPECT_DOUBLE_EQ(config.rotation.angle(), 0.0);
  EXPECT_EQ(config.rotation.axis(), Eigen::Vector3d::UnitZ());
}

TEST(FieldConfigTest, TestEmptyTextKeepsDefaults) {
  cfg::FieldConfig config = cfg::ParseFieldConfig("\n# only a comment\n\n");

  EXPECT_EQ(config.name, "soccer_field");
  EXPECT_EQ(config.size, cfg::SizeClass::ADULT);
  EXPECT_TRUE(config.turf_physics);
}

TEST(FieldConfigTest, TestParseAllKeys) {
  cfg::FieldConfig config = cfg::ParseFieldConfig(
      "name training\n"
      "size kid\n"
      "turf_physics false\n"
      "translation 1 2 3\n"
      "rotation 0 0 1 0.5\n");

  EXPECT_EQ(config.name, "training");
  EXPECT_EQ(config.size, cfg::SizeClass::KID);
  EXPECT_FALSE(config.turf_physics);
  EXPECT_EQ(config.translation, Eigen::Vector3d(1, 2, 3));
  EXPECT_NEAR(config.rotation.angle(), 0.5, 1e-12);
  EXPECT_NEAR(config.rotation.axis().z(), 1.0, 1e-12);
}

TEST(FieldConfigTest, TestRotationIsNormalized) {
  cfg::FieldConfig config = cfg::ParseFieldConfig("rotation 0 3 4 7.0\n");

  EXPECT_NEAR(config.rotation.axis().norm(), 1.0, 1e-12);
  EXPECT_NEAR(config.rotation.axis().y(), 0.6, 1e-12);
  EXPECT_NEAR(config.rotation.axis().z(), 0.8, 1e-12);
  EXPECT_NEAR(config.rotation.angle(), 7.0 - 2 * M_PI, 1e-9);
}

TEST(FieldConfigTest, TestWindowsLineEndings) {
  cfg::FieldConfig config = cfg::ParseFieldConfig("size kid\r\nturf_physics TRUE\r\n");

  EXPECT_EQ(config.size, cfg::SizeClass::KID);
  EXPECT_TRUE(config.turf_physics);
}

TEST(FieldConfigTest, TestMalformedInputThrows) {
  EXPECT_THROW(cfg::ParseFieldConfig("size huge\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("size\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("size kid adult\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("turf_physics yes\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("translation 1 2\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("translation 1 2 z\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("translation 1 2 3m\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("rotation 0 0 0 1\n"), std::invalid_argument);
  EXPECT_THROW(cfg::ParseFieldConfig("color green\n"), std::invalid_argument);
}

TEST(FieldConfigTest, TestErrorNamesLineNumber) {
  try {
    cfg::ParseFieldConfig("name a\n\nsize medium\n");
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    std::string message = e.what();
    EXPECT_NE(message.find("line 3"), std::string::npos) << message;
    EXPECT_NE(message.find("medium"), std::string::npos) << message;
  }
}

TEST(FieldConfigTest, TestLoadKidConfigFile) {
  cfg::FieldConfig config = cfg::LoadFieldConfig(ResourcePath("FieldConfigKid.txt"));

  EXPECT_EQ(config.name, "practice_field");
  EXPECT_EQ(config.size, cfg::SizeClass::KID);
  EXPECT_FALSE(config.turf_physics);
  EXPECT_EQ(config.translation, Eigen::Vector3d(1.5, -2, 0));
  EXPECT_NEAR(config.rotation.angle(), 1.5708, 1e-9);
  EXPECT_NEAR((config.rotation.axis() - Eigen::Vector3d::UnitZ()).norm(), 0.0, 1e-12);
}

TEST(FieldConfigTest, TestLoadAdultConfigFile) {
  cfg::FieldConfig config = cfg::LoadFieldConfig(ResourcePath("FieldConfigAdult.txt"));

  EXPECT_EQ(config.name, "soccer_field");
  EXPECT_EQ(config.size, cfg::SizeClass::ADULT);
  EXPECT_TRUE(config.turf_physics);
}

TEST(FieldConfigTest, TestLoadMissingFileThrows) {
  EXPECT_THROW(cfg::LoadFieldConfig(ResourcePath("DoesNotExist.txt")), std::runtime_error);
}
