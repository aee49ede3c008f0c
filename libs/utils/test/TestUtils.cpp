#include <gtest/gtest.h>

#include <cmath>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "Utils.h"

TEST(UtilsTest, TestReadFile) {
  std::string file = util::ReadFile(std::string(FIELDMESH_RESOURCES_DIR) + "/DemoFile.txt");
  EXPECT_FALSE(file.empty());

  std::string expected =
      "This is a demo file\n"
      "This is second line\n"
      "Some numbers like 1, 2, 3\n";

  EXPECT_EQ(file, expected);
}

TEST(UtilsTest, TestReadMissingFileThrows) {
  EXPECT_THROW(util::ReadFile("/nonexistent/dir/missing.txt"), std::runtime_error);
}

TEST(UtilsTest, TestWriteThenReadFile) {
  std::filesystem::path path =
      std::filesystem::temp_directory_path() / "fieldmesh_utils_write_test.txt";
  std::string contents = "point [\n  0 0 0.01\n]\n";

  util::WriteFile(path.string(), contents);
  EXPECT_EQ(util::ReadFile(path.string()), contents);

  // Overwrites, does not append
  util::WriteFile(path.string(), "x");
  EXPECT_EQ(util::ReadFile(path.string()), "x");

  std::filesystem::remove(path);
}

TEST(UtilsTest, TestWriteIntoMissingDirectoryThrows) {
  EXPECT_THROW(util::WriteFile("/nonexistent/dir/out.txt", "data"), std::runtime_error);
}

TEST(UtilsTest, TestWrapAngle) {
  // Test angles within range
  EXPECT_NEAR(util::WrapAngle(0.0), 0.0, 1e-6);
  EXPECT_NEAR(util::WrapAngle(M_PI / 2), M_PI / 2, 1e-6);
  EXPECT_NEAR(util::WrapAngle(M_PI), M_PI, 1e-6);
  EXPECT_NEAR(util::WrapAngle(-M_PI / 2), -M_PI / 2, 1e-6);

  // Test angles that need wrapping
  EXPECT_NEAR(util::WrapAngle(2 * M_PI), 0.0, 1e-6);
  EXPECT_NEAR(util::WrapAngle(3 * M_PI), M_PI, 1e-6);
  EXPECT_NEAR(util::WrapAngle(-2 * M_PI), 0.0, 1e-6);

  // The function maps -π to +π (they are equivalent)
  EXPECT_NEAR(util::WrapAngle(-M_PI), M_PI, 1e-6);
  EXPECT_NEAR(util::WrapAngle(-3 * M_PI), M_PI, 1e-6);

  // Test angles slightly outside range
  EXPECT_NEAR(util::WrapAngle(M_PI + 0.1), -M_PI + 0.1, 1e-6);
  EXPECT_NEAR(util::WrapAngle(-M_PI - 0.1), M_PI - 0.1, 1e-6);
}
