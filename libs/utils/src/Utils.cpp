#include <fstream>
#include <sstream>
#include <stdexcept>
#define _USE_MATH_DEFINES
#include <cmath>

#include "Utils.h"

#ifndef M_PI  // in case it doesnt work on windows
#define M_PI 3.14159265358979323846
#endif

std::string util::ReadFile(const std::string& path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) throw std::runtime_error("Failed to open file: " + path);

  std::ostringstream buffer;
  buffer << file.rdbuf();
  return buffer.str();
}

void util::WriteFile(const std::string& path, const std::string& contents) {
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file) throw std::runtime_error("Failed to open file for writing: " + path);

  file << contents;
  file.flush();
  if (!file) throw std::runtime_error("Failed to write file: " + path);
}

double util::WrapAngle(double angle_rad) {
  double rad = std::fmod(angle_rad + M_PI, 2 * M_PI);
  if (rad < 0) rad += 2 * M_PI;
  rad -= M_PI;
  // Normalize -π to +π
  if (std::abs(rad + M_PI) < 1e-8) return M_PI;
  return rad;
}
