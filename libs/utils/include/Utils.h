#ifndef UTILS_H
#define UTILS_H

#include <string>

namespace util {
std::string ReadFile(const std::string& path);
void WriteFile(const std::string& path, const std::string& contents);
double WrapAngle(double angle_rad);  // Normalizes to (-pi, pi]
}  // namespace util

#endif  // UTILS_H
