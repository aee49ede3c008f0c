#ifndef FIELD_CONFIG_H
#define FIELD_CONFIG_H

#include <string>

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "FieldDimensions.h"

namespace cfg {

// Parameters of one field instance
struct FieldConfig {
  std::string name = FieldConstants::default_name;
  Eigen::Vector3d translation = Eigen::Vector3d::Zero();
  Eigen::AngleAxisd rotation = Eigen::AngleAxisd(0.0, Eigen::Vector3d::UnitZ());
  SizeClass size = SizeClass::ADULT;
  bool turf_physics = true;
};

// Throws std::invalid_argument for anything but "adult" or "kid"
SizeClass ParseSizeClass(const std::string& value);
std::string SizeClassName(SizeClass size);

/*
  Parses a line based description, one "key value..." entry per line:

    name soccer_field
    size kid
    turf_physics false
    translation 1 0 0
    rotation 0 0 1 1.5708

  Blank lines and lines starting with '#' are skipped. Keys that are not given keep the
  FieldConfig defaults. Throws std::invalid_argument on malformed input.
*/
FieldConfig ParseFieldConfig(const std::string& text);
FieldConfig LoadFieldConfig(const std::string& path);

}  // namespace cfg

#endif  // FIELD_CONFIG_H
