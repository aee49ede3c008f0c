#include "FieldDimensions.h"

namespace cfg {

const double FieldConstants::line_width_m = 0.05;
const double FieldConstants::branch_length_m = 0.1;
const double FieldConstants::turf_depth_m = 0.01;

const std::string FieldConstants::default_name = "soccer_field";
const std::string FieldConstants::grass_contact_material = "grass";

FieldDimensions ResolveDimensions(SizeClass size) {
  FieldDimensions dims{};
  switch (size) {
    case SizeClass::KID:
      dims.field_length_m = 9;
      dims.field_width_m = 6;
      dims.goal_depth_m = 0.6;
      dims.goal_width_m = 2.6;
      dims.goal_area_length_m = 1;
      dims.goal_area_width_m = 3;
      dims.penalty_mark_distance_m = 1.5;
      dims.center_circle_diameter_m = 1.5;
      dims.border_strip_width_m = 1;
      dims.penalty_area_length_m = 2;
      dims.penalty_area_width_m = 5;
      break;
    case SizeClass::ADULT:
      dims.field_length_m = 2 * 14;
      dims.field_width_m = 2 * 9;
      dims.goal_depth_m = 2 * 0.6;
      dims.goal_width_m = 2 * 2.6;
      dims.goal_area_length_m = 2 * 1;
      dims.goal_area_width_m = 2 * 4;
      dims.penalty_mark_distance_m = 2 * 2.1;
      dims.center_circle_diameter_m = 2 * 3;
      dims.border_strip_width_m = 2 * 1;
      dims.penalty_area_length_m = 2 * 3;
      dims.penalty_area_width_m = 2 * 6;
      break;
  }
  return dims;
}

}  // namespace cfg
