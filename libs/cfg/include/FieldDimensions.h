#ifndef FIELD_DIMENSIONS_H
#define FIELD_DIMENSIONS_H

#include <string>

namespace cfg {

enum class SizeClass { KID, ADULT };

// Values shared by every size class. None of these is fixed by the league rules except
// the line width.
struct FieldConstants {
  static const double line_width_m;
  static const double branch_length_m;  // One branch of the penalty/center mark cross
  static constexpr int circle_vertex_count = 36;  // Whole center circle polygon
  static const double turf_depth_m;  // Surface offset when turf physics is on

  static const std::string default_name;
  static const std::string grass_contact_material;
};

/*
  Official RoboCup humanoid field measurements, in meters. The letters are the labels
  used by the rule book drawing.
*/
struct FieldDimensions {
  double field_length_m;            // A
  double field_width_m;             // B
  double goal_depth_m;              // C
  double goal_width_m;              // D
  double goal_area_length_m;        // E
  double goal_area_width_m;         // F
  double penalty_mark_distance_m;   // G
  double center_circle_diameter_m;  // H
  double border_strip_width_m;      // I
  double penalty_area_length_m;     // J
  double penalty_area_width_m;      // K

  // Playing field plus the border strip on both sides
  double TotalLength() const { return 2 * border_strip_width_m + field_length_m; }
  double TotalWidth() const { return 2 * border_strip_width_m + field_width_m; }
};

FieldDimensions ResolveDimensions(SizeClass size);

}  // namespace cfg

#endif  // FIELD_DIMENSIONS_H
