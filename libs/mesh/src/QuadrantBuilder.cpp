#include "QuadrantBuilder.h"

std::vector<Eigen::Vector3d> mesh::BuildQuadrantPoints(const cfg::FieldDimensions& dims,
                                                       double line_width_m,
                                                       double branch_length_m,
                                                       double turf_depth_m) {
  const double A = dims.field_length_m;
  const double B = dims.field_width_m;
  const double E = dims.goal_area_length_m;
  const double F = dims.goal_area_width_m;
  const double G = dims.penalty_mark_distance_m;
  const double I = dims.border_strip_width_m;
  const double J = dims.penalty_area_length_m;
  const double K = dims.penalty_area_width_m;
  const double lw = line_width_m;
  const double bl = branch_length_m;

  // Columns, from the corner flag towards the halfway line
  const double x_goal_line = I;
  const double x_goal_line_in = I + lw;
  const double x_goal_area_in = I + E - lw;
  const double x_goal_area = I + E;
  const double x_mark_back_tip = I + G - bl;
  const double x_mark_back = I + G - (lw / 2);
  const double x_mark_front = I + G + (lw / 2);
  const double x_mark_front_tip = I + G + bl;
  const double x_penalty_in = I + J - lw;
  const double x_penalty = I + J;
  const double x_center_tip = I + (A / 2) - bl;
  const double x_half_line = I + ((A - lw) / 2);
  const double x_center = I + (A / 2);

  // Rows, from the touch line side towards the long axis
  const double y_touch_line = I;
  const double y_touch_line_in = I + lw;
  const double y_penalty = I + ((B - K) / 2);
  const double y_penalty_in = I + ((B - K) / 2) + lw;
  const double y_goal_area = I + ((B - F) / 2);
  const double y_goal_area_in = I + ((B - F) / 2) + lw;
  const double y_mark_tip = I + (B / 2) - bl;
  const double y_mark = I + ((B - lw) / 2);
  const double y_axis = I + (B / 2);

  const double z = turf_depth_m;

  std::vector<Eigen::Vector3d> pts;
  pts.reserve(kNumQuadrantPoints);

  // Border strip behind the goal line
  pts.push_back(Eigen::Vector3d(0, 0, z));                              // 0
  pts.push_back(Eigen::Vector3d(0, y_touch_line, z));                   // 1
  pts.push_back(Eigen::Vector3d(0, y_axis, z));                         // 2

  // Goal line
  pts.push_back(Eigen::Vector3d(x_goal_line, y_touch_line, z));         // 3
  pts.push_back(Eigen::Vector3d(x_goal_line, y_axis, z));               // 4
  pts.push_back(Eigen::Vector3d(x_goal_line_in, y_touch_line, z));      // 5
  pts.push_back(Eigen::Vector3d(x_goal_line_in, y_touch_line_in, z));   // 6
  pts.push_back(Eigen::Vector3d(x_goal_line_in, y_penalty, z));         // 7
  pts.push_back(Eigen::Vector3d(x_goal_line_in, y_penalty_in, z));      // 8
  pts.push_back(Eigen::Vector3d(x_goal_line_in, y_goal_area, z));       // 9
  pts.push_back(Eigen::Vector3d(x_goal_line_in, y_goal_area_in, z));    // 10
  pts.push_back(Eigen::Vector3d(x_goal_line_in, y_axis, z));            // 11

  // Goal area
  pts.push_back(Eigen::Vector3d(x_goal_area_in, y_goal_area_in, z));    // 12
  pts.push_back(Eigen::Vector3d(x_goal_area_in, y_axis, z));            // 13
  pts.push_back(Eigen::Vector3d(x_goal_area, y_goal_area, z));          // 14
  pts.push_back(Eigen::Vector3d(x_goal_area, y_goal_area_in, z));       // 15
  pts.push_back(Eigen::Vector3d(x_goal_area, y_mark_tip, z));           // 16
  pts.push_back(Eigen::Vector3d(x_goal_area, y_axis, z));               // 17

  // Penalty mark
  pts.push_back(Eigen::Vector3d(x_mark_back_tip, y_mark, z));           // 18
  pts.push_back(Eigen::Vector3d(x_mark_back_tip, y_axis, z));           // 19
  pts.push_back(Eigen::Vector3d(x_mark_back, y_mark_tip, z));           // 20
  pts.push_back(Eigen::Vector3d(x_mark_back, y_mark, z));               // 21
  pts.push_back(Eigen::Vector3d(x_mark_back, y_axis, z));               // 22
  pts.push_back(Eigen::Vector3d(x_mark_front, y_mark_tip, z));          // 23
  pts.push_back(Eigen::Vector3d(x_mark_front, y_mark, z));              // 24
  pts.push_back(Eigen::Vector3d(x_mark_front, y_axis, z));              // 25
  pts.push_back(Eigen::Vector3d(x_mark_front_tip, y_mark, z));          // 26
  pts.push_back(Eigen::Vector3d(x_mark_front_tip, y_axis, z));          // 27

  // Penalty area
  pts.push_back(Eigen::Vector3d(x_penalty_in, y_penalty_in, z));        // 28
  pts.push_back(Eigen::Vector3d(x_penalty_in, y_goal_area, z));         // 29
  pts.push_back(Eigen::Vector3d(x_penalty_in, y_mark_tip, z));          // 30
  pts.push_back(Eigen::Vector3d(x_penalty_in, y_axis, z));              // 31
  pts.push_back(Eigen::Vector3d(x_penalty, y_penalty, z));              // 32
  pts.push_back(Eigen::Vector3d(x_penalty, y_penalty_in, z));           // 33
  pts.push_back(Eigen::Vector3d(x_penalty, y_axis, z));                 // 34

  // Center mark and halfway line
  pts.push_back(Eigen::Vector3d(x_center_tip, y_mark, z));              // 35
  pts.push_back(Eigen::Vector3d(x_center_tip, y_axis, z));              // 36
  pts.push_back(Eigen::Vector3d(x_half_line, y_touch_line, z));         // 37
  pts.push_back(Eigen::Vector3d(x_half_line, y_touch_line_in, z));      // 38
  pts.push_back(Eigen::Vector3d(x_half_line, y_penalty, z));            // 39
  pts.push_back(Eigen::Vector3d(x_half_line, y_mark, z));               // 40
  pts.push_back(Eigen::Vector3d(x_half_line, y_axis, z));               // 41
  pts.push_back(Eigen::Vector3d(x_center, 0, z));                       // 42
  pts.push_back(Eigen::Vector3d(x_center, y_touch_line, z));            // 43
  pts.push_back(Eigen::Vector3d(x_center, y_axis, z));                  // 44

  return pts;
}
