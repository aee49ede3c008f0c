#ifndef QUADRANT_BUILDER_H
#define QUADRANT_BUILDER_H

#include <vector>

#include <Eigen/Dense>

#include "FieldDimensions.h"

namespace mesh {

// Straight line points of one quadrant. The triangle tables index this order.
constexpr int kNumQuadrantPoints = 45;

// Outer corner of the penalty area line, facing the center circle
constexpr int kPenaltyCornerIndex = 32;
// Outer edge of the penalty area line on the long axis of the field
constexpr int kPenaltyAxisIndex = 34;
// Center mark branch tip, lower edge
constexpr int kCenterMarkTipIndex = 35;
// Center mark branch tip on the long axis
constexpr int kCenterMarkAxisTipIndex = 36;
// Halfway line edge level with the penalty area side line
constexpr int kHalfLinePenaltyIndex = 39;
// Halfway line edge where the center mark branch starts
constexpr int kCenterMarkBaseIndex = 40;
// Center of the field, also the center of the center circle
constexpr int kFieldCenterIndex = 44;

/*
  Builds the points of the quadrant between the corner flag (origin) and the center of the
  field. x runs along the field length and y along its width, so the quadrant covers
  [0, I + A/2] x [0, I + B/2]. Every coordinate is a sum of dimensions and the two
  constants, and every point sits at z = turf_depth_m.
*/
std::vector<Eigen::Vector3d> BuildQuadrantPoints(const cfg::FieldDimensions& dims,
                                                 double line_width_m, double branch_length_m,
                                                 double turf_depth_m);

}  // namespace mesh

#endif  // QUADRANT_BUILDER_H
