#ifndef MIRROR_REPLICATOR_H
#define MIRROR_REPLICATOR_H

#include <array>

#include <Eigen/Dense>

#include "FieldMesh.h"

namespace mesh {

enum class VertexOrder {
  ABC,  // Kept
  BAC,  // First two swapped
  CBA,  // Reversed
  CAB   // Rotated, orientation kept
};

/*
  Maps the base quadrant onto one quadrant of the field. A single reflection flips the
  winding, so the vertex order has to flip it back; reflecting across both axes is a
  half turn and keeps the winding.
*/
struct QuadrantTransform {
  bool reflect_x;  // x' = 2 * center_x - x
  bool reflect_y;  // y' = 2 * center_y - y
  VertexOrder order;
};

constexpr int kNumQuadrants = 4;

// Quadrant k lands at point offset k * N in the replicated pool
constexpr std::array<QuadrantTransform, kNumQuadrants> kQuadrantTransforms = {{
    {false, false, VertexOrder::ABC},  // Base quadrant
    {false, true, VertexOrder::BAC},   // Other side of the long axis, same half
    {true, false, VertexOrder::CBA},   // Other half, same side of the long axis
    {true, true, VertexOrder::CAB},    // Diagonally opposite
}};

Eigen::Vector3d TransformPoint(const QuadrantTransform& transform, const Eigen::Vector3d& point,
                               double center_x, double center_y);
Triangle TransformTriangle(const QuadrantTransform& transform, const Triangle& triangle,
                           int offset);

// Four copies of base, one per entry of kQuadrantTransforms, in that order
QuadrantMesh ReplicateQuadrants(const QuadrantMesh& base, double center_x, double center_y);

}  // namespace mesh

#endif  // MIRROR_REPLICATOR_H
