#include "MirrorReplicator.h"

Eigen::Vector3d mesh::TransformPoint(const QuadrantTransform& transform,
                                     const Eigen::Vector3d& point, double center_x,
                                     double center_y) {
  Eigen::Vector3d result = point;
  if (transform.reflect_x) result.x() = 2 * center_x - point.x();
  if (transform.reflect_y) result.y() = 2 * center_y - point.y();
  return result;
}

mesh::Triangle mesh::TransformTriangle(const QuadrantTransform& transform,
                                       const Triangle& triangle, int offset) {
  const int a = triangle.a + offset;
  const int b = triangle.b + offset;
  const int c = triangle.c + offset;
  switch (transform.order) {
    case VertexOrder::BAC:
      return {b, a, c};
    case VertexOrder::CBA:
      return {c, b, a};
    case VertexOrder::CAB:
      return {c, a, b};
    case VertexOrder::ABC:
      break;
  }
  return {a, b, c};
}

mesh::QuadrantMesh mesh::ReplicateQuadrants(const QuadrantMesh& base, double center_x,
                                            double center_y) {
  const int num_points = static_cast<int>(base.points.size());

  QuadrantMesh field;
  field.points.reserve(kNumQuadrants * base.points.size());
  field.fill_triangles.reserve(kNumQuadrants * base.fill_triangles.size());
  field.line_triangles.reserve(kNumQuadrants * base.line_triangles.size());

  for (int k = 0; k < kNumQuadrants; ++k) {
    const QuadrantTransform& transform = kQuadrantTransforms[k];
    const int offset = k * num_points;

    for (const Eigen::Vector3d& point : base.points) {
      field.points.push_back(TransformPoint(transform, point, center_x, center_y));
    }
    for (const Triangle& triangle : base.fill_triangles) {
      field.fill_triangles.push_back(TransformTriangle(transform, triangle, offset));
    }
    for (const Triangle& triangle : base.line_triangles) {
      field.line_triangles.push_back(TransformTriangle(transform, triangle, offset));
    }
  }

  return field;
}
