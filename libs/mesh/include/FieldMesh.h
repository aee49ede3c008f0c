#ifndef FIELD_MESH_H
#define FIELD_MESH_H

#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <Eigen/Geometry>

#include "FieldConfig.h"
#include "FieldDimensions.h"

namespace mesh {

/*
  Indices into a point pool. Front faces are clockwise when seen from +z, which is the
  "ccw FALSE" convention of the host scene format.
*/
struct Triangle {
  int a;
  int b;
  int c;
};

inline bool operator==(const Triangle& lhs, const Triangle& rhs) {
  return lhs.a == rhs.a && lhs.b == rhs.b && lhs.c == rhs.c;
}

// Point pool with its fill (turf) and line (markings) layers
struct QuadrantMesh {
  std::vector<Eigen::Vector3d> points;
  std::vector<Triangle> fill_triangles;
  std::vector<Triangle> line_triangles;
};

struct GoalPlacement {
  std::string name;
  Eigen::Vector3d translation;
  Eigen::AngleAxisd rotation;
  cfg::SizeClass size;
};

struct CollisionPlane {
  Eigen::Vector2d size;
  double height_m;
  std::string contact_material;
};

/*
  Finished field, with the origin at the geometric center of the field. Built once by
  GenerateFieldMesh() and not modified afterwards.
*/
struct FieldMesh {
  std::string name;
  cfg::SizeClass size;
  Eigen::Vector3d translation;
  Eigen::AngleAxisd rotation;

  std::vector<Eigen::Vector3d> points;
  std::vector<Triangle> fill_triangles;
  std::vector<Triangle> line_triangles;

  Eigen::Vector2d ground_size;  // length x width, border strip included
  std::optional<CollisionPlane> collision_plane;  // Only with turf physics
  std::vector<GoalPlacement> goals;

  Eigen::Vector3d ToWorldFrame(const Eigen::Vector3d& point_fField) const {
    return translation + rotation * point_fField;
  }
};

}  // namespace mesh

#endif  // FIELD_MESH_H
