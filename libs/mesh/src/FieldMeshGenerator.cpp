#include <iostream>
#define _USE_MATH_DEFINES
#include <cmath>

#include "CircleTessellator.h"
#include "FieldMeshGenerator.h"
#include "MirrorReplicator.h"
#include "QuadrantBuilder.h"
#include "QuadrantTriangulator.h"

#ifndef M_PI  // in case it doesnt work on windows
#define M_PI 3.14159265358979323846
#endif

mesh::QuadrantMesh mesh::BuildBaseQuadrant(const cfg::FieldDimensions& dims,
                                           double turf_depth_m) {
  const double line_width_m = cfg::FieldConstants::line_width_m;

  QuadrantMesh quadrant;
  quadrant.points = BuildQuadrantPoints(dims, line_width_m,
                                        cfg::FieldConstants::branch_length_m, turf_depth_m);

  QuadrantTriangles triangles = BuildQuadrantTriangles();
  quadrant.fill_triangles = triangles.fill;
  quadrant.line_triangles = triangles.line;

  // Copied, the arcs are appended to the same pool
  const Eigen::Vector3d center = quadrant.points[kFieldCenterIndex];
  const double inner_radius_m = dims.center_circle_diameter_m / 2;
  CircleArcs arcs = AppendCircleArcs(quadrant.points, center, inner_radius_m,
                                     inner_radius_m + line_width_m, line_width_m,
                                     cfg::FieldConstants::circle_vertex_count);
  AppendCircleLineTriangles(arcs, quadrant.line_triangles);
  AppendCircleFillTriangles(arcs, quadrant.fill_triangles);

  return quadrant;
}

mesh::FieldMesh mesh::CenterAndEmit(const QuadrantMesh& field, const cfg::FieldDimensions& dims,
                                    const cfg::FieldConfig& config) {
  const double length_m = dims.TotalLength();
  const double width_m = dims.TotalWidth();
  const Eigen::Vector3d offset(length_m / 2, width_m / 2, 0);

  FieldMesh result;
  result.name = config.name;
  result.size = config.size;
  result.translation = config.translation;
  result.rotation = config.rotation;

  result.points.reserve(field.points.size());
  for (const Eigen::Vector3d& point : field.points) {
    result.points.push_back(point - offset);
  }
  result.fill_triangles = field.fill_triangles;
  result.line_triangles = field.line_triangles;

  result.ground_size = Eigen::Vector2d(length_m, width_m);
  if (config.turf_physics) {
    result.collision_plane = CollisionPlane{result.ground_size, cfg::FieldConstants::turf_depth_m,
                                            cfg::FieldConstants::grass_contact_material};
  }

  // Goals stand on the goal lines, the away goal faces the home goal
  const double goal_line_x = length_m / 2 - dims.border_strip_width_m;
  result.goals.push_back({"goal_home", Eigen::Vector3d(-goal_line_x, 0, 0),
                          Eigen::AngleAxisd(0.0, Eigen::Vector3d::UnitZ()), config.size});
  result.goals.push_back({"goal_away", Eigen::Vector3d(goal_line_x, 0, 0),
                          Eigen::AngleAxisd(M_PI, Eigen::Vector3d::UnitZ()), config.size});

  return result;
}

mesh::FieldMesh mesh::GenerateFieldMesh(const cfg::FieldConfig& config) {
  cfg::FieldDimensions dims = cfg::ResolveDimensions(config.size);
  double turf_depth_m = config.turf_physics ? cfg::FieldConstants::turf_depth_m : 0.0;

  QuadrantMesh quadrant = BuildBaseQuadrant(dims, turf_depth_m);
  const Eigen::Vector3d& center = quadrant.points[kFieldCenterIndex];
  QuadrantMesh field = ReplicateQuadrants(quadrant, center.x(), center.y());

  FieldMesh result = CenterAndEmit(field, dims, config);
  std::cout << "[mesh::GenerateFieldMesh] " << cfg::SizeClassName(config.size) << " field '"
            << result.name << "': " << result.points.size() << " points, "
            << result.fill_triangles.size() << " fill / " << result.line_triangles.size()
            << " line triangles" << std::endl;
  return result;
}
