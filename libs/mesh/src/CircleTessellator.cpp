#define _USE_MATH_DEFINES
#include <cmath>

#include "CircleTessellator.h"
#include "QuadrantBuilder.h"

#ifndef M_PI  // in case it doesnt work on windows
#define M_PI 3.14159265358979323846
#endif

namespace {

void AppendArc(std::vector<Eigen::Vector3d>& points, const Eigen::Vector3d& center,
               double radius_m, double line_width_m, int vertices_per_arc) {
  double start_rad = std::atan((line_width_m / 2) / radius_m);
  double increment_rad = (M_PI / 2 - start_rad) / (vertices_per_arc - 1);

  for (int i = 0; i < vertices_per_arc; ++i) {
    double alpha_rad = start_rad + i * increment_rad;
    points.push_back(Eigen::Vector3d(center.x() - radius_m * std::sin(alpha_rad),
                                     center.y() - radius_m * std::cos(alpha_rad), center.z()));
  }
}

}  // namespace

int mesh::VerticesPerQuadrantArc(int circle_vertex_count) {
  return (circle_vertex_count + 3) / 4 + 1;
}

int mesh::JunctionIndex(int vertices_per_arc) { return (2 * vertices_per_arc + 2) / 3; }

mesh::CircleArcs mesh::AppendCircleArcs(std::vector<Eigen::Vector3d>& points,
                                        const Eigen::Vector3d& center, double inner_radius_m,
                                        double outer_radius_m, double line_width_m,
                                        int circle_vertex_count) {
  CircleArcs arcs;
  arcs.vertices_per_arc = VerticesPerQuadrantArc(circle_vertex_count);

  arcs.inner_start = static_cast<int>(points.size());
  AppendArc(points, center, inner_radius_m, line_width_m, arcs.vertices_per_arc);

  arcs.outer_start = static_cast<int>(points.size());
  AppendArc(points, center, outer_radius_m, line_width_m, arcs.vertices_per_arc);

  return arcs;
}

void mesh::AppendCircleLineTriangles(const CircleArcs& arcs,
                                     std::vector<Triangle>& line_triangles) {
  const int in = arcs.inner_start;
  const int out = arcs.outer_start;
  for (int i = 1; i < arcs.vertices_per_arc; ++i) {
    line_triangles.push_back({out + i, in + i - 1, out + i - 1});
    line_triangles.push_back({out + i, in + i, in + i - 1});
  }
}

void mesh::AppendCircleFillTriangles(const CircleArcs& arcs,
                                     std::vector<Triangle>& fill_triangles) {
  const int in = arcs.inner_start;
  const int out = arcs.outer_start;
  const int n = arcs.vertices_per_arc;

  // Outside the circle
  fill_triangles.push_back({kPenaltyCornerIndex, out, kHalfLinePenaltyIndex});
  for (int i = 1; i < n; ++i) {
    fill_triangles.push_back({kPenaltyCornerIndex, out + i, out + i - 1});
  }
  fill_triangles.push_back({kPenaltyCornerIndex, kPenaltyAxisIndex, out + n - 1});

  // Inside the circle
  const int junction = JunctionIndex(n) - 1;
  for (int i = 1; i <= junction; ++i) {
    fill_triangles.push_back({in + i, kCenterMarkBaseIndex, in + i - 1});
  }
  fill_triangles.push_back({in + junction, kCenterMarkTipIndex, kCenterMarkBaseIndex});
  for (int i = junction + 1; i < n; ++i) {
    fill_triangles.push_back({in + i, kCenterMarkTipIndex, in + i - 1});
  }
  fill_triangles.push_back({in + n - 1, kCenterMarkAxisTipIndex, kCenterMarkTipIndex});
}
