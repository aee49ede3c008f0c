#ifndef CIRCLE_TESSELLATOR_H
#define CIRCLE_TESSELLATOR_H

#include <vector>

#include <Eigen/Dense>

#include "FieldMesh.h"

namespace mesh {

// Where the two quarter arcs of the center circle line sit in the point pool
struct CircleArcs {
  int inner_start;
  int outer_start;
  int vertices_per_arc;
};

/*
  Vertices on one quarter arc for a center circle drawn with circle_vertex_count vertices:
  ceil(circle_vertex_count / 4) + 1. The extra vertex puts one vertex on each quadrant
  boundary so that the mirrored quarters close the circle. circle_vertex_count >= 1.
*/
int VerticesPerQuadrantArc(int circle_vertex_count);

/*
  1-based position on the inner arc, ceil(2/3 * vertices_per_arc), where the inner fill fan
  moves its apex from the halfway line to the center mark tip.
*/
int JunctionIndex(int vertices_per_arc);

/*
  Appends the inner arc and then the outer arc of the quadrant's share of the center circle
  line. Both arcs start at atan((line_width / 2) / radius) so the first vertex lies on the
  edge of the halfway line, and end at pi/2 on the long axis of the field. Points keep the
  depth of the center.
*/
CircleArcs AppendCircleArcs(std::vector<Eigen::Vector3d>& points, const Eigen::Vector3d& center,
                            double inner_radius_m, double outer_radius_m, double line_width_m,
                            int circle_vertex_count);

// Two triangles per arc segment between the inner and the outer arc
void AppendCircleLineTriangles(const CircleArcs& arcs, std::vector<Triangle>& line_triangles);

/*
  Turf around and inside the circle line. Outside, one fan from the penalty area corner
  covers the outer arc. Inside, the fan apex is the halfway line edge at the center mark
  up to the junction vertex, then the center mark tip, with one junction triangle joining
  the two fans.
*/
void AppendCircleFillTriangles(const CircleArcs& arcs, std::vector<Triangle>& fill_triangles);

}  // namespace mesh

#endif  // CIRCLE_TESSELLATOR_H
