#ifndef QUADRANT_TRIANGULATOR_H
#define QUADRANT_TRIANGULATOR_H

#include <vector>

#include "FieldMesh.h"

namespace mesh {

constexpr int kNumQuadrantFillTriangles = 20;
constexpr int kNumQuadrantLineTriangles = 22;

struct QuadrantTriangles {
  std::vector<Triangle> fill;
  std::vector<Triangle> line;
};

// Fixed tables over the BuildQuadrantPoints() order, center circle excluded
QuadrantTriangles BuildQuadrantTriangles();

}  // namespace mesh

#endif  // QUADRANT_TRIANGULATOR_H
