#ifndef FIELD_MESH_GENERATOR_H
#define FIELD_MESH_GENERATOR_H

#include "FieldConfig.h"
#include "FieldDimensions.h"
#include "FieldMesh.h"

namespace mesh {

// Straight geometry, then the inner and outer arcs, with their triangles
QuadrantMesh BuildBaseQuadrant(const cfg::FieldDimensions& dims, double turf_depth_m);

/*
  Moves the replicated field so its geometric center is the origin, and adds the ground
  extent, the optional turf collision plane and the two goal placements. Point and
  triangle counts are unchanged.
*/
FieldMesh CenterAndEmit(const QuadrantMesh& field, const cfg::FieldDimensions& dims,
                        const cfg::FieldConfig& config);

FieldMesh GenerateFieldMesh(const cfg::FieldConfig& config);

}  // namespace mesh

#endif  // FIELD_MESH_GENERATOR_H
