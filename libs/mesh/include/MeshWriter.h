#ifndef MESH_WRITER_H
#define MESH_WRITER_H

#include <string>
#include <vector>

#include "FieldMesh.h"

namespace mesh {

// "a b c -1" per triangle, the face list layout of an indexed face set
std::vector<int> ToCoordIndex(const std::vector<Triangle>& triangles);

/*
  Plain text scene description handed to the host: transform, winding, the shared point
  pool, the fill and line coordIndex streams, the ground and collision planes and the goal
  placements. Doubles are written with max_digits10 so they read back exactly.
*/
std::string SerializeFieldMesh(const FieldMesh& field_mesh);

// Throws std::runtime_error when the file cannot be written
void WriteFieldMesh(const std::string& path, const FieldMesh& field_mesh);

}  // namespace mesh

#endif  // MESH_WRITER_H
