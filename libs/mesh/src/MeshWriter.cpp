#include <iostream>
#include <limits>
#include <sstream>

#include "MeshWriter.h"
#include "Utils.h"

namespace {

void WriteRotation(std::ostream& out, const Eigen::AngleAxisd& rotation) {
  out << rotation.axis().x() << " " << rotation.axis().y() << " " << rotation.axis().z() << " "
      << rotation.angle();
}

void WriteCoordIndex(std::ostream& out, const std::string& layer,
                     const std::vector<mesh::Triangle>& triangles) {
  std::vector<int> coord_index = mesh::ToCoordIndex(triangles);
  out << layer << " coordIndex [\n";
  for (size_t i = 0; i < coord_index.size(); i += 4) {
    out << "  " << coord_index[i] << " " << coord_index[i + 1] << " " << coord_index[i + 2]
        << " " << coord_index[i + 3] << "\n";
  }
  out << "]\n";
}

}  // namespace

std::vector<int> mesh::ToCoordIndex(const std::vector<Triangle>& triangles) {
  std::vector<int> coord_index;
  coord_index.reserve(4 * triangles.size());
  for (const Triangle& triangle : triangles) {
    coord_index.push_back(triangle.a);
    coord_index.push_back(triangle.b);
    coord_index.push_back(triangle.c);
    coord_index.push_back(-1);
  }
  return coord_index;
}

std::string mesh::SerializeFieldMesh(const FieldMesh& field_mesh) {
  std::ostringstream out;
  out.precision(std::numeric_limits<double>::max_digits10);

  out << "name " << field_mesh.name << "\n";
  out << "size " << cfg::SizeClassName(field_mesh.size) << "\n";
  out << "translation " << field_mesh.translation.x() << " " << field_mesh.translation.y() << " "
      << field_mesh.translation.z() << "\n";
  out << "rotation ";
  WriteRotation(out, field_mesh.rotation);
  out << "\n";
  out << "ccw FALSE\n";

  out << "point [\n";
  for (const Eigen::Vector3d& point : field_mesh.points) {
    out << "  " << point.x() << " " << point.y() << " " << point.z() << "\n";
  }
  out << "]\n";

  WriteCoordIndex(out, "fill", field_mesh.fill_triangles);
  WriteCoordIndex(out, "line", field_mesh.line_triangles);

  out << "ground size " << field_mesh.ground_size.x() << " " << field_mesh.ground_size.y()
      << "\n";
  if (field_mesh.collision_plane) {
    const CollisionPlane& plane = *field_mesh.collision_plane;
    out << "collision_plane size " << plane.size.x() << " " << plane.size.y() << " height "
        << plane.height_m << " contact_material " << plane.contact_material << "\n";
  }

  for (const GoalPlacement& goal : field_mesh.goals) {
    out << "goal " << goal.name << " translation " << goal.translation.x() << " "
        << goal.translation.y() << " " << goal.translation.z() << " rotation ";
    WriteRotation(out, goal.rotation);
    out << " size " << cfg::SizeClassName(goal.size) << "\n";
  }

  return out.str();
}

void mesh::WriteFieldMesh(const std::string& path, const FieldMesh& field_mesh) {
  util::WriteFile(path, SerializeFieldMesh(field_mesh));
  std::cout << "[mesh::WriteFieldMesh] Wrote " << field_mesh.points.size() << " points to "
            << path << std::endl;
}
