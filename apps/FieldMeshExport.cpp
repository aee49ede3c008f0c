// cpp std libs
#include <exception>
#include <iostream>
#include <string>

// self libs
#include "FieldConfig.h"
#include "FieldDimensions.h"
#include "FieldMeshGenerator.h"
#include "MeshWriter.h"

namespace {

void PrintUsage(const char* program) {
  std::cerr << "Usage: " << program << " <adult|kid|config-file> [output-path]" << std::endl;
}

cfg::FieldConfig ResolveConfig(const std::string& source) {
  if (source == "adult" || source == "kid") {
    cfg::FieldConfig config;
    config.size = cfg::ParseSizeClass(source);
    return config;
  }
  return cfg::LoadFieldConfig(source);
}

void PrintSummary(const mesh::FieldMesh& field) {
  std::cout << "[main] Field '" << field.name << "' (" << cfg::SizeClassName(field.size)
            << ")" << std::endl;
  std::cout << "[main]   points: " << field.points.size()
            << ", fill triangles: " << field.fill_triangles.size()
            << ", line triangles: " << field.line_triangles.size() << std::endl;
  std::cout << "[main]   ground: " << field.ground_size.x() << " x " << field.ground_size.y()
            << " m" << (field.collision_plane ? ", turf physics on" : ", turf physics off")
            << std::endl;
  for (const mesh::GoalPlacement& goal : field.goals) {
    Eigen::Vector3d position_fWorld = field.ToWorldFrame(goal.translation);
    std::cout << "[main]   " << goal.name << " at " << position_fWorld.transpose() << std::endl;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  if (argc < 2 || argc > 3) {
    PrintUsage(argv[0]);
    return 1;
  }

  try {
    cfg::FieldConfig config = ResolveConfig(argv[1]);
    mesh::FieldMesh field = mesh::GenerateFieldMesh(config);
    PrintSummary(field);

    if (argc == 3) {
      mesh::WriteFieldMesh(argv[2], field);
    }
  } catch (const std::exception& e) {
    std::cerr << "[main] " << e.what() << std::endl;
    return 1;
  }

  return 0;
}
