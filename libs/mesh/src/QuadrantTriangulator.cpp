#include <iterator>

#include "QuadrantTriangulator.h"

namespace {

// Each row is one quad split along a diagonal
constexpr mesh::Triangle kFillTable[mesh::kNumQuadrantFillTriangles] = {
    {0, 43, 42},  {0, 1, 43},    // Border strip along the touch line
    {1, 4, 3},    {1, 2, 4},     // Border strip behind the goal line
    {6, 39, 38},  {6, 7, 39},    // Touch line to penalty area side line
    {8, 29, 28},  {8, 9, 29},    // Penalty area side line to goal area side line
    {14, 30, 29}, {14, 16, 30},  // Goal area front line to penalty area front line
    {10, 13, 12}, {10, 11, 13},  // Inside the goal area
    {16, 21, 20}, {16, 18, 21},  // Goal area to penalty mark, below the mark
    {16, 19, 18}, {16, 17, 19},  // Goal area to penalty mark, on the axis
    {23, 24, 30}, {24, 26, 30},  // Penalty mark to penalty area, below the mark
    {26, 27, 30}, {27, 31, 30},  // Penalty mark to penalty area, on the axis
};

constexpr mesh::Triangle kLineTable[mesh::kNumQuadrantLineTriangles] = {
    {5, 38, 37},  {5, 6, 38},    // Touch line
    {3, 11, 5},   {3, 4, 11},    // Goal line
    {37, 44, 43}, {37, 41, 44},  // Halfway line
    {7, 33, 32},  {7, 8, 33},    // Penalty area side line
    {28, 34, 33}, {28, 31, 34},  // Penalty area front line
    {9, 15, 14},  {9, 10, 15},   // Goal area side line
    {12, 17, 15}, {12, 13, 17},  // Goal area front line
    {18, 22, 21}, {18, 19, 22},  // Penalty mark, back branch
    {20, 25, 23}, {20, 22, 25},  // Penalty mark, cross branch
    {24, 27, 26}, {24, 25, 27},  // Penalty mark, front branch
    {35, 41, 40}, {35, 36, 41},  // Center mark branch
};

}  // namespace

mesh::QuadrantTriangles mesh::BuildQuadrantTriangles() {
  QuadrantTriangles triangles;
  triangles.fill.assign(std::begin(kFillTable), std::end(kFillTable));
  triangles.line.assign(std::begin(kLineTable), std::end(kLineTable));
  return triangles;
}
