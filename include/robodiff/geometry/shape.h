#ifndef ROBODIFF_GEOMETRY_SHAPE_H_
#define ROBODIFF_GEOMETRY_SHAPE_H_

#include <iostream>
#include <string>
#include <vector>

#include <Eigen/Core>

namespace robodiff {
namespace geometry {

enum class ShapeType
{
  None,
  Box,
  Sphere,
  Cylinder,
  Capsule,
  Mesh,
};

// clang-format off
/*
| ShapeType | Dimensions           | Symmetry axis | Notes                                                   |
|-----------|----------------------|---------------|---------------------------------------------------------|
| Box       | size_x, size_y, size_z | -           | Full extents, centered on the local origin.             |
| Sphere    | radius               | (none)        | Orientation carries no information.                     |
| Cylinder  | radius, length       | +Z            | Full length, centered on the local origin.              |
| Capsule   | radius, length       | +Z            | Length of the cylindrical section, caps excluded.       |
| Mesh      | - (dimensionless)    | -             | Reference string and per-axis scale, content not read.  |
*/
// clang-format on

struct Shape
{
  ShapeType type = ShapeType::None;
  std::vector<double> dimensions;
  Eigen::Vector3d scale{ 1, 1, 1 };  // mesh only
  std::string uri;                   // mesh only, as authored
};

Shape makeBox(double size_x, double size_y, double size_z);
Shape makeSphere(double radius);
Shape makeCylinder(double radius, double length);
Shape makeCapsule(double radius, double length);
Shape makeMesh(const std::string& uri, const Eigen::Vector3d& scale = Eigen::Vector3d::Ones());

// Number of entries expected in Shape::dimensions for a type.
std::size_t dimensionCount(ShapeType type);

/**
 * @brief Check the dimension invariants of a shape.
 * @throws std::invalid_argument if a dimension is missing, non-finite or not strictly positive,
 *         or if a mesh has an empty reference or a zero scale component.
 */
void validateShape(const Shape& shape);

// True for shapes whose orientation about +Z (or entirely, for spheres) carries no information.
bool hasAxialSymmetry(ShapeType type);

double getShapeRadius(const Shape& shape);
double getShapeLength(const Shape& shape);
Eigen::Vector3d getBoxSize(const Shape& shape);

ShapeType shapeTypeFromString(const std::string& str);
std::string shapeTypeToString(ShapeType type);

std::ostream& operator<<(std::ostream& os, ShapeType type);
std::ostream& operator<<(std::ostream& os, const Shape& shape);

}  // namespace geometry
}  // namespace robodiff

#endif  // ROBODIFF_GEOMETRY_SHAPE_H_
