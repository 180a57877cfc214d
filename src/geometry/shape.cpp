#include <robodiff/geometry/shape.h>

#include <cmath>
#include <stdexcept>

namespace robodiff {
namespace geometry {

Shape makeBox(double size_x, double size_y, double size_z)
{
  Shape s;
  s.type = ShapeType::Box;
  s.dimensions = { size_x, size_y, size_z };
  return s;
}

Shape makeSphere(double radius)
{
  Shape s;
  s.type = ShapeType::Sphere;
  s.dimensions = { radius };
  return s;
}

Shape makeCylinder(double radius, double length)
{
  Shape s;
  s.type = ShapeType::Cylinder;
  s.dimensions = { radius, length };
  return s;
}

Shape makeCapsule(double radius, double length)
{
  Shape s;
  s.type = ShapeType::Capsule;
  s.dimensions = { radius, length };
  return s;
}

Shape makeMesh(const std::string& uri, const Eigen::Vector3d& scale)
{
  Shape s;
  s.type = ShapeType::Mesh;
  s.uri = uri;
  s.scale = scale;
  return s;
}

std::size_t dimensionCount(ShapeType type)
{
  switch (type)
  {
    case ShapeType::Box:
      return 3;
    case ShapeType::Sphere:
      return 1;
    case ShapeType::Cylinder:
    case ShapeType::Capsule:
      return 2;
    default:
      return 0;
  }
}

void validateShape(const Shape& shape)
{
  if (shape.type == ShapeType::None)
    throw std::invalid_argument("shape has no type");

  const std::size_t expected = dimensionCount(shape.type);
  if (shape.dimensions.size() != expected)
    throw std::invalid_argument(shapeTypeToString(shape.type) + " expects " + std::to_string(expected) +
                                " dimension(s), got " + std::to_string(shape.dimensions.size()));

  for (double d : shape.dimensions)
  {
    if (!std::isfinite(d) || d <= 0.0)
      throw std::invalid_argument(shapeTypeToString(shape.type) + " dimension must be strictly positive, got " +
                                  std::to_string(d));
  }

  if (shape.type == ShapeType::Mesh)
  {
    if (shape.uri.empty())
      throw std::invalid_argument("mesh reference is empty");
    for (int i = 0; i < 3; ++i)
    {
      if (!std::isfinite(shape.scale[i]) || shape.scale[i] == 0.0)
        throw std::invalid_argument("mesh scale components must be non-zero");
    }
  }
}

bool hasAxialSymmetry(ShapeType type)
{
  return type == ShapeType::Sphere || type == ShapeType::Cylinder || type == ShapeType::Capsule;
}

double getShapeRadius(const Shape& shape)
{
  if (shape.type != ShapeType::Sphere && shape.type != ShapeType::Cylinder && shape.type != ShapeType::Capsule)
    throw std::invalid_argument("shape " + shapeTypeToString(shape.type) + " has no radius");
  return shape.dimensions.at(0);
}

double getShapeLength(const Shape& shape)
{
  if (shape.type != ShapeType::Cylinder && shape.type != ShapeType::Capsule)
    throw std::invalid_argument("shape " + shapeTypeToString(shape.type) + " has no length");
  return shape.dimensions.at(1);
}

Eigen::Vector3d getBoxSize(const Shape& shape)
{
  if (shape.type != ShapeType::Box)
    throw std::invalid_argument("shape " + shapeTypeToString(shape.type) + " is not a box");
  return Eigen::Vector3d(shape.dimensions.at(0), shape.dimensions.at(1), shape.dimensions.at(2));
}

ShapeType shapeTypeFromString(const std::string& str)
{
  if (str == "box")
    return ShapeType::Box;
  if (str == "sphere")
    return ShapeType::Sphere;
  if (str == "cylinder")
    return ShapeType::Cylinder;
  if (str == "capsule")
    return ShapeType::Capsule;
  if (str == "mesh")
    return ShapeType::Mesh;
  throw std::runtime_error("Unknown ShapeType: " + str);
}

std::string shapeTypeToString(ShapeType type)
{
  switch (type)
  {
    case ShapeType::Box:
      return "box";
    case ShapeType::Sphere:
      return "sphere";
    case ShapeType::Cylinder:
      return "cylinder";
    case ShapeType::Capsule:
      return "capsule";
    case ShapeType::Mesh:
      return "mesh";
    default:
      return "none";
  }
}

std::ostream& operator<<(std::ostream& os, ShapeType type)
{
  return os << shapeTypeToString(type);
}

std::ostream& operator<<(std::ostream& os, const Shape& shape)
{
  os << shape.type;
  if (shape.type == ShapeType::Mesh)
    return os << "(" << shape.uri << ", scale=" << shape.scale.transpose() << ")";

  os << "(";
  for (std::size_t i = 0; i < shape.dimensions.size(); ++i)
    os << (i ? ", " : "") << shape.dimensions[i];
  return os << ")";
}

}  // namespace geometry
}  // namespace robodiff
