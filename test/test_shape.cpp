#include <sstream>
#include <stdexcept>

#include <robodiff/geometry/shape.h>

#include <gtest/gtest.h>

using namespace robodiff::geometry;

TEST(Shape, Builders)
{
  const Shape box = makeBox(1, 2, 3);
  EXPECT_EQ(box.type, ShapeType::Box);
  EXPECT_TRUE(getBoxSize(box).isApprox(Eigen::Vector3d(1, 2, 3)));

  const Shape cyl = makeCylinder(0.1, 0.5);
  EXPECT_DOUBLE_EQ(getShapeRadius(cyl), 0.1);
  EXPECT_DOUBLE_EQ(getShapeLength(cyl), 0.5);

  const Shape mesh = makeMesh("meshes/arm.stl", Eigen::Vector3d(0.001, 0.001, 0.001));
  EXPECT_EQ(mesh.uri, "meshes/arm.stl");
  EXPECT_DOUBLE_EQ(mesh.scale.x(), 0.001);
}

TEST(Shape, ValidateRejectsNonPositiveExtents)
{
  EXPECT_NO_THROW(validateShape(makeSphere(0.2)));
  EXPECT_THROW(validateShape(makeSphere(0.0)), std::invalid_argument);
  EXPECT_THROW(validateShape(makeBox(1, -2, 3)), std::invalid_argument);
  EXPECT_THROW(validateShape(makeCapsule(0.1, 0.0)), std::invalid_argument);
  EXPECT_THROW(validateShape(makeMesh("a.stl", Eigen::Vector3d(1, 0, 1))), std::invalid_argument);
  EXPECT_THROW(validateShape(makeMesh("")), std::invalid_argument);
  EXPECT_THROW(validateShape(Shape()), std::invalid_argument);
}

TEST(Shape, AxialSymmetry)
{
  EXPECT_TRUE(hasAxialSymmetry(ShapeType::Cylinder));
  EXPECT_TRUE(hasAxialSymmetry(ShapeType::Capsule));
  EXPECT_FALSE(hasAxialSymmetry(ShapeType::Box));
  EXPECT_FALSE(hasAxialSymmetry(ShapeType::Mesh));
}

TEST(Shape, AccessorsRejectWrongType)
{
  EXPECT_THROW(getBoxSize(makeSphere(1.0)), std::invalid_argument);
  EXPECT_THROW(getShapeLength(makeBox(1, 1, 1)), std::invalid_argument);
}

TEST(Shape, TypeNames)
{
  for (auto type : { ShapeType::Box, ShapeType::Sphere, ShapeType::Cylinder, ShapeType::Capsule, ShapeType::Mesh })
    EXPECT_EQ(shapeTypeFromString(shapeTypeToString(type)), type);
  EXPECT_THROW(shapeTypeFromString("ellipsoid"), std::runtime_error);

  std::ostringstream os;
  os << ShapeType::Capsule;
  EXPECT_EQ(os.str(), "capsule");
}
