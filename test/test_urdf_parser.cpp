#include <cmath>
#include <filesystem>
#include <fstream>

#include <robodiff/adapters/urdf_parser.h>
#include <robodiff/errors.h>

#include <gtest/gtest.h>

using namespace robodiff;
using namespace robodiff::model;
namespace fs = std::filesystem;

constexpr double POSITION_EPSILON = 1e-09;
constexpr double ROTATION_EPSILON = 1e-09;

static std::string writeTempFile(const std::string& filename, const std::string& contents)
{
  fs::path dir = fs::temp_directory_path() / "robodiff_urdf_tests";
  fs::create_directories(dir);
  fs::path p = dir / filename;
  std::ofstream(p.string()) << contents;
  return p.string();
}

static const char* kArmUrdf = R"(<?xml version="1.0"?>
<robot name="two_link_arm">
  <material name="blue"><color rgba="0 0 1 1"/></material>
  <link name="base">
    <inertial>
      <origin xyz="0 0 0.05" rpy="0 0 1.5707963267948966"/>
      <mass value="2.5"/>
      <inertia ixx="0.1" ixy="0" ixz="0" iyy="0.2" iyz="0" izz="0.3"/>
    </inertial>
    <visual>
      <geometry><mesh filename="package://arm/meshes/base.dae"/></geometry>
      <material name="blue"/>
    </visual>
    <collision name="base_box">
      <origin xyz="0 0 0.05"/>
      <geometry><box size="0.2 0.3 0.1"/></geometry>
    </collision>
  </link>
  <link name="arm1">
    <collision>
      <origin xyz="0 0 0.25" rpy="0 1.5707963267948966 0"/>
      <geometry><cylinder radius="0.05" length="0.5"/></geometry>
    </collision>
    <collision>
      <geometry><mesh filename="package://arm/meshes/arm1.stl" scale="0.001 0.001 0.001"/></geometry>
    </collision>
  </link>
  <link name="tool"/>
  <joint name="shoulder" type="revolute">
    <parent link="base"/>
    <child link="arm1"/>
    <origin xyz="0 0 0.1" rpy="0 0 0"/>
    <axis xyz="0 0 2"/>
    <limit lower="-1" upper="1" effort="10" velocity="1"/>
    <dynamics damping="0.1"/>
  </joint>
  <joint name="tool_joint" type="prismatic">
    <parent link="arm1"/>
    <child link="tool"/>
    <origin xyz="0 0 0.5"/>
  </joint>
  <transmission name="t1"/>
</robot>
)";

TEST(UrdfParser, LinksJointsAndGeometry)
{
  adapters::UrdfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmUrdf, "", "arm.urdf");

  EXPECT_EQ(model.name, "two_link_arm");
  EXPECT_EQ(model.format, ModelFormat::Urdf);
  ASSERT_EQ(model.links.size(), 3u);
  ASSERT_EQ(model.joints.size(), 2u);
  EXPECT_TRUE(model.warnings.empty());

  const Link* base = model.findLink("base");
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(base->collisions.size(), 1u);
  EXPECT_EQ(base->collisions[0].name, "base_box");
  EXPECT_TRUE(geometry::getBoxSize(base->collisions[0].shape).isApprox(Eigen::Vector3d(0.2, 0.3, 0.1)));
  EXPECT_NEAR(base->collisions[0].pose.position.z(), 0.05, POSITION_EPSILON);
  ASSERT_EQ(base->visuals.size(), 1u);
  EXPECT_EQ(base->visuals[0].shape.uri, "package://arm/meshes/base.dae");

  const Link* arm1 = model.findLink("arm1");
  ASSERT_NE(arm1, nullptr);
  ASSERT_EQ(arm1->collisions.size(), 2u);
  EXPECT_EQ(arm1->collisions[0].shape.type, geometry::ShapeType::Cylinder);
  EXPECT_DOUBLE_EQ(geometry::getShapeRadius(arm1->collisions[0].shape), 0.05);
  EXPECT_DOUBLE_EQ(geometry::getShapeLength(arm1->collisions[0].shape), 0.5);
  EXPECT_TRUE(arm1->collisions[1].shape.scale.isApprox(Eigen::Vector3d::Constant(0.001)));
  EXPECT_FALSE(arm1->inertial.has_value());

  EXPECT_EQ(model.findLink("tool")->collisions.size(), 0u);
}

TEST(UrdfParser, InertialOriginRotatesTensor)
{
  adapters::UrdfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmUrdf, "", "arm.urdf");

  const auto& inertial = model.findLink("base")->inertial;
  ASSERT_TRUE(inertial.has_value());
  EXPECT_DOUBLE_EQ(inertial->mass, 2.5);
  EXPECT_NEAR(inertial->center_of_mass.z(), 0.05, POSITION_EPSILON);
  // Yaw of 90 degrees swaps ixx and iyy in the link frame.
  EXPECT_NEAR(inertial->inertia(0, 0), 0.2, POSITION_EPSILON);
  EXPECT_NEAR(inertial->inertia(1, 1), 0.1, POSITION_EPSILON);
  EXPECT_NEAR(inertial->inertia(2, 2), 0.3, POSITION_EPSILON);
}

TEST(UrdfParser, JointKindsAndAxes)
{
  adapters::UrdfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmUrdf, "", "arm.urdf");

  const Joint* shoulder = model.findJoint("shoulder");
  ASSERT_NE(shoulder, nullptr);
  EXPECT_EQ(shoulder->type, JointType::Revolute);
  EXPECT_EQ(shoulder->parent_link, "base");
  EXPECT_EQ(shoulder->child_link, "arm1");
  EXPECT_NEAR(shoulder->origin.position.z(), 0.1, POSITION_EPSILON);
  ASSERT_TRUE(shoulder->axis.has_value());
  EXPECT_TRUE(shoulder->axis->isApprox(Eigen::Vector3d::UnitZ(), POSITION_EPSILON));

  // Missing <axis> defaults to X.
  const Joint* tool = model.findJoint("tool_joint");
  ASSERT_NE(tool, nullptr);
  EXPECT_EQ(tool->type, JointType::Prismatic);
  ASSERT_TRUE(tool->axis.has_value());
  EXPECT_TRUE(tool->axis->isApprox(Eigen::Vector3d::UnitX(), POSITION_EPSILON));
}

TEST(UrdfParser, FixedJointHasNoAxis)
{
  const std::string urdf = R"(<robot name="r">
    <link name="a"/><link name="b"/>
    <joint name="j" type="fixed"><parent link="a"/><child link="b"/><axis xyz="0 1 0"/></joint>
  </robot>)";
  adapters::UrdfParser parser;
  const CanonicalModel model = parser.loadModelFromText(urdf);
  EXPECT_FALSE(model.findJoint("j")->axis.has_value());
}

TEST(UrdfParser, UnsupportedGeometryIsWarning)
{
  const std::string urdf = R"(<robot name="r">
    <link name="a">
      <collision><geometry><cone radius="0.1" length="0.2"/></geometry></collision>
      <collision><geometry><sphere radius="0.1"/></geometry></collision>
    </link>
  </robot>)";
  adapters::UrdfParser parser;
  const CanonicalModel model = parser.loadModelFromText(urdf, "", "cone.urdf");

  ASSERT_EQ(model.warnings.size(), 1u);
  EXPECT_NE(model.warnings[0].message.find("geometry/cone"), std::string::npos);
  EXPECT_EQ(model.warnings[0].location.file, "cone.urdf");
  EXPECT_EQ(model.warnings[0].location.line, 3);

  ASSERT_EQ(model.links[0].collisions.size(), 1u);
  EXPECT_EQ(model.links[0].collisions[0].shape.type, geometry::ShapeType::Sphere);
}

TEST(UrdfParser, NonPositiveExtentIsParseError)
{
  const std::string urdf = R"(<robot name="r">
    <link name="a"><collision><geometry><box size="1 0 1"/></geometry></collision></link>
  </robot>)";
  adapters::UrdfParser parser;
  EXPECT_THROW(parser.loadModelFromText(urdf), ParseError);
}

TEST(UrdfParser, UnknownJointTypeIsParseError)
{
  const std::string urdf = R"(<robot name="r">
    <link name="a"/><link name="b"/>
    <joint name="j" type="hinge"><parent link="a"/><child link="b"/></joint>
  </robot>)";
  adapters::UrdfParser parser;
  try
  {
    parser.loadModelFromText(urdf, "", "bad.urdf");
    FAIL() << "expected ParseError";
  }
  catch (const ParseError& e)
  {
    EXPECT_EQ(e.location(), "bad.urdf:3");
    EXPECT_NE(e.reason().find("hinge"), std::string::npos);
  }
}

TEST(UrdfParser, MissingRequiredElements)
{
  adapters::UrdfParser parser;
  EXPECT_THROW(parser.loadModelFromText("<robot name=\"r\"><link/></robot>"), ParseError);
  EXPECT_THROW(parser.loadModelFromText("<sdf/>"), ParseError);
  EXPECT_THROW(parser.loadModelFromText("<robot name=\"r\"><link name=\"a\">"), ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<robot name="r"><link name="a">
      <inertial><mass value="1"/></inertial></link></robot>)"),
               ParseError);
}

TEST(UrdfParser, NonFiniteNumbersAreParseError)
{
  adapters::UrdfParser parser;
  EXPECT_THROW(parser.loadModelFromText(R"(<robot name="r"><link name="a">
      <collision><origin rpy="nan 0 0"/><geometry><sphere radius="1"/></geometry></collision>
    </link></robot>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<robot name="r"><link name="a">
      <visual><origin xyz="inf 0 0"/><geometry><sphere radius="1"/></geometry></visual>
    </link></robot>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<robot name="r"><link name="a">
      <inertial><mass value="nan"/><inertia ixx="1" ixy="0" ixz="0" iyy="1" iyz="0" izz="1"/></inertial>
    </link></robot>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<robot name="r"><link name="a">
      <collision><geometry><box size="1 -inf 1"/></geometry></collision>
    </link></robot>)"),
               ParseError);
}

TEST(UrdfParser, TreeViolationIsParseError)
{
  const std::string urdf = R"(<robot name="r">
    <link name="a"/><link name="b"/><link name="c"/>
    <joint name="j" type="fixed"><parent link="a"/><child link="b"/></joint>
  </robot>)";
  adapters::UrdfParser parser;
  EXPECT_THROW(parser.loadModelFromText(urdf), ParseError);
}

TEST(UrdfParser, LoadFromFile)
{
  const std::string path = writeTempFile("arm.urdf", kArmUrdf);
  adapters::UrdfParser parser;
  const CanonicalModel model = parser.loadModelFromFile(path);
  EXPECT_EQ(model.source, path);
  EXPECT_EQ(model.findJoint("shoulder")->location.file, path);
  EXPECT_GT(model.findJoint("shoulder")->location.line, 0);

  EXPECT_THROW(parser.loadModelFromFile((fs::temp_directory_path() / "__missing__.urdf").string()), ParseError);
}
