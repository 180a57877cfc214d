#include <cmath>
#include <filesystem>
#include <fstream>

#include <robodiff/adapters/mjcf_parser.h>
#include <robodiff/errors.h>

#include <gtest/gtest.h>

using namespace robodiff;
using namespace robodiff::model;
namespace fs = std::filesystem;

constexpr double POSITION_EPSILON = 1e-09;
constexpr double ROTATION_EPSILON = 1e-09;

static std::string writeTempFile(const std::string& filename, const std::string& contents)
{
  fs::path dir = fs::temp_directory_path() / "robodiff_mjcf_tests";
  fs::create_directories(dir);
  fs::path p = dir / filename;
  std::ofstream(p.string()) << contents;
  return p.string();
}

static const char* kArmMjcf = R"(<mujoco model="two_link_arm">
  <compiler angle="radian" meshdir="meshes"/>
  <option timestep="0.002"/>
  <default>
    <geom rgba="0.5 0.5 0.5 1"/>
    <default class="visual">
      <geom contype="0" conaffinity="0" group="2"/>
    </default>
    <default class="arm">
      <joint axis="0 1 0" damping="0.1"/>
    </default>
  </default>
  <asset>
    <mesh name="base_mesh" file="base.stl" scale="0.001 0.001 0.001"/>
    <material name="grey" rgba="0.5 0.5 0.5 1"/>
  </asset>
  <worldbody>
    <light name="top" pos="0 0 3"/>
    <body name="base">
      <inertial pos="0 0 0.05" mass="2.5" diaginertia="0.1 0.2 0.3" euler="0 0 1.5707963267948966"/>
      <geom name="base_box" type="box" size="0.1 0.15 0.05" pos="0 0 0.05"/>
      <geom class="visual" type="mesh" mesh="base_mesh"/>
      <body name="arm1" pos="0 0 0.1">
        <joint name="shoulder" type="hinge" axis="0 0 1" range="-1 1"/>
        <geom name="arm1_cyl" type="cylinder" fromto="0 0 0 0 0 0.5" size="0.05"/>
        <body name="tool" pos="0 0 0.5" childclass="arm">
          <joint name="tool_joint" type="slide"/>
          <geom type="capsule" size="0.02 0.05"/>
        </body>
      </body>
    </body>
  </worldbody>
  <actuator>
    <motor joint="shoulder" gear="100"/>
  </actuator>
</mujoco>
)";

TEST(MjcfParser, BodiesBecomeLinksAndJoints)
{
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmMjcf, "", "arm.xml");

  EXPECT_EQ(model.name, "two_link_arm");
  EXPECT_EQ(model.format, ModelFormat::Mjcf);
  ASSERT_EQ(model.links.size(), 3u);
  ASSERT_EQ(model.joints.size(), 2u);
  EXPECT_TRUE(model.warnings.empty());

  const Joint* shoulder = model.findJoint("shoulder");
  ASSERT_NE(shoulder, nullptr);
  EXPECT_EQ(shoulder->parent_link, "base");
  EXPECT_EQ(shoulder->child_link, "arm1");
  EXPECT_EQ(shoulder->type, JointType::Revolute);
  EXPECT_TRUE(shoulder->origin.position.isApprox(Eigen::Vector3d(0, 0, 0.1), POSITION_EPSILON));
  EXPECT_TRUE(shoulder->axis->isApprox(Eigen::Vector3d::UnitZ(), POSITION_EPSILON));

  // Joint axis comes from the "arm" child class.
  const Joint* tool = model.findJoint("tool_joint");
  ASSERT_NE(tool, nullptr);
  EXPECT_EQ(tool->type, JointType::Prismatic);
  EXPECT_TRUE(tool->axis->isApprox(Eigen::Vector3d::UnitY(), POSITION_EPSILON));
}

TEST(MjcfParser, HalfExtentsBecomeFullExtents)
{
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmMjcf, "", "arm.xml");

  const Link* base = model.findLink("base");
  ASSERT_EQ(base->collisions.size(), 1u);
  EXPECT_TRUE(geometry::getBoxSize(base->collisions[0].shape).isApprox(Eigen::Vector3d(0.2, 0.3, 0.1)));

  const Link* tool = model.findLink("tool");
  ASSERT_EQ(tool->collisions.size(), 1u);
  EXPECT_DOUBLE_EQ(geometry::getShapeRadius(tool->collisions[0].shape), 0.02);
  EXPECT_DOUBLE_EQ(geometry::getShapeLength(tool->collisions[0].shape), 0.1);
}

TEST(MjcfParser, FromtoCylinder)
{
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmMjcf, "", "arm.xml");

  const auto& cyl = model.findLink("arm1")->collisions.at(0);
  EXPECT_EQ(cyl.shape.type, geometry::ShapeType::Cylinder);
  EXPECT_DOUBLE_EQ(geometry::getShapeRadius(cyl.shape), 0.05);
  EXPECT_NEAR(geometry::getShapeLength(cyl.shape), 0.5, POSITION_EPSILON);
  EXPECT_TRUE(cyl.pose.position.isApprox(Eigen::Vector3d(0, 0, 0.25), POSITION_EPSILON));
  EXPECT_NEAR(geometry::angularDistance(cyl.pose.orientation, Eigen::Quaterniond::Identity()), 0.0, ROTATION_EPSILON);
}

TEST(MjcfParser, FromtoAlongXMatchesRotatedCylinder)
{
  const std::string mjcf = R"(<mujoco>
    <worldbody><body name="a">
      <geom type="capsule" fromto="-0.2 0 0 0.2 0 0" size="0.03"/>
      <geom type="capsule" pos="0 0 0" euler="0 90 0" size="0.03 0.2"/>
    </body></worldbody>
  </mujoco>)";
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(mjcf);

  const auto& g = model.links[0].collisions;
  ASSERT_EQ(g.size(), 2u);
  EXPECT_NEAR(geometry::getShapeLength(g[0].shape), geometry::getShapeLength(g[1].shape), POSITION_EPSILON);
  const Eigen::Vector3d z0 = g[0].pose.orientation * Eigen::Vector3d::UnitZ();
  const Eigen::Vector3d z1 = g[1].pose.orientation * Eigen::Vector3d::UnitZ();
  EXPECT_NEAR(geometry::lineAngle(z0, z1), 0.0, ROTATION_EPSILON);
}

TEST(MjcfParser, VisualClassAndMeshAssets)
{
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmMjcf, "", "arm.xml");

  const Link* base = model.findLink("base");
  ASSERT_EQ(base->visuals.size(), 1u);
  EXPECT_EQ(base->visuals[0].shape.type, geometry::ShapeType::Mesh);
  EXPECT_EQ(base->visuals[0].shape.uri, "meshes/base.stl");
  EXPECT_TRUE(base->visuals[0].shape.scale.isApprox(Eigen::Vector3d::Constant(0.001)));
}

TEST(MjcfParser, InertialOrientation)
{
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(kArmMjcf, "", "arm.xml");

  const auto& inertial = model.findLink("base")->inertial;
  ASSERT_TRUE(inertial.has_value());
  EXPECT_DOUBLE_EQ(inertial->mass, 2.5);
  EXPECT_TRUE(inertial->center_of_mass.isApprox(Eigen::Vector3d(0, 0, 0.05)));
  EXPECT_NEAR(inertial->inertia(0, 0), 0.2, POSITION_EPSILON);
  EXPECT_NEAR(inertial->inertia(1, 1), 0.1, POSITION_EPSILON);
  EXPECT_NEAR(inertial->inertia(2, 2), 0.3, POSITION_EPSILON);
}

TEST(MjcfParser, FullInertiaOrder)
{
  const std::string mjcf = R"(<mujoco><worldbody><body name="a">
    <inertial pos="0 0 0" mass="1" fullinertia="1 2 3 0.1 0.2 0.3"/>
  </body></worldbody></mujoco>)";
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(mjcf);
  const Eigen::Matrix3d& I = model.links[0].inertial->inertia;
  EXPECT_NEAR(I(0, 0), 1.0, POSITION_EPSILON);
  EXPECT_NEAR(I(1, 1), 2.0, POSITION_EPSILON);
  EXPECT_NEAR(I(2, 2), 3.0, POSITION_EPSILON);
  EXPECT_NEAR(I(0, 1), 0.1, POSITION_EPSILON);
  EXPECT_NEAR(I(0, 2), 0.2, POSITION_EPSILON);
  EXPECT_NEAR(I(1, 2), 0.3, POSITION_EPSILON);
}

TEST(MjcfParser, DegreesAreTheDefaultAngleUnit)
{
  const std::string degrees = R"(<mujoco><worldbody><body name="a">
    <body name="b" euler="0 0 90"/>
  </body></worldbody></mujoco>)";
  const std::string radians = R"(<mujoco><compiler angle="radian"/><worldbody><body name="a">
    <body name="b" euler="0 0 1.5707963267948966"/>
  </body></worldbody></mujoco>)";

  adapters::MjcfParser parser;
  const CanonicalModel a = parser.loadModelFromText(degrees);
  const CanonicalModel b = parser.loadModelFromText(radians);
  EXPECT_NEAR(geometry::angularDistance(a.joints[0].origin.orientation, b.joints[0].origin.orientation), 0.0,
              ROTATION_EPSILON);
  EXPECT_NEAR(geometry::angularDistance(a.joints[0].origin.orientation, geometry::quaternionFromRPY(0, 0, M_PI_2)),
              0.0, ROTATION_EPSILON);
}

TEST(MjcfParser, ImplicitJoints)
{
  const std::string mjcf = R"(<mujoco><worldbody>
    <body name="a">
      <body name="b"/>
      <body name="c"><freejoint/></body>
      <body name="d"><joint name="spin"/></body>
    </body>
  </worldbody></mujoco>)";
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(mjcf);

  ASSERT_NE(model.findJoint("b_fixed"), nullptr);
  EXPECT_EQ(model.findJoint("b_fixed")->type, JointType::Fixed);
  ASSERT_NE(model.findJoint("c_freejoint"), nullptr);
  EXPECT_EQ(model.findJoint("c_freejoint")->type, JointType::Floating);
  // No range: an unlimited hinge.
  ASSERT_NE(model.findJoint("spin"), nullptr);
  EXPECT_EQ(model.findJoint("spin")->type, JointType::Continuous);
  EXPECT_TRUE(model.findJoint("spin")->axis->isApprox(Eigen::Vector3d::UnitZ()));
}

TEST(MjcfParser, Warnings)
{
  const std::string mjcf = R"(<mujoco><worldbody>
    <body name="a">
      <joint name="root" type="free"/>
      <geom type="ellipsoid" size="0.1 0.2 0.3"/>
      <geom type="sphere" size="0.1"/>
      <body>
        <joint name="j1" pos="0 0 0.1"/>
        <joint name="j2" type="slide"/>
      </body>
      <body name="c"><joint name="socket" type="ball"/></body>
    </body>
  </worldbody></mujoco>)";
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(mjcf, "", "warn.xml");

  auto hasWarning = [&](const std::string& text) {
    for (const auto& w : model.warnings)
    {
      if (w.message.find(text) != std::string::npos)
        return true;
    }
    return false;
  };
  EXPECT_TRUE(hasWarning("attaches it to the world"));
  EXPECT_TRUE(hasWarning("geom/ellipsoid"));
  EXPECT_TRUE(hasWarning("unnamed body, named 'body_0'"));
  EXPECT_TRUE(hasWarning("offset from its body frame"));
  EXPECT_TRUE(hasWarning("only 'j1' is compared"));
  EXPECT_TRUE(hasWarning("joint/ball"));
  EXPECT_EQ(model.warnings.size(), 6u);

  EXPECT_EQ(model.findLink("a")->collisions.size(), 1u);
  EXPECT_EQ(model.findJoint("socket")->type, JointType::Fixed);
  EXPECT_EQ(model.findJoint("j1")->child_link, "body_0");
}

TEST(MjcfParser, Errors)
{
  adapters::MjcfParser parser;
  EXPECT_THROW(parser.loadModelFromText("<robot/>"), ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a">
      <geom type="box" size="-1 1 1"/></body></worldbody></mujoco>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a">
      <geom type="capsule" pos="0 0 1" fromto="0 0 0 0 0 1" size="0.1"/></body></worldbody></mujoco>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a">
      <geom type="mesh" mesh="missing"/></body></worldbody></mujoco>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a" quat="1 0 0 0" euler="0 0 1">
      </body></worldbody></mujoco>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a">
      <geom class="nope" size="1"/></body></worldbody></mujoco>)"),
               ParseError);
}

TEST(MjcfParser, NonFiniteNumbersAreParseError)
{
  adapters::MjcfParser parser;
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a">
      <geom type="capsule" fromto="0 0 0 nan 0 1" size="0.1"/></body></worldbody></mujoco>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a">
      <body name="b" pos="0 inf 0"/></body></worldbody></mujoco>)"),
               ParseError);
  EXPECT_THROW(parser.loadModelFromText(R"(<mujoco><worldbody><body name="a">
      <inertial pos="0 0 0" mass="nan" diaginertia="1 1 1"/></body></worldbody></mujoco>)"),
               ParseError);
}

TEST(MjcfParser, FramesOffsetTheirContent)
{
  const std::string mjcf = R"(<mujoco>
    <compiler angle="radian"/>
    <default>
      <default class="ghost"><geom contype="0" conaffinity="0"/></default>
    </default>
    <worldbody>
      <body name="base">
        <frame pos="0 0 1" euler="0 0 1.5707963267948966">
          <geom type="sphere" size="0.1" pos="1 0 0"/>
          <frame pos="0 1 0" childclass="ghost">
            <geom type="sphere" size="0.2"/>
            <body name="arm" pos="1 0 0">
              <joint name="elbow" axis="0 0 1"/>
            </body>
          </frame>
        </frame>
      </body>
    </worldbody>
  </mujoco>)";
  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromText(mjcf);

  const Eigen::Quaterniond quarter_turn(Eigen::AngleAxisd(M_PI / 2, Eigen::Vector3d::UnitZ()));

  const Link* base = model.findLink("base");
  ASSERT_NE(base, nullptr);
  ASSERT_EQ(base->collisions.size(), 1u);
  EXPECT_TRUE(base->collisions[0].pose.position.isApprox(Eigen::Vector3d(0, 1, 1), POSITION_EPSILON));
  EXPECT_NEAR(geometry::angularDistance(base->collisions[0].pose.orientation, quarter_turn), 0.0, ROTATION_EPSILON);
  ASSERT_EQ(base->visuals.size(), 1u);
  EXPECT_TRUE(base->visuals[0].pose.position.isApprox(Eigen::Vector3d(-1, 0, 1), POSITION_EPSILON));

  const Joint* elbow = model.findJoint("elbow");
  ASSERT_NE(elbow, nullptr);
  EXPECT_EQ(elbow->parent_link, "base");
  EXPECT_EQ(elbow->child_link, "arm");
  EXPECT_TRUE(elbow->origin.position.isApprox(Eigen::Vector3d(-1, 1, 1), POSITION_EPSILON));
  EXPECT_NEAR(geometry::angularDistance(elbow->origin.orientation, quarter_turn), 0.0, ROTATION_EPSILON);
}

TEST(MjcfParser, IncludeFiles)
{
  writeTempFile("arm_parts.xml", R"(<mujoco>
    <body name="arm1" pos="0 0 0.1">
      <joint name="shoulder" axis="0 0 1"/>
      <geom type="sphere" size="0.05"/>
    </body>
  </mujoco>)");
  const std::string main = writeTempFile("arm_main.xml", R"(<mujoco model="split">
    <worldbody>
      <body name="base">
        <include file="arm_parts.xml"/>
      </body>
    </worldbody>
  </mujoco>)");

  adapters::MjcfParser parser;
  const CanonicalModel model = parser.loadModelFromFile(main);
  ASSERT_EQ(model.links.size(), 2u);
  ASSERT_NE(model.findJoint("shoulder"), nullptr);
  EXPECT_EQ(model.findJoint("shoulder")->parent_link, "base");
  EXPECT_NE(model.findLink("arm1")->location.file.find("arm_parts.xml"), std::string::npos);
}

TEST(MjcfParser, IncludeCycleIsParseError)
{
  writeTempFile("cycle_b.xml", R"(<mujoco><include file="cycle_a.xml"/></mujoco>)");
  const std::string a = writeTempFile("cycle_a.xml", R"(<mujoco>
    <include file="cycle_b.xml"/>
    <worldbody><body name="a"/></worldbody>
  </mujoco>)");

  adapters::MjcfParser parser;
  try
  {
    parser.loadModelFromFile(a);
    FAIL() << "expected ParseError";
  }
  catch (const ParseError& e)
  {
    EXPECT_NE(e.reason().find("include cycle"), std::string::npos);
  }
}
