#include <cmath>
#include <filesystem>
#include <fstream>

#include <robodiff/errors.h>
#include <robodiff/usd/stage.h>
#include <robodiff/usd/usda_reader.h>

#include <gtest/gtest.h>

using namespace robodiff;
using namespace robodiff::usd;
namespace fs = std::filesystem;

static std::string writeTempFile(const std::string& filename, const std::string& contents)
{
  fs::path dir = fs::temp_directory_path() / "robodiff_usda_tests";
  fs::create_directories(dir);
  fs::path p = dir / filename;
  std::ofstream(p.string()) << contents;
  return p.string();
}

static const char* kLayer = R"(#usda 1.0
(
    "Exported by hand"
    defaultPrim = "robot"
    metersPerUnit = 0.01
    upAxis = "Z"
    customLayerData = {
        string creator = "tests"
        dictionary nested = { int a = 1 }
    }
)

def Xform "robot" (
    prepend apiSchemas = ["PhysicsArticulationRootAPI"]
    kind = "component"
)
{
    rel isaac:physics:robotLinks = [</robot/base>, </robot/arm1>]

    def Xform "base" (
        prepend apiSchemas = ["PhysicsRigidBodyAPI", "PhysicsMassAPI"]
    )
    {
        float physics:mass = 2.5
        point3f physics:centerOfMass = (0, 0, 5)
        float3 physics:diagonalInertia = (1, 2, 3)
        quatf physics:principalAxes = (1, 0, 0, 0)
        double3 xformOp:translate = (0, 0, 0)
        uniform token[] xformOpOrder = ["xformOp:translate"]

        def Cube "box" (
            apiSchemas = ["PhysicsCollisionAPI"]
        )
        {
            double size = 2
            float3[] extent = [(-1, -1, -1), (1, 1, 1)]
            color3f[] primvars:displayColor = [(0.5, 0.5, 0.5)] (
                interpolation = "constant"
            )
        }
    }

    over "arm1"
    {
        custom float upper = inf
        float lower = -inf
        string doc = """multi
line"""
        asset mesh = @./meshes/arm.usd@
    }

    def PhysicsRevoluteJoint "shoulder"
    {
        rel physics:body0 = </robot/base>
        rel physics:body1 = </robot/arm1>
        uniform token physics:axis = "Z"
        float physics:lowerLimit = -57.29
        float physics:upperLimit = 57.29
    }
}
)";

TEST(UsdaReader, LayerMetadata)
{
  const Layer layer = parseLayer(kLayer, "robot.usda", "");
  EXPECT_EQ(layer.default_prim, "robot");
  ASSERT_TRUE(layer.meters_per_unit.has_value());
  EXPECT_DOUBLE_EQ(*layer.meters_per_unit, 0.01);
  EXPECT_TRUE(layer.sublayers.empty());
  ASSERT_EQ(layer.root_prims.size(), 1u);
}

TEST(UsdaReader, PrimTree)
{
  const Layer layer = parseLayer(kLayer, "robot.usda", "");

  const PrimSpec* robot = layer.findPrim("/robot");
  ASSERT_NE(robot, nullptr);
  EXPECT_EQ(robot->type_name, "Xform");
  EXPECT_EQ(robot->line, 13);
  ASSERT_EQ(robot->api_schemas.size(), 1u);
  ASSERT_EQ(robot->children.size(), 3u);

  const auto& links = robot->relationships.at("isaac:physics:robotLinks");
  ASSERT_EQ(links.targets.size(), 2u);
  EXPECT_EQ(links.targets[1], "/robot/arm1");

  const PrimSpec* box = layer.findPrim("/robot/base/box");
  ASSERT_NE(box, nullptr);
  EXPECT_EQ(box->type_name, "Cube");
  EXPECT_EQ(box->api_schemas, std::vector<std::string>{ "PhysicsCollisionAPI" });
  EXPECT_EQ(box->attributes.at("extent").type_name, "float3[]");
  EXPECT_EQ(box->attributes.at("primvars:displayColor").value.kind, Value::Kind::List);

  const PrimSpec* arm1 = layer.findPrim("/robot/arm1");
  ASSERT_NE(arm1, nullptr);
  EXPECT_EQ(arm1->specifier, Specifier::Over);
  EXPECT_TRUE(arm1->type_name.empty());

  EXPECT_EQ(layer.findPrim("/robot/missing"), nullptr);
  EXPECT_EQ(layer.findPrim("robot"), nullptr);
}

TEST(UsdaReader, AttributeValues)
{
  const Layer layer = parseLayer(kLayer, "robot.usda", "");

  const PrimSpec* base = layer.findPrim("/robot/base");
  EXPECT_DOUBLE_EQ(toNumber(base->attributes.at("physics:mass").value), 2.5);
  EXPECT_TRUE(toVector3(base->attributes.at("physics:diagonalInertia").value).isApprox(Eigen::Vector3d(1, 2, 3)));
  EXPECT_EQ(toTexts(base->attributes.at("xformOpOrder").value), std::vector<std::string>{ "xformOp:translate" });
  EXPECT_EQ(base->attributes.at("xformOpOrder").type_name, "token[]");

  // USD writes quaternions real part first.
  const Eigen::Quaterniond q = toQuaternion(base->attributes.at("physics:principalAxes").value);
  EXPECT_DOUBLE_EQ(q.w(), 1.0);
  EXPECT_DOUBLE_EQ(q.x(), 0.0);

  const PrimSpec* arm1 = layer.findPrim("/robot/arm1");
  EXPECT_TRUE(std::isinf(toNumber(arm1->attributes.at("upper").value)));
  EXPECT_LT(toNumber(arm1->attributes.at("lower").value), 0.0);
  EXPECT_EQ(toText(arm1->attributes.at("doc").value), "multi\nline");
  EXPECT_EQ(arm1->attributes.at("mesh").value.kind, Value::Kind::Asset);
  EXPECT_EQ(toText(arm1->attributes.at("mesh").value), "./meshes/arm.usd");

  EXPECT_THROW(toVector3(base->attributes.at("physics:mass").value), std::invalid_argument);
  EXPECT_THROW(toNumber(arm1->attributes.at("doc").value), std::invalid_argument);
}

TEST(UsdaReader, Matrix)
{
  const std::string text = R"(#usda 1.0
def Xform "a"
{
    matrix4d xformOp:transform = ( (1, 0, 0, 0), (0, 1, 0, 0), (0, 0, 1, 0), (1, 2, 3, 1) )
}
)";
  const Layer layer = parseLayer(text, "m.usda", "");
  const Eigen::Matrix4d m = toMatrix4(layer.findPrim("/a")->attributes.at("xformOp:transform").value);
  EXPECT_DOUBLE_EQ(m(3, 0), 1.0);
  EXPECT_DOUBLE_EQ(m(3, 2), 3.0);
  EXPECT_DOUBLE_EQ(m(0, 3), 0.0);
}

TEST(UsdaReader, ListOps)
{
  const std::string text = R"(#usda 1.0
(
    subLayers = [@base.usda@, @extra.usda@]
)
def Xform "a" (
    apiSchemas = ["A", "B"]
    prepend apiSchemas = ["C"]
    append apiSchemas = ["A", "D"]
    delete apiSchemas = ["B"]
    references = @parts.usda@</part>
    append references = </local>
    inherits = </_class>
)
{
    rel r = </x>
    append rel r = [</y>, </x>]
}
)";
  const Layer layer = parseLayer(text, "ops.usda", "dir");
  EXPECT_EQ(layer.directory, "dir");
  EXPECT_EQ(layer.sublayers, (std::vector<std::string>{ "base.usda", "extra.usda" }));

  const PrimSpec* a = layer.findPrim("/a");
  EXPECT_EQ(a->api_schemas, (std::vector<std::string>{ "C", "A", "D" }));
  ASSERT_EQ(a->references.size(), 2u);
  EXPECT_EQ(a->references[0].asset, "parts.usda");
  EXPECT_EQ(a->references[0].prim_path, "/part");
  EXPECT_TRUE(a->references[1].asset.empty());
  EXPECT_EQ(a->references[1].prim_path, "/local");
  EXPECT_EQ(a->inherits, std::vector<std::string>{ "/_class" });
  EXPECT_EQ(a->relationships.at("r").targets, (std::vector<std::string>{ "/x", "/y" }));
}

TEST(UsdaReader, VariantSetsAreSkipped)
{
  const std::string text = R"(#usda 1.0
def Xform "a" (
    variants = { string look = "red" }
    prepend variantSets = "look"
)
{
    variantSet "look" = {
        "red" { float v = 1 }
        "blue" { float v = 2 }
    }
    float w = 3
}
)";
  const Layer layer = parseLayer(text, "v.usda", "");
  const PrimSpec* a = layer.findPrim("/a");
  ASSERT_NE(a, nullptr);
  EXPECT_EQ(a->attributes.count("v"), 0u);
  EXPECT_DOUBLE_EQ(toNumber(a->attributes.at("w").value), 3.0);
}

TEST(UsdaReader, RejectsBinaryAndMalformedLayers)
{
  EXPECT_THROW(parseLayer("PXR-USDC\x00\x01", "robot.usd", ""), ParseError);
  EXPECT_THROW(parseLayer("PK\x03\x04", "robot.usdz", ""), ParseError);
  EXPECT_THROW(parseLayer("def Xform \"a\" {}", "nohdr.usda", ""), ParseError);

  try
  {
    parseLayer("#usda 1.0\ndef Xform \"a\"\n{\n    float x = \n}\n", "bad.usda", "");
    FAIL() << "expected ParseError";
  }
  catch (const ParseError& e)
  {
    EXPECT_EQ(e.location(), "bad.usda:5");
  }

  EXPECT_THROW(parseLayer("#usda 1.0\ndef Xform \"a\"\n{\n", "open.usda", ""), ParseError);
  EXPECT_THROW(parseLayer("#usda 1.0\ndef Xform a {}\n", "name.usda", ""), ParseError);
}

TEST(UsdStage, SublayersReferencesAndOvers)
{
  writeTempFile("stage_part.usda", R"(#usda 1.0
(
    defaultPrim = "part"
)
def Xform "part"
{
    float mass = 1
    def Sphere "ball" { double radius = 0.5 }
}
)");
  writeTempFile("stage_weak.usda", R"(#usda 1.0
over "robot"
{
    float mass = 7
    float only_weak = 3
}
)");
  const std::string root = writeTempFile("stage_root.usda", R"(#usda 1.0
(
    defaultPrim = "robot"
    subLayers = [@stage_weak.usda@]
)
def Xform "robot"
{
    float mass = 5
    def Xform "arm" (
        references = @stage_part.usda@
    )
    {
        over "ball" { double radius = 0.25 }
    }
    class "hidden" {}
}
)");

  Stage stage;
  stage.openFile(root);
  EXPECT_EQ(stage.robotPrimPath(), "/robot");
  EXPECT_DOUBLE_EQ(stage.metersPerUnit(), 1.0);

  const Prim robot = stage.compose("/robot");
  // The root layer is stronger than its sublayer.
  EXPECT_DOUBLE_EQ(toNumber(robot.attribute("mass")->value), 5.0);
  EXPECT_DOUBLE_EQ(toNumber(robot.attribute("only_weak")->value), 3.0);
  EXPECT_EQ(robot.child("hidden"), nullptr);

  const Prim* arm = robot.child("arm");
  ASSERT_NE(arm, nullptr);
  EXPECT_DOUBLE_EQ(toNumber(arm->attribute("mass")->value), 1.0);
  ASSERT_EQ(arm->referenced_assets.size(), 1u);

  const Prim* ball = arm->child("ball");
  ASSERT_NE(ball, nullptr);
  EXPECT_EQ(ball->path, "/robot/arm/ball");
  EXPECT_EQ(ball->type_name, "Sphere");
  EXPECT_DOUBLE_EQ(toNumber(ball->attribute("radius")->value), 0.25);
}

TEST(UsdStage, InheritsAndRelationshipMapping)
{
  const std::string text = R"(#usda 1.0
def Xform "robot"
{
    def Xform "base" (
        inherits = </_body>
    )
    {
    }
    def Xform "j" (
        references = </proto>
    )
    {
    }
}
class "_body" (
    apiSchemas = ["PhysicsRigidBodyAPI"]
)
{
    float physics:mass = 2
}
def Xform "proto"
{
    rel physics:body0 = </proto/a>
    rel physics:body1 = <../robot/base>
}
)";
  Stage stage;
  stage.openText(text, "", "inline.usda");
  EXPECT_EQ(stage.robotPrimPath(), "/robot");

  const Prim robot = stage.compose("/robot");
  const Prim* base = robot.child("base");
  ASSERT_NE(base, nullptr);
  EXPECT_TRUE(base->hasApi("PhysicsRigidBodyAPI"));
  EXPECT_DOUBLE_EQ(toNumber(base->attribute("physics:mass")->value), 2.0);

  const Prim* j = robot.child("j");
  ASSERT_NE(j, nullptr);
  ASSERT_NE(j->relationship("physics:body0"), nullptr);
  EXPECT_EQ(j->relationship("physics:body0")->at(0), "/robot/j/a");
  EXPECT_EQ(j->relationship("physics:body1")->at(0), "/robot/base");
}

TEST(UsdStage, CompositionCycles)
{
  const std::string text = R"(#usda 1.0
def Xform "a" (
    references = </b>
)
{
}
def Xform "b" (
    references = </a>
)
{
}
)";
  Stage stage;
  stage.openText(text, "", "cycle.usda");
  try
  {
    stage.compose("/a");
    FAIL() << "expected ParseError";
  }
  catch (const ParseError& e)
  {
    EXPECT_NE(e.reason().find("composition cycle"), std::string::npos);
  }

  writeTempFile("sub_a.usda", "#usda 1.0\n(\n    subLayers = [@sub_b.usda@]\n)\n");
  writeTempFile("sub_b.usda", "#usda 1.0\n(\n    subLayers = [@sub_a.usda@]\n)\n");
  Stage sub_stage;
  sub_stage.openFile((fs::temp_directory_path() / "robodiff_usda_tests" / "sub_a.usda").string());
  EXPECT_THROW(sub_stage.compose("/a"), ParseError);
}

TEST(UsdStage, MissingPrim)
{
  Stage stage;
  stage.openText("#usda 1.0\n", "", "empty.usda");
  EXPECT_THROW(stage.robotPrimPath(), ParseError);
  EXPECT_THROW(stage.compose("/robot"), ParseError);
}
