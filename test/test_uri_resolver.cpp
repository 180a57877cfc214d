#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>

#include <robodiff/errors.h>
#include <robodiff/uri_resolver.h>

using namespace robodiff;

TEST(MeshReference, PackageAndModelSchemes)
{
  EXPECT_EQ(normalizeMeshReference("package://my_robot/meshes/arm.stl", MeshReferenceMode::FullPath), "meshes/arm.stl");
  EXPECT_EQ(normalizeMeshReference("model://my_robot/meshes/arm.stl", MeshReferenceMode::FullPath), "meshes/arm.stl");
  EXPECT_EQ(normalizeMeshReference("file:///opt/meshes/arm.stl", MeshReferenceMode::FullPath), "/opt/meshes/arm.stl");
}

TEST(MeshReference, LexicalNormalization)
{
  EXPECT_EQ(normalizeMeshReference("meshes/./sub/../arm.stl", MeshReferenceMode::FullPath), "meshes/arm.stl");
  EXPECT_EQ(normalizeMeshReference("meshes\\arm.stl", MeshReferenceMode::FullPath), "meshes/arm.stl");
}

TEST(MeshReference, FileNameMode)
{
  const auto a = normalizeMeshReference("package://robot/meshes/visual/arm.stl", MeshReferenceMode::FileName);
  const auto b = normalizeMeshReference("../assets/arm.stl", MeshReferenceMode::FileName);
  EXPECT_EQ(a, "arm.stl");
  EXPECT_EQ(a, b);
}

TEST(MeshReference, InLayerReferencesKept)
{
  EXPECT_EQ(normalizeMeshReference("usd:base/collisions/mesh_0", MeshReferenceMode::FileName),
            "usd:base/collisions/mesh_0");
}

TEST(MeshReference, JoinReference)
{
  EXPECT_EQ(joinReference("assets", "arm.stl"), "assets/arm.stl");
  EXPECT_EQ(joinReference("assets/../meshes", "arm.stl"), "meshes/arm.stl");
  EXPECT_EQ(joinReference("assets", "/abs/arm.stl"), "/abs/arm.stl");
  EXPECT_EQ(joinReference("assets", "package://robot/arm.stl"), "package://robot/arm.stl");
  EXPECT_EQ(joinReference("", "arm.stl"), "arm.stl");
}

TEST(MeshReference, ModeNames)
{
  EXPECT_EQ(meshReferenceModeFromString("file_name"), MeshReferenceMode::FileName);
  EXPECT_EQ(meshReferenceModeFromString("full_path"), MeshReferenceMode::FullPath);
  EXPECT_EQ(meshReferenceModeToString(MeshReferenceMode::FullPath), "full_path");
  EXPECT_THROW(meshReferenceModeFromString("basename"), std::runtime_error);
}

TEST(FileHelpers, DirectoryAndContents)
{
  EXPECT_EQ(getDirectory("/robots/arm/arm.usda"), "/robots/arm");
  EXPECT_EQ(getDirectory("arm.urdf"), "");

  const auto path = std::filesystem::temp_directory_path() / "robodiff_uri_resolver_contents.txt";
  std::ofstream(path.string()) << "#usda 1.0\n";
  EXPECT_EQ(readFile(path.string()), "#usda 1.0\n");
  EXPECT_THROW(readFile((std::filesystem::temp_directory_path() / "__missing__.usda").string()), ParseError);
}
