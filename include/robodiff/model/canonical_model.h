#ifndef ROBODIFF_MODEL_CANONICAL_MODEL_H_
#define ROBODIFF_MODEL_CANONICAL_MODEL_H_

#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Core>

#include <robodiff/geometry/frame.h>
#include <robodiff/geometry/shape.h>

namespace robodiff {
namespace model {

enum class ModelFormat
{
  Urdf,
  Sdf,
  Mjcf,
  Usd,
};

enum class JointType
{
  Fixed,
  Revolute,
  Continuous,
  Prismatic,
  Planar,
  Floating,
};

// Where an entity was authored. Never compared.
struct SourceLocation
{
  std::string file;
  int line = 0;          // XML sources
  std::string prim_path;  // USD sources

  std::string toString() const;
};

struct Warning
{
  SourceLocation location;
  std::string message;
};

struct Inertial
{
  double mass = 0.0;
  Eigen::Vector3d center_of_mass = Eigen::Vector3d::Zero();  // link frame
  Eigen::Matrix3d inertia = Eigen::Matrix3d::Zero();         // about the COM, link frame axes
};

struct GeometryInstance
{
  std::string name;
  geometry::Shape shape;
  geometry::Pose pose;  // relative to the link frame
  SourceLocation location;
};

struct Link
{
  std::string name;
  std::optional<Inertial> inertial;
  std::vector<GeometryInstance> collisions;
  std::vector<GeometryInstance> visuals;
  SourceLocation location;
};

struct Joint
{
  std::string name;
  JointType type = JointType::Fixed;
  std::string parent_link;
  std::string child_link;
  geometry::Pose origin;               // child link frame in the parent link frame
  std::optional<Eigen::Vector3d> axis;  // child link frame, unit length
  SourceLocation location;
};

/**
 * @brief Format-agnostic description of one robot: a tree of links connected by joints.
 *
 * Joints reference links by name; both are owned by the model.
 */
struct CanonicalModel
{
  std::string name;
  std::string source;
  ModelFormat format = ModelFormat::Urdf;
  std::vector<Link> links;
  std::vector<Joint> joints;
  std::vector<Warning> warnings;

  const Link* findLink(const std::string& link_name) const;
  const Joint* findJoint(const std::string& joint_name) const;
  Link* findLink(const std::string& link_name);

  void addWarning(const SourceLocation& location, const std::string& message);
};

/**
 * @brief Check that the link/joint graph is a tree.
 *
 * Rejects duplicate link or joint names, joints referencing unknown links, links with more than one
 * parent joint, more than one root, cycles and disconnected links.
 * @throws ParseError naming the offending entity.
 */
void validateTree(const CanonicalModel& model);

// Joint kinds that carry a motion axis.
bool jointTypeHasAxis(JointType type);

JointType jointTypeFromString(const std::string& str);
std::string jointTypeToString(JointType type);

ModelFormat modelFormatFromString(const std::string& str);
std::string modelFormatToString(ModelFormat format);

std::ostream& operator<<(std::ostream& os, JointType type);
std::ostream& operator<<(std::ostream& os, ModelFormat format);

}  // namespace model
}  // namespace robodiff

#endif  // ROBODIFF_MODEL_CANONICAL_MODEL_H_
