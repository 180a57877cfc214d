#include <robodiff/model/canonical_model.h>

#include <stdexcept>
#include <unordered_map>

#include <robodiff/errors.h>
#include <robodiff/graph/directed_graph.h>

namespace robodiff {
namespace model {

std::string SourceLocation::toString() const
{
  std::string s = file;
  if (line > 0)
    s += ":" + std::to_string(line);
  if (!prim_path.empty())
    s += (s.empty() ? "" : ":") + prim_path;
  return s;
}

const Link* CanonicalModel::findLink(const std::string& link_name) const
{
  for (const auto& link : links)
  {
    if (link.name == link_name)
      return &link;
  }
  return nullptr;
}

Link* CanonicalModel::findLink(const std::string& link_name)
{
  for (auto& link : links)
  {
    if (link.name == link_name)
      return &link;
  }
  return nullptr;
}

const Joint* CanonicalModel::findJoint(const std::string& joint_name) const
{
  for (const auto& joint : joints)
  {
    if (joint.name == joint_name)
      return &joint;
  }
  return nullptr;
}

void CanonicalModel::addWarning(const SourceLocation& location, const std::string& message)
{
  warnings.push_back(Warning{ location, message });
}

void validateTree(const CanonicalModel& model)
{
  if (model.links.empty())
    throw ParseError(model.source, "model '" + model.name + "' has no links");

  std::unordered_map<std::string, int> link_index;
  for (std::size_t i = 0; i < model.links.size(); ++i)
  {
    const Link& link = model.links[i];
    if (!link_index.emplace(link.name, static_cast<int>(i)).second)
      throw ParseError(link.location.toString(), "duplicate link name '" + link.name + "'");
  }

  std::unordered_map<std::string, const Joint*> joint_names;
  std::unordered_map<std::string, const Joint*> parent_joint_of;
  std::vector<graph::DirectedGraph::Edge> edges;
  edges.reserve(model.joints.size());

  for (const auto& joint : model.joints)
  {
    const std::string where = joint.location.toString();
    if (!joint_names.emplace(joint.name, &joint).second)
      throw ParseError(where, "duplicate joint name '" + joint.name + "'");

    auto p = link_index.find(joint.parent_link);
    if (p == link_index.end())
      throw ParseError(where, "joint '" + joint.name + "' references unknown parent link '" + joint.parent_link + "'");
    auto c = link_index.find(joint.child_link);
    if (c == link_index.end())
      throw ParseError(where, "joint '" + joint.name + "' references unknown child link '" + joint.child_link + "'");

    if (p->second == c->second)
      throw ParseError(where, "joint '" + joint.name + "' connects link '" + joint.child_link + "' to itself");

    auto [it, inserted] = parent_joint_of.emplace(joint.child_link, &joint);
    if (!inserted)
      throw ParseError(where, "link '" + joint.child_link + "' has more than one parent joint ('" + it->second->name +
                                  "' and '" + joint.name + "')");

    edges.emplace_back(p->second, c->second);
  }

  graph::DirectedGraph g(model.links.size(), edges);

  const std::vector<int> roots = g.roots();
  if (roots.empty())
    throw ParseError(model.source, "kinematic graph has no root link (cycle)");
  if (roots.size() > 1)
    throw ParseError(model.source, "kinematic graph has more than one root link ('" + model.links[roots[0]].name +
                                       "' and '" + model.links[roots[1]].name + "')");

  const std::vector<int> reached = g.reachableFrom(roots.front());
  if (reached.size() != model.links.size())
  {
    std::vector<bool> seen(model.links.size(), false);
    for (int v : reached)
      seen[v] = true;
    for (std::size_t i = 0; i < seen.size(); ++i)
    {
      if (!seen[i])
        throw ParseError(model.links[i].location.toString(),
                         "link '" + model.links[i].name + "' is not reachable from root link '" +
                             model.links[roots.front()].name + "' (cycle or disconnected component)");
    }
  }
}

bool jointTypeHasAxis(JointType type)
{
  return type == JointType::Revolute || type == JointType::Continuous || type == JointType::Prismatic ||
         type == JointType::Planar;
}

JointType jointTypeFromString(const std::string& str)
{
  if (str == "fixed")
    return JointType::Fixed;
  if (str == "revolute")
    return JointType::Revolute;
  if (str == "continuous")
    return JointType::Continuous;
  if (str == "prismatic")
    return JointType::Prismatic;
  if (str == "planar")
    return JointType::Planar;
  if (str == "floating")
    return JointType::Floating;
  throw std::runtime_error("Unknown JointType: " + str);
}

std::string jointTypeToString(JointType type)
{
  switch (type)
  {
    case JointType::Fixed:
      return "fixed";
    case JointType::Revolute:
      return "revolute";
    case JointType::Continuous:
      return "continuous";
    case JointType::Prismatic:
      return "prismatic";
    case JointType::Planar:
      return "planar";
    case JointType::Floating:
      return "floating";
  }
  return "unknown";
}

ModelFormat modelFormatFromString(const std::string& str)
{
  if (str == "urdf")
    return ModelFormat::Urdf;
  if (str == "sdf")
    return ModelFormat::Sdf;
  if (str == "mjcf")
    return ModelFormat::Mjcf;
  if (str == "usd")
    return ModelFormat::Usd;
  throw std::runtime_error("Unknown ModelFormat: " + str);
}

std::string modelFormatToString(ModelFormat format)
{
  switch (format)
  {
    case ModelFormat::Urdf:
      return "urdf";
    case ModelFormat::Sdf:
      return "sdf";
    case ModelFormat::Mjcf:
      return "mjcf";
    case ModelFormat::Usd:
      return "usd";
  }
  return "unknown";
}

std::ostream& operator<<(std::ostream& os, JointType type)
{
  return os << jointTypeToString(type);
}

std::ostream& operator<<(std::ostream& os, ModelFormat format)
{
  return os << modelFormatToString(format);
}

}  // namespace model
}  // namespace robodiff
