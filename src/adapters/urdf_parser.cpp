#include <robodiff/adapters/urdf_parser.h>

#include <stdexcept>

#include <robodiff/errors.h>
#include <robodiff/xml/element_parser.h>
#include <robodiff/xml/utils.h>

namespace robodiff {
namespace adapters {

UrdfParser::UrdfParser() = default;
UrdfParser::~UrdfParser() = default;

model::CanonicalModel UrdfParser::loadModelFromText(const std::string& text, const std::string& /*base_dir*/,
                                                    const std::string& source_name)
{
  filename = source_name;
  doc = xml::loadDocumentFromText(text, source_name);

  const tinyxml2::XMLElement* robot = doc->FirstChildElement("robot");
  if (!robot)
    throw ParseError(source_name, "missing <robot> root element");

  model::CanonicalModel model;
  model.name = xml::reqAttribute(robot, "name", filename);
  model.source = source_name;
  model.format = model::ModelFormat::Urdf;

  for (const auto* elem = robot->FirstChildElement("link"); elem; elem = elem->NextSiblingElement("link"))
    model.links.push_back(parseLink(elem, model));

  for (const auto* elem = robot->FirstChildElement("joint"); elem; elem = elem->NextSiblingElement("joint"))
    model.joints.push_back(parseJoint(elem));

  model::validateTree(model);
  return model;
}

model::Link UrdfParser::parseLink(const tinyxml2::XMLElement* elem, model::CanonicalModel& model) const
{
  model::Link link;
  link.name = xml::reqAttribute(elem, "name", filename);
  link.location = xml::locationOf(elem, filename);

  if (const auto* inertial = elem->FirstChildElement("inertial"))
    link.inertial = parseInertial(inertial);

  parseGeometryInstances(elem, "collision", link.collisions, model);
  parseGeometryInstances(elem, "visual", link.visuals, model);
  return link;
}

model::Inertial UrdfParser::parseInertial(const tinyxml2::XMLElement* elem) const
{
  model::Inertial inertial;
  const geometry::Pose frame = parseOrigin(elem);
  inertial.center_of_mass = frame.position;
  inertial.mass = xml::reqNumberAttribute(xml::reqChild(elem, "mass", filename), "value", filename);
  if (!(inertial.mass >= 0.0))
    throw ParseError(xml::where(elem, filename), "negative mass");

  const auto* I = xml::reqChild(elem, "inertia", filename);
  const Eigen::Matrix3d local = geometry::inertiaFromComponents(
      xml::reqNumberAttribute(I, "ixx", filename), xml::reqNumberAttribute(I, "ixy", filename),
      xml::reqNumberAttribute(I, "ixz", filename), xml::reqNumberAttribute(I, "iyy", filename),
      xml::reqNumberAttribute(I, "iyz", filename), xml::reqNumberAttribute(I, "izz", filename));
  inertial.inertia = geometry::rotateInertia(local, frame.orientation);
  return inertial;
}

void UrdfParser::parseGeometryInstances(const tinyxml2::XMLElement* link_elem, const char* tag,
                                        std::vector<model::GeometryInstance>& out, model::CanonicalModel& model) const
{
  for (const auto* elem = link_elem->FirstChildElement(tag); elem; elem = elem->NextSiblingElement(tag))
  {
    model::GeometryInstance g;
    g.name = elem->Attribute("name") ? elem->Attribute("name") : "";
    g.location = xml::locationOf(elem, filename);
    g.pose = parseOrigin(elem);
    try
    {
      g.shape = parseGeometry(xml::reqChild(elem, "geometry", filename));
    }
    catch (const UnsupportedElementError& e)
    {
      recordUnsupported(model, g.location, e);
      continue;
    }
    out.push_back(std::move(g));
  }
}

geometry::Shape UrdfParser::parseGeometry(const tinyxml2::XMLElement* elem) const
{
  const tinyxml2::XMLElement* shape_elem = elem->FirstChildElement();
  if (!shape_elem)
    throw ParseError(xml::where(elem, filename), "<geometry> has no shape");

  const std::string type = shape_elem->Name();
  const std::string loc = xml::where(shape_elem, filename);

  geometry::Shape shape;
  if (type == "box")
  {
    auto s = xml::parseNumberList(xml::reqAttribute(shape_elem, "size", filename), loc, 3);
    shape = geometry::makeBox(s[0], s[1], s[2]);
  }
  else if (type == "sphere")
  {
    shape = geometry::makeSphere(xml::reqNumberAttribute(shape_elem, "radius", filename));
  }
  else if (type == "cylinder")
  {
    shape = geometry::makeCylinder(xml::reqNumberAttribute(shape_elem, "radius", filename),
                                   xml::reqNumberAttribute(shape_elem, "length", filename));
  }
  else if (type == "capsule")
  {
    shape = geometry::makeCapsule(xml::reqNumberAttribute(shape_elem, "radius", filename),
                                  xml::reqNumberAttribute(shape_elem, "length", filename));
  }
  else if (type == "mesh")
  {
    shape = geometry::makeMesh(xml::reqAttribute(shape_elem, "filename", filename),
                               xml::vector3Attribute(shape_elem, "scale", Eigen::Vector3d::Ones(), filename));
  }
  else
  {
    throw UnsupportedElementError(loc, "geometry/" + type);
  }

  try
  {
    geometry::validateShape(shape);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(loc, e.what());
  }
  return shape;
}

model::Joint UrdfParser::parseJoint(const tinyxml2::XMLElement* elem) const
{
  model::Joint joint;
  joint.name = xml::reqAttribute(elem, "name", filename);
  joint.location = xml::locationOf(elem, filename);

  const std::string type = xml::reqAttribute(elem, "type", filename);
  try
  {
    joint.type = model::jointTypeFromString(type);
  }
  catch (const std::runtime_error&)
  {
    throw ParseError(xml::where(elem, filename), "unknown joint type '" + type + "'");
  }

  joint.parent_link = xml::reqAttribute(xml::reqChild(elem, "parent", filename), "link", filename);
  joint.child_link = xml::reqAttribute(xml::reqChild(elem, "child", filename), "link", filename);
  joint.origin = parseOrigin(elem);

  if (model::jointTypeHasAxis(joint.type))
  {
    Eigen::Vector3d axis = Eigen::Vector3d::UnitX();
    if (const auto* axis_elem = elem->FirstChildElement("axis"))
      axis = xml::vector3Attribute(axis_elem, "xyz", axis, filename);
    try
    {
      joint.axis = geometry::normalizeDirection(axis);
    }
    catch (const std::invalid_argument& e)
    {
      throw ParseError(xml::where(elem, filename), "joint '" + joint.name + "': " + e.what());
    }
  }
  return joint;
}

geometry::Pose UrdfParser::parseOrigin(const tinyxml2::XMLElement* parent) const
{
  const auto* origin = parent->FirstChildElement("origin");
  if (!origin)
    return geometry::Pose();

  const Eigen::Vector3d xyz = xml::vector3Attribute(origin, "xyz", Eigen::Vector3d::Zero(), filename);
  const Eigen::Vector3d rpy = xml::vector3Attribute(origin, "rpy", Eigen::Vector3d::Zero(), filename);
  try
  {
    return geometry::makePose(xyz, geometry::quaternionFromRPY(rpy.x(), rpy.y(), rpy.z()));
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(xml::where(origin, filename), std::string("<origin>: ") + e.what());
  }
}

}  // namespace adapters
}  // namespace robodiff
