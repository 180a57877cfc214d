#include <robodiff/adapters/sdf_parser.h>

#include <stdexcept>

#include <robodiff/errors.h>
#include <robodiff/xml/element_parser.h>
#include <robodiff/xml/utils.h>

namespace robodiff {
namespace adapters {

namespace {

bool isModelFrame(const std::string& name)
{
  return name.empty() || name == "__model__" || name == "world";
}

}  // namespace

SdfParser::SdfParser() = default;
SdfParser::~SdfParser() = default;

model::CanonicalModel SdfParser::loadModelFromText(const std::string& text, const std::string& /*base_dir*/,
                                                   const std::string& source_name)
{
  filename = source_name;
  frames.clear();
  resolved.clear();
  resolving.clear();
  doc = xml::loadDocumentFromText(text, source_name);

  const tinyxml2::XMLElement* sdf = doc->FirstChildElement("sdf");
  if (!sdf)
    throw ParseError(source_name, "missing <sdf> root element");

  const tinyxml2::XMLElement* model_elem = sdf->FirstChildElement("model");
  if (!model_elem)
  {
    const auto* world = sdf->FirstChildElement("world");
    if (world)
    {
      model_elem = world->FirstChildElement("model");
      if (model_elem && model_elem->NextSiblingElement("model"))
        throw ParseError(xml::where(world, filename), "<world> contains more than one <model>");
    }
  }
  if (!model_elem)
    throw ParseError(xml::where(sdf, filename), "no <model> found");

  model::CanonicalModel model;
  model.name = xml::reqAttribute(model_elem, "name", filename);
  model.source = source_name;
  model.format = model::ModelFormat::Sdf;

  for (const auto* e = model_elem->FirstChildElement("model"); e; e = e->NextSiblingElement("model"))
    recordUnsupported(model, xml::locationOf(e, filename),
                      UnsupportedElementError(xml::where(e, filename), "model/model"));
  for (const auto* e = model_elem->FirstChildElement("include"); e; e = e->NextSiblingElement("include"))
    recordUnsupported(model, xml::locationOf(e, filename),
                      UnsupportedElementError(xml::where(e, filename), "model/include"));

  registerFrames(model_elem);

  for (const auto* elem = model_elem->FirstChildElement("link"); elem; elem = elem->NextSiblingElement("link"))
    model.links.push_back(parseLink(elem, model));

  for (const auto* elem = model_elem->FirstChildElement("joint"); elem; elem = elem->NextSiblingElement("joint"))
  {
    model::Joint joint;
    if (parseJoint(elem, model, joint))
      model.joints.push_back(std::move(joint));
  }

  model::validateTree(model);
  return model;
}

void SdfParser::registerFrames(const tinyxml2::XMLElement* model_elem)
{
  auto add = [&](const tinyxml2::XMLElement* e, const std::string& default_relative_to) {
    const std::string name = xml::reqAttribute(e, "name", filename);
    if (isModelFrame(name))
      throw ParseError(xml::where(e, filename), "reserved frame name '" + name + "'");
    if (!frames.emplace(name, FrameSpec{ e, default_relative_to }).second)
      throw ParseError(xml::where(e, filename), "duplicate frame name '" + name + "'");
  };

  for (const auto* e = model_elem->FirstChildElement("link"); e; e = e->NextSiblingElement("link"))
    add(e, "__model__");
  for (const auto* e = model_elem->FirstChildElement("joint"); e; e = e->NextSiblingElement("joint"))
    add(e, xml::childText(e, "child"));
  for (const auto* e = model_elem->FirstChildElement("frame"); e; e = e->NextSiblingElement("frame"))
    add(e, e->Attribute("attached_to") ? e->Attribute("attached_to") : "__model__");
}

Eigen::Isometry3d SdfParser::resolveFrame(const std::string& name, const tinyxml2::XMLElement* context)
{
  if (isModelFrame(name))
    return Eigen::Isometry3d::Identity();

  auto cached = resolved.find(name);
  if (cached != resolved.end())
    return cached->second;

  auto it = frames.find(name);
  if (it == frames.end())
    throw ParseError(xml::where(context, filename), "unknown frame '" + name + "'");
  if (!resolving.insert(name).second)
    throw ParseError(xml::where(it->second.elem, filename), "cycle in pose frame graph at '" + name + "'");

  const auto* pose_elem = it->second.elem->FirstChildElement("pose");
  std::string relative_to = it->second.default_relative_to;
  if (pose_elem && pose_elem->Attribute("relative_to"))
    relative_to = pose_elem->Attribute("relative_to");
  if (relative_to == name)
    throw ParseError(xml::where(it->second.elem, filename), "frame '" + name + "' is relative to itself");

  Eigen::Isometry3d X = resolveFrame(relative_to, it->second.elem) * parsePose(pose_elem);
  resolving.erase(name);
  resolved.emplace(name, X);
  return X;
}

Eigen::Isometry3d SdfParser::parsePose(const tinyxml2::XMLElement* pose_elem) const
{
  if (!pose_elem || !pose_elem->GetText())
    return Eigen::Isometry3d::Identity();

  const std::string loc = xml::where(pose_elem, filename);
  const std::string rotation_format =
      pose_elem->Attribute("rotation_format") ? pose_elem->Attribute("rotation_format") : "euler_rpy";
  const bool degrees = pose_elem->BoolAttribute("degrees", false);
  const auto v = xml::parseNumberList(pose_elem->GetText(), loc);

  geometry::Pose pose;
  try
  {
    if (rotation_format == "euler_rpy")
    {
      if (v.size() != 6)
        throw ParseError(loc, "pose expects 6 values, got " + std::to_string(v.size()));
      const double k = degrees ? geometry::toRadians(1.0) : 1.0;
      pose = geometry::makePose(Eigen::Vector3d(v[0], v[1], v[2]),
                                geometry::quaternionFromRPY(v[3] * k, v[4] * k, v[5] * k));
    }
    else if (rotation_format == "quat_xyzw")
    {
      if (v.size() != 7)
        throw ParseError(loc, "quat_xyzw pose expects 7 values, got " + std::to_string(v.size()));
      pose = geometry::makePose(Eigen::Vector3d(v[0], v[1], v[2]),
                                geometry::quaternionFromXYZW(v[3], v[4], v[5], v[6]));
    }
    else
    {
      throw ParseError(loc, "unknown rotation_format '" + rotation_format + "'");
    }
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(loc, e.what());
  }
  return geometry::toIsometry(pose);
}

geometry::Pose SdfParser::poseInLink(const tinyxml2::XMLElement* elem, const std::string& link)
{
  const auto* pose_elem = elem->FirstChildElement("pose");
  const Eigen::Isometry3d raw = parsePose(pose_elem);
  if (!pose_elem || !pose_elem->Attribute("relative_to") || pose_elem->Attribute("relative_to") == link)
    return geometry::poseFromIsometry(raw);

  const Eigen::Isometry3d X_link = resolveFrame(link, elem);
  const Eigen::Isometry3d X_rel = resolveFrame(pose_elem->Attribute("relative_to"), elem);
  return geometry::poseFromIsometry(X_link.inverse() * X_rel * raw);
}

model::Link SdfParser::parseLink(const tinyxml2::XMLElement* elem, model::CanonicalModel& model)
{
  model::Link link;
  link.name = xml::reqAttribute(elem, "name", filename);
  link.location = xml::locationOf(elem, filename);

  if (const auto* inertial = elem->FirstChildElement("inertial"))
    link.inertial = parseInertial(inertial, link.name);

  parseGeometryInstances(elem, "collision", link.name, link.collisions, model);
  parseGeometryInstances(elem, "visual", link.name, link.visuals, model);
  return link;
}

model::Inertial SdfParser::parseInertial(const tinyxml2::XMLElement* elem, const std::string& link)
{
  model::Inertial inertial;
  const geometry::Pose frame = poseInLink(elem, link);
  inertial.center_of_mass = frame.position;
  inertial.mass = xml::childNumber(elem, "mass", 1.0, filename);
  if (!(inertial.mass >= 0.0))
    throw ParseError(xml::where(elem, filename), "negative mass");

  Eigen::Matrix3d local = Eigen::Matrix3d::Identity();
  if (const auto* I = elem->FirstChildElement("inertia"))
  {
    local = geometry::inertiaFromComponents(
        xml::childNumber(I, "ixx", 1.0, filename), xml::childNumber(I, "ixy", 0.0, filename),
        xml::childNumber(I, "ixz", 0.0, filename), xml::childNumber(I, "iyy", 1.0, filename),
        xml::childNumber(I, "iyz", 0.0, filename), xml::childNumber(I, "izz", 1.0, filename));
  }
  inertial.inertia = geometry::rotateInertia(local, frame.orientation);
  return inertial;
}

void SdfParser::parseGeometryInstances(const tinyxml2::XMLElement* link_elem, const char* tag, const std::string& link,
                                       std::vector<model::GeometryInstance>& out, model::CanonicalModel& model)
{
  for (const auto* elem = link_elem->FirstChildElement(tag); elem; elem = elem->NextSiblingElement(tag))
  {
    model::GeometryInstance g;
    g.name = elem->Attribute("name") ? elem->Attribute("name") : "";
    g.location = xml::locationOf(elem, filename);
    g.pose = poseInLink(elem, link);
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

geometry::Shape SdfParser::parseGeometry(const tinyxml2::XMLElement* elem) const
{
  const tinyxml2::XMLElement* shape_elem = elem->FirstChildElement();
  if (!shape_elem)
    throw ParseError(xml::where(elem, filename), "<geometry> has no shape");

  const std::string type = shape_elem->Name();
  const std::string loc = xml::where(shape_elem, filename);

  geometry::Shape shape;
  if (type == "box")
  {
    const auto* size = xml::reqChild(shape_elem, "size", filename);
    auto s = xml::parseNumberList(size->GetText() ? size->GetText() : "", loc, 3);
    shape = geometry::makeBox(s[0], s[1], s[2]);
  }
  else if (type == "sphere")
  {
    shape = geometry::makeSphere(xml::reqChildNumber(shape_elem, "radius", filename));
  }
  else if (type == "cylinder")
  {
    shape = geometry::makeCylinder(xml::reqChildNumber(shape_elem, "radius", filename),
                                   xml::reqChildNumber(shape_elem, "length", filename));
  }
  else if (type == "capsule")
  {
    shape = geometry::makeCapsule(xml::reqChildNumber(shape_elem, "radius", filename),
                                  xml::reqChildNumber(shape_elem, "length", filename));
  }
  else if (type == "mesh")
  {
    const std::string uri = xml::childText(shape_elem, "uri");
    if (uri.empty())
      throw ParseError(loc, "<mesh> is missing required child <uri>");
    Eigen::Vector3d scale = Eigen::Vector3d::Ones();
    const std::string scale_text = xml::childText(shape_elem, "scale");
    if (!scale_text.empty())
    {
      auto s = xml::parseNumberList(scale_text, loc, 3);
      scale = Eigen::Vector3d(s[0], s[1], s[2]);
    }
    shape = geometry::makeMesh(uri, scale);
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

bool SdfParser::parseJoint(const tinyxml2::XMLElement* elem, model::CanonicalModel& model, model::Joint& joint)
{
  joint.name = xml::reqAttribute(elem, "name", filename);
  joint.location = xml::locationOf(elem, filename);
  const std::string loc = xml::where(elem, filename);

  joint.parent_link = xml::childText(elem, "parent");
  joint.child_link = xml::childText(elem, "child");
  if (joint.parent_link.empty())
    throw ParseError(loc, "joint '" + joint.name + "' is missing <parent>");
  if (joint.child_link.empty())
    throw ParseError(loc, "joint '" + joint.name + "' is missing <child>");
  if (joint.child_link == "world")
    throw ParseError(loc, "joint '" + joint.name + "' has 'world' as child");

  // Anchors the root link to the world, not part of the link tree.
  if (joint.parent_link == "world")
    return false;

  const std::string type = xml::reqAttribute(elem, "type", filename);
  if (type == "fixed" || type == "revolute" || type == "continuous" || type == "prismatic")
  {
    joint.type = model::jointTypeFromString(type);
  }
  else if (type == "ball" || type == "universal" || type == "revolute2" || type == "screw" || type == "gearbox")
  {
    recordUnsupported(model, joint.location, UnsupportedElementError(loc, "joint/" + type),
                      "connection kept as fixed");
    joint.type = model::JointType::Fixed;
  }
  else
  {
    throw ParseError(loc, "unknown joint type '" + type + "'");
  }

  const Eigen::Isometry3d X_parent = resolveFrame(joint.parent_link, elem);
  const Eigen::Isometry3d X_child = resolveFrame(joint.child_link, elem);
  joint.origin = geometry::poseFromIsometry(X_parent.inverse() * X_child);

  if (model::jointTypeHasAxis(joint.type))
  {
    Eigen::Vector3d xyz = Eigen::Vector3d::UnitZ();
    Eigen::Matrix3d R_expressed = resolveFrame(joint.name, elem).rotation();

    if (const auto* axis = elem->FirstChildElement("axis"))
    {
      if (const auto* xyz_elem = axis->FirstChildElement("xyz"))
      {
        auto v = xml::parseNumberList(xyz_elem->GetText() ? xyz_elem->GetText() : "", xml::where(xyz_elem, filename),
                                      3);
        xyz = Eigen::Vector3d(v[0], v[1], v[2]);
        if (const char* expressed_in = xyz_elem->Attribute("expressed_in"))
          R_expressed = resolveFrame(expressed_in, xyz_elem).rotation();
      }
      if (xml::childText(axis, "use_parent_model_frame") == "true" ||
          xml::childText(axis, "use_parent_model_frame") == "1")
        R_expressed = Eigen::Matrix3d::Identity();
    }

    try
    {
      joint.axis = geometry::normalizeDirection(X_child.rotation().transpose() * R_expressed * xyz);
    }
    catch (const std::invalid_argument& e)
    {
      throw ParseError(loc, "joint '" + joint.name + "': " + e.what());
    }
  }
  return true;
}

}  // namespace adapters
}  // namespace robodiff
