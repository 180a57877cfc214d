#include <robodiff/adapters/mjcf_parser.h>

#include <algorithm>
#include <filesystem>
#include <stdexcept>

#include <robodiff/errors.h>
#include <robodiff/uri_resolver.h>
#include <robodiff/xml/element_parser.h>
#include <robodiff/xml/utils.h>

namespace robodiff {
namespace adapters {

namespace {

std::string includeKey(const std::string& path)
{
  std::error_code ec;
  auto abs = std::filesystem::absolute(path, ec);
  return (ec ? std::filesystem::path(path) : abs).lexically_normal().generic_string();
}

}  // namespace

MjcfParser::MjcfParser() = default;
MjcfParser::~MjcfParser() = default;

model::CanonicalModel MjcfParser::loadModelFromText(const std::string& text, const std::string& base_dir,
                                                    const std::string& source_name)
{
  filename = source_name;
  this->base_dir = base_dir;
  compiler = Compiler();
  classes.clear();
  meshes.clear();
  unnamed_bodies = 0;
  docs.clear();
  doc_files.clear();
  included.clear();
  include_stack = { includeKey(source_name) };

  docs.push_back(xml::loadDocumentFromText(text, source_name));
  doc_files[docs.back().get()] = source_name;

  const tinyxml2::XMLElement* root = docs.back()->FirstChildElement("mujoco");
  if (!root)
    throw ParseError(source_name, "missing <mujoco> root element");

  model::CanonicalModel model;
  model.name = root->Attribute("model") ? root->Attribute("model") : "MuJoCo Model";
  model.source = source_name;
  model.format = model::ModelFormat::Mjcf;

  const auto top = children(root);
  for (const auto* e : top)
  {
    if (std::string(e->Name()) == "compiler")
      parseCompiler(e);
  }

  classes["main"] = DefaultClass();
  bool main_defined = false;
  for (const auto* e : top)
  {
    if (std::string(e->Name()) != "default")
      continue;
    if (main_defined)
      throw ParseError(where(e), "more than one top-level <default>");
    main_defined = true;
    parseDefault(e, "");
  }

  for (const auto* e : top)
  {
    if (std::string(e->Name()) == "asset")
      parseAssets(e);
  }

  for (const auto* e : top)
  {
    if (std::string(e->Name()) != "worldbody")
      continue;
    std::vector<Framed> bodies;
    framedChildren(e, "body", geometry::Pose(), "", bodies);
    for (const auto& body : bodies)
      parseBody(body.elem, "", body.childclass, body.offset, model);
  }

  model::validateTree(model);
  return model;
}

std::vector<const tinyxml2::XMLElement*> MjcfParser::children(const tinyxml2::XMLElement* parent, const char* name)
{
  std::vector<const tinyxml2::XMLElement*> out;
  for (const auto* c = parent->FirstChildElement(); c; c = c->NextSiblingElement())
  {
    if (std::string(c->Name()) == "include")
      spliceInclude(c, name, out);
    else if (!name || std::string(c->Name()) == name)
      out.push_back(c);
  }
  return out;
}

void MjcfParser::spliceInclude(const tinyxml2::XMLElement* include, const char* name,
                               std::vector<const tinyxml2::XMLElement*>& out)
{
  const tinyxml2::XMLDocument* doc = nullptr;
  std::string key;

  auto cached = included.find(include);
  if (cached != included.end())
  {
    doc = cached->second;
    key = includeKey(doc_files[doc]);
  }
  else
  {
    const std::string file = xml::reqAttribute(include, "file", doc_files[include->GetDocument()]);
    const std::string path = joinReference(base_dir, file);
    key = includeKey(path);
    if (std::find(include_stack.begin(), include_stack.end(), key) != include_stack.end())
      throw ParseError(where(include), "include cycle through '" + file + "'");

    auto loaded = xml::loadDocumentFromFile(path);
    doc = loaded.get();
    doc_files[doc] = path;
    included[include] = doc;
    docs.push_back(std::move(loaded));
  }

  const tinyxml2::XMLElement* root = doc->RootElement();
  if (!root)
    throw ParseError(doc_files[doc], "included file has no root element");

  include_stack.push_back(key);
  auto spliced = children(root, name);
  include_stack.pop_back();
  out.insert(out.end(), spliced.begin(), spliced.end());
}

std::string MjcfParser::where(const tinyxml2::XMLElement* elem) const
{
  return locationOf(elem).toString();
}

model::SourceLocation MjcfParser::locationOf(const tinyxml2::XMLElement* elem) const
{
  auto it = doc_files.find(elem->GetDocument());
  return xml::locationOf(elem, it != doc_files.end() ? it->second : filename);
}

void MjcfParser::parseCompiler(const tinyxml2::XMLElement* elem)
{
  if (const char* angle = elem->Attribute("angle"))
  {
    const std::string a = angle;
    if (a != "degree" && a != "radian")
      throw ParseError(where(elem), "invalid compiler angle '" + a + "'");
    compiler.degrees = a == "degree";
  }
  if (const char* seq = elem->Attribute("eulerseq"))
  {
    compiler.eulerseq = seq;
    if (compiler.eulerseq.size() != 3 ||
        compiler.eulerseq.find_first_not_of("xyzXYZ") != std::string::npos)
      throw ParseError(where(elem), "invalid eulerseq '" + compiler.eulerseq + "'");
  }
  if (const char* meshdir = elem->Attribute("meshdir"))
    compiler.meshdir = meshdir;
  if (const char* assetdir = elem->Attribute("assetdir"))
    compiler.assetdir = assetdir;
  if (const char* autolimits = elem->Attribute("autolimits"))
    compiler.autolimits = std::string(autolimits) == "true";
  if (const char* coordinate = elem->Attribute("coordinate"))
  {
    if (std::string(coordinate) != "local")
      throw ParseError(where(elem), "only local compiler coordinates are supported");
  }
}

void MjcfParser::parseDefault(const tinyxml2::XMLElement* elem, const std::string& parent_class)
{
  std::string name;
  if (const char* cls = elem->Attribute("class"))
    name = cls;
  else if (parent_class.empty())
    name = "main";
  else
    throw ParseError(where(elem), "nested <default> requires a class attribute");

  if (name != "main" && classes.count(name))
    throw ParseError(where(elem), "duplicate default class '" + name + "'");

  DefaultClass& cls = classes[name];
  cls.parent = name == "main" ? "" : (parent_class.empty() ? "main" : parent_class);

  for (const auto* child : children(elem))
  {
    if (std::string(child->Name()) == "default")
    {
      parseDefault(child, name);
      continue;
    }
    auto& attrs = classes[name].attributes[child->Name()];
    for (const auto* a = child->FirstAttribute(); a; a = a->Next())
      attrs[a->Name()] = a->Value();
  }
}

void MjcfParser::parseAssets(const tinyxml2::XMLElement* elem)
{
  const std::string& dir = compiler.meshdir.empty() ? compiler.assetdir : compiler.meshdir;

  for (const auto* mesh : children(elem, "mesh"))
  {
    const std::string cls = elementClass(mesh, "");
    const char* file = attribute(mesh, cls, "file");

    std::string name;
    if (const char* n = mesh->Attribute("name"))
      name = n;
    else if (file)
      name = std::filesystem::path(file).stem().string();
    else
      throw ParseError(where(mesh), "<mesh> needs a name or a file");

    MeshAsset asset;
    asset.uri = file ? joinReference(dir, file) : "mjcf:" + name;
    auto s = numbers(mesh, cls, "scale", 3, { 1.0, 1.0, 1.0 });
    asset.scale = Eigen::Vector3d(s[0], s[1], s[2]);

    if (!meshes.emplace(name, asset).second)
      throw ParseError(where(mesh), "duplicate mesh asset '" + name + "'");
  }
}

const char* MjcfParser::attribute(const tinyxml2::XMLElement* elem, const std::string& cls, const char* name) const
{
  if (const char* v = elem->Attribute(name))
    return v;

  const std::string tag = elem->Name();
  std::string current = cls;
  std::size_t guard = 0;
  while (!current.empty() && guard++ <= classes.size())
  {
    auto it = classes.find(current);
    if (it == classes.end())
      throw ParseError(where(elem), "unknown default class '" + current + "'");

    auto t = it->second.attributes.find(tag);
    if (t != it->second.attributes.end())
    {
      auto a = t->second.find(name);
      if (a != t->second.end())
        return a->second.c_str();
    }
    current = it->second.parent;
  }
  return nullptr;
}

std::string MjcfParser::elementClass(const tinyxml2::XMLElement* elem, const std::string& childclass) const
{
  if (const char* cls = elem->Attribute("class"))
  {
    if (!classes.count(cls))
      throw ParseError(where(elem), std::string("unknown default class '") + cls + "'");
    return cls;
  }
  return childclass.empty() ? "main" : childclass;
}

bool MjcfParser::classInherits(const std::string& cls, const std::string& ancestor) const
{
  std::string current = cls;
  std::size_t guard = 0;
  while (!current.empty() && guard++ <= classes.size())
  {
    if (current == ancestor)
      return true;
    auto it = classes.find(current);
    if (it == classes.end())
      return false;
    current = it->second.parent;
  }
  return false;
}

std::vector<double> MjcfParser::numbers(const tinyxml2::XMLElement* elem, const std::string& cls, const char* name,
                                        std::size_t n, const std::vector<double>& default_value) const
{
  const char* v = attribute(elem, cls, name);
  if (!v)
    return default_value;
  return xml::parseNumberList(v, where(elem), n);
}

Eigen::Quaterniond MjcfParser::parseOrientation(const tinyxml2::XMLElement* elem, const std::string& cls) const
{
  static const char* keys[] = { "quat", "axisangle", "xyaxes", "zaxis", "euler" };

  int explicit_count = 0;
  const char* key = nullptr;
  for (const char* k : keys)
  {
    if (elem->Attribute(k))
    {
      ++explicit_count;
      if (!key)
        key = k;
    }
  }
  if (explicit_count > 1)
    throw ParseError(where(elem), "more than one orientation specifier on <" + std::string(elem->Name()) + ">");
  if (!key)
  {
    for (const char* k : keys)
    {
      if (attribute(elem, cls, k))
      {
        key = k;
        break;
      }
    }
  }
  if (!key)
    return Eigen::Quaterniond::Identity();

  const std::string k = key;
  const double angle_unit = compiler.degrees ? geometry::toRadians(1.0) : 1.0;
  try
  {
    if (k == "quat")
    {
      auto q = numbers(elem, cls, key, 4, {});
      return geometry::quaternionFromWXYZ(q[0], q[1], q[2], q[3]);
    }
    if (k == "axisangle")
    {
      auto a = numbers(elem, cls, key, 4, {});
      return geometry::quaternionFromAxisAngle(Eigen::Vector3d(a[0], a[1], a[2]), a[3] * angle_unit);
    }
    if (k == "xyaxes")
    {
      auto a = numbers(elem, cls, key, 6, {});
      return geometry::quaternionFromXYAxes(Eigen::Vector3d(a[0], a[1], a[2]), Eigen::Vector3d(a[3], a[4], a[5]));
    }
    if (k == "zaxis")
    {
      auto a = numbers(elem, cls, key, 3, {});
      return geometry::quaternionFromZAxis(Eigen::Vector3d(a[0], a[1], a[2]));
    }
    auto e = numbers(elem, cls, key, 3, {});
    return geometry::quaternionFromEuler(Eigen::Vector3d(e[0], e[1], e[2]) * angle_unit, compiler.eulerseq);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(where(elem), k + ": " + e.what());
  }
}

void MjcfParser::framedChildren(const tinyxml2::XMLElement* parent, const char* name, const geometry::Pose& offset,
                                const std::string& childclass, std::vector<Framed>& out)
{
  for (const auto* c : children(parent))
  {
    const std::string tag = c->Name();
    if (tag == "frame")
    {
      std::string cc = childclass;
      if (const char* frame_cls = c->Attribute("childclass"))
      {
        if (!classes.count(frame_cls))
          throw ParseError(where(c), std::string("unknown default class '") + frame_cls + "'");
        cc = frame_cls;
      }
      framedChildren(c, name, geometry::composePoses(offset, parseFrame(c, "")), cc, out);
    }
    else if (tag == name)
    {
      out.push_back(Framed{ c, offset, childclass });
    }
  }
}

geometry::Pose MjcfParser::parseFrame(const tinyxml2::XMLElement* elem, const std::string& cls) const
{
  auto p = numbers(elem, cls, "pos", 3, { 0.0, 0.0, 0.0 });
  return geometry::makePose(Eigen::Vector3d(p[0], p[1], p[2]), parseOrientation(elem, cls));
}

void MjcfParser::parseBody(const tinyxml2::XMLElement* elem, const std::string& parent, const std::string& childclass,
                           const geometry::Pose& offset, model::CanonicalModel& model)
{
  model::Link link;
  link.location = locationOf(elem);
  if (const char* name = elem->Attribute("name"))
  {
    link.name = name;
  }
  else
  {
    link.name = "body_" + std::to_string(unnamed_bodies++);
    model.addWarning(link.location, "unnamed body, named '" + link.name + "'");
  }

  std::string cc = childclass;
  if (const char* child_cls = elem->Attribute("childclass"))
  {
    if (!classes.count(child_cls))
      throw ParseError(where(elem), std::string("unknown default class '") + child_cls + "'");
    cc = child_cls;
  }

  for (const auto* inertial : children(elem, "inertial"))
  {
    link.inertial = parseInertial(inertial);
    break;
  }

  std::vector<Framed> geoms;
  framedChildren(elem, "geom", geometry::Pose(), cc, geoms);
  for (const auto& geom : geoms)
    parseGeom(geom.elem, geom.childclass, geom.offset, link, model);

  const std::string name = link.name;
  model.links.push_back(std::move(link));

  if (!parent.empty())
  {
    parseBodyJoint(elem, parent, name, cc, offset, model);
  }
  else
  {
    for (const auto* joint : children(elem, "joint"))
      model.addWarning(locationOf(joint), "joint of top-level body '" + name + "' attaches it to the world, ignored");
  }

  std::vector<Framed> bodies;
  framedChildren(elem, "body", geometry::Pose(), cc, bodies);
  for (const auto& child : bodies)
    parseBody(child.elem, name, child.childclass, child.offset, model);
}

model::Inertial MjcfParser::parseInertial(const tinyxml2::XMLElement* elem) const
{
  const std::string loc = where(elem);

  model::Inertial inertial;
  auto pos = xml::parseNumberList(xml::reqAttribute(elem, "pos", locationOf(elem).file), loc, 3);
  inertial.center_of_mass = Eigen::Vector3d(pos[0], pos[1], pos[2]);
  inertial.mass = xml::parseNumberList(xml::reqAttribute(elem, "mass", locationOf(elem).file), loc, 1)[0];
  if (!(inertial.mass >= 0.0))
    throw ParseError(loc, "negative mass");

  const Eigen::Quaterniond q = parseOrientation(elem, "");

  Eigen::Matrix3d local;
  if (const char* diag = elem->Attribute("diaginertia"))
  {
    auto d = xml::parseNumberList(diag, loc, 3);
    local = Eigen::Vector3d(d[0], d[1], d[2]).asDiagonal();
  }
  else if (const char* full = elem->Attribute("fullinertia"))
  {
    // M11 M22 M33 M12 M13 M23
    auto f = xml::parseNumberList(full, loc, 6);
    local = geometry::inertiaFromComponents(f[0], f[3], f[4], f[1], f[5], f[2]);
  }
  else
  {
    throw ParseError(loc, "<inertial> needs diaginertia or fullinertia");
  }

  inertial.inertia = geometry::rotateInertia(local, q);
  return inertial;
}

void MjcfParser::parseGeom(const tinyxml2::XMLElement* elem, const std::string& childclass,
                           const geometry::Pose& offset, model::Link& link, model::CanonicalModel& model)
{
  const std::string cls = elementClass(elem, childclass);

  model::GeometryInstance g;
  g.name = elem->Attribute("name") ? elem->Attribute("name") : "";
  g.location = locationOf(elem);
  g.pose = parseFrame(elem, cls);
  try
  {
    g.shape = parseShape(elem, cls, g.pose);
  }
  catch (const UnsupportedElementError& e)
  {
    recordUnsupported(model, g.location, e);
    return;
  }
  g.pose = geometry::composePoses(offset, g.pose);

  const double contype = numbers(elem, cls, "contype", 1, { 1.0 })[0];
  const double conaffinity = numbers(elem, cls, "conaffinity", 1, { 1.0 })[0];
  const bool visual = (contype == 0.0 && conaffinity == 0.0) || classInherits(cls, "visual");

  if (visual)
    link.visuals.push_back(std::move(g));
  else
    link.collisions.push_back(std::move(g));
}

geometry::Shape MjcfParser::parseShape(const tinyxml2::XMLElement* elem, const std::string& cls,
                                       geometry::Pose& pose) const
{
  const std::string loc = where(elem);
  const char* type_attr = attribute(elem, cls, "type");
  const std::string type = type_attr ? type_attr : "sphere";

  if (type == "ellipsoid" || type == "plane" || type == "hfield" || type == "sdf")
    throw UnsupportedElementError(loc, "geom/" + type);
  if (type != "sphere" && type != "capsule" && type != "cylinder" && type != "box" && type != "mesh")
    throw ParseError(loc, "unknown geom type '" + type + "'");

  std::vector<double> size;
  if (const char* s = attribute(elem, cls, "size"))
    size = xml::parseNumberList(s, loc);
  auto at = [&](std::size_t i) {
    if (i >= size.size())
      throw ParseError(loc, type + " geom needs at least " + std::to_string(i + 1) + " size value(s)");
    return size[i];
  };

  geometry::Shape shape;
  const char* fromto = attribute(elem, cls, "fromto");
  if (fromto && (type == "capsule" || type == "cylinder" || type == "box"))
  {
    if (elem->Attribute("pos"))
      throw ParseError(loc, "fromto and pos are both specified");

    auto f = xml::parseNumberList(fromto, loc, 6);
    const Eigen::Vector3d p0(f[0], f[1], f[2]);
    const Eigen::Vector3d p1(f[3], f[4], f[5]);
    const Eigen::Vector3d d = p1 - p0;
    if (d.norm() <= 0.0)
      throw ParseError(loc, "fromto segment has zero length");

    try
    {
      pose = geometry::makePose(0.5 * (p0 + p1), geometry::quaternionFromZAxis(d));
    }
    catch (const std::invalid_argument& e)
    {
      throw ParseError(loc, std::string("fromto: ") + e.what());
    }
    if (type == "box")
      shape = geometry::makeBox(geometry::fullExtentFromHalf(at(0)), geometry::fullExtentFromHalf(at(1)), d.norm());
    else if (type == "capsule")
      shape = geometry::makeCapsule(at(0), d.norm());
    else
      shape = geometry::makeCylinder(at(0), d.norm());
  }
  else if (type == "sphere")
  {
    shape = geometry::makeSphere(at(0));
  }
  else if (type == "capsule")
  {
    shape = geometry::makeCapsule(at(0), geometry::fullExtentFromHalf(at(1)));
  }
  else if (type == "cylinder")
  {
    shape = geometry::makeCylinder(at(0), geometry::fullExtentFromHalf(at(1)));
  }
  else if (type == "box")
  {
    const Eigen::Vector3d full = geometry::fullExtentsFromHalf(Eigen::Vector3d(at(0), at(1), at(2)));
    shape = geometry::makeBox(full.x(), full.y(), full.z());
  }
  else
  {
    const char* mesh_name = attribute(elem, cls, "mesh");
    if (!mesh_name)
      throw ParseError(loc, "mesh geom without mesh attribute");
    auto it = meshes.find(mesh_name);
    if (it == meshes.end())
      throw ParseError(loc, std::string("unknown mesh asset '") + mesh_name + "'");
    shape = geometry::makeMesh(it->second.uri, it->second.scale);
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

void MjcfParser::parseBodyJoint(const tinyxml2::XMLElement* body, const std::string& parent, const std::string& child,
                                const std::string& childclass, const geometry::Pose& offset,
                                model::CanonicalModel& model)
{
  std::vector<const tinyxml2::XMLElement*> dofs;
  for (const auto* c : children(body))
  {
    const std::string tag = c->Name();
    if (tag == "joint" || tag == "freejoint")
      dofs.push_back(c);
  }

  model::Joint joint;
  joint.parent_link = parent;
  joint.child_link = child;
  joint.origin = geometry::composePoses(offset, parseFrame(body, ""));

  if (dofs.empty())
  {
    joint.name = child + "_fixed";
    joint.type = model::JointType::Fixed;
    joint.location = locationOf(body);
    model.joints.push_back(std::move(joint));
    return;
  }

  const tinyxml2::XMLElement* elem = dofs.front();
  joint.location = locationOf(elem);
  const std::string loc = where(elem);

  if (std::string(elem->Name()) == "freejoint")
  {
    joint.name = elem->Attribute("name") ? elem->Attribute("name") : child + "_freejoint";
    joint.type = model::JointType::Floating;
  }
  else
  {
    const std::string cls = elementClass(elem, childclass);
    joint.name = elem->Attribute("name") ? elem->Attribute("name") : child + "_joint";

    const char* type_attr = attribute(elem, cls, "type");
    const std::string type = type_attr ? type_attr : "hinge";
    if (type == "hinge")
    {
      const char* limited_attr = attribute(elem, cls, "limited");
      const std::string limited = limited_attr ? limited_attr : "auto";
      const bool has_range = attribute(elem, cls, "range") != nullptr;
      const bool is_limited = limited == "true" || (limited == "auto" && compiler.autolimits && has_range);
      joint.type = is_limited ? model::JointType::Revolute : model::JointType::Continuous;
    }
    else if (type == "slide")
    {
      joint.type = model::JointType::Prismatic;
    }
    else if (type == "free")
    {
      joint.type = model::JointType::Floating;
    }
    else if (type == "ball")
    {
      recordUnsupported(model, joint.location, UnsupportedElementError(loc, "joint/ball"), "connection kept as fixed");
      joint.type = model::JointType::Fixed;
    }
    else
    {
      throw ParseError(loc, "unknown joint type '" + type + "'");
    }

    if (model::jointTypeHasAxis(joint.type))
    {
      auto a = numbers(elem, cls, "axis", 3, { 0.0, 0.0, 1.0 });
      try
      {
        joint.axis = geometry::normalizeDirection(Eigen::Vector3d(a[0], a[1], a[2]));
      }
      catch (const std::invalid_argument& e)
      {
        throw ParseError(loc, "joint '" + joint.name + "': " + e.what());
      }
    }

    auto p = numbers(elem, cls, "pos", 3, { 0.0, 0.0, 0.0 });
    if (Eigen::Vector3d(p[0], p[1], p[2]).norm() > 0.0)
      model.addWarning(joint.location, "joint '" + joint.name + "' is offset from its body frame, offset not compared");
  }

  if (dofs.size() > 1)
    model.addWarning(locationOf(body), "body '" + child + "' has " + std::to_string(dofs.size()) +
                                           " joints, only '" + joint.name + "' is compared");

  model.joints.push_back(std::move(joint));
}

}  // namespace adapters
}  // namespace robodiff
