#include <robodiff/adapters/usd_parser.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <robodiff/errors.h>

namespace robodiff {
namespace adapters {

namespace {

const std::set<std::string> kGprims = { "Cube", "Sphere", "Cylinder", "Capsule", "Mesh" };
const std::set<std::string> kUnsupportedGprims = { "Cone",       "Plane",        "Points",        "BasisCurves",
                                                   "NurbsPatch", "NurbsCurves", "HermiteCurves", "TetMesh",
                                                   "Cylinder_1", "Capsule_1" };

bool isJointPrim(const usd::Prim& prim)
{
  const std::string& t = prim.type_name;
  return t.rfind("Physics", 0) == 0 && t.size() >= 5 && t.compare(t.size() - 5, 5, "Joint") == 0;
}

double number(const usd::Prim& prim, const char* name, double default_value)
{
  const usd::Attribute* a = prim.attribute(name);
  if (!a)
    return default_value;
  try
  {
    return usd::toNumber(a->value);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), std::string(name) + ": " + e.what());
  }
}

Eigen::Vector3d vector3(const usd::Prim& prim, const char* name, const Eigen::Vector3d& default_value)
{
  const usd::Attribute* a = prim.attribute(name);
  if (!a)
    return default_value;
  try
  {
    return usd::toVector3(a->value);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), std::string(name) + ": " + e.what());
  }
}

Eigen::Quaterniond quaternion(const usd::Prim& prim, const char* name)
{
  const usd::Attribute* a = prim.attribute(name);
  if (!a)
    return Eigen::Quaterniond::Identity();
  try
  {
    Eigen::Quaterniond q = usd::toQuaternion(a->value);
    // (0, 0, 0, 0) is the "not authored" sentinel of the physics schemas.
    if (q.coeffs().isZero())
      return Eigen::Quaterniond::Identity();
    return geometry::canonicalQuaternion(q);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), std::string(name) + ": " + e.what());
  }
}

std::string token(const usd::Prim& prim, const char* name, const std::string& default_value)
{
  const usd::Attribute* a = prim.attribute(name);
  if (!a)
    return default_value;
  try
  {
    return usd::toText(a->value);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), std::string(name) + ": " + e.what());
  }
}

int axisIndex(const usd::Prim& prim, const std::string& axis)
{
  if (axis == "X")
    return 0;
  if (axis == "Y")
    return 1;
  if (axis == "Z")
    return 2;
  throw ParseError(prim.where(), "invalid axis token '" + axis + "'");
}

// rotateXYZ, rotateZYX and the other four axis orders.
bool isRotateOrder(const std::string& kind)
{
  if (kind.size() != 9 || kind.rfind("rotate", 0) != 0)
    return false;
  std::string order = kind.substr(6);
  std::sort(order.begin(), order.end());
  return order == "XYZ";
}

Eigen::Matrix3d rotationFromEuler(const Eigen::Vector3d& degrees, const std::string& order)
{
  // rotateXYZ applies X first, then Y, then Z.
  Eigen::Matrix3d R = Eigen::Matrix3d::Identity();
  for (int i = 0; i < 3; ++i)
  {
    const int axis = order[i] - 'X';
    R = Eigen::AngleAxisd(geometry::toRadians(degrees[axis]), Eigen::Vector3d::Unit(axis)).toRotationMatrix() * R;
  }
  return R;
}

}  // namespace

UsdParser::UsdParser() = default;
UsdParser::~UsdParser() = default;

model::CanonicalModel UsdParser::loadModelFromFile(const std::string& filename)
{
  usd::Stage stage;
  stage.openFile(filename);
  return buildModel(stage, filename);
}

model::CanonicalModel UsdParser::loadModelFromText(const std::string& text, const std::string& base_dir,
                                                   const std::string& source_name)
{
  usd::Stage stage;
  stage.openText(text, base_dir, source_name);
  return buildModel(stage, source_name);
}

model::CanonicalModel UsdParser::buildModel(usd::Stage& stage, const std::string& source)
{
  this->source = source;
  prims.clear();
  link_paths.clear();

  robot_path = stage.robotPrimPath();
  meters_per_unit = stage.metersPerUnit();
  if (!(meters_per_unit > 0.0) || !std::isfinite(meters_per_unit))
    throw ParseError(source, "invalid metersPerUnit");

  robot = stage.compose(robot_path);
  indexPrims(robot);

  model::CanonicalModel model;
  model.name = robot.name;
  model.source = source;
  model.format = model::ModelFormat::Usd;

  std::vector<const usd::Prim*> link_prims;
  if (const auto* targets = robot.relationship("isaac:physics:robotLinks"))
  {
    for (const auto& path : *targets)
    {
      auto it = prims.find(path);
      if (it == prims.end())
        throw ParseError(robot.where(), "robotLinks target '" + path + "' does not exist");
      link_prims.push_back(it->second);
    }
  }
  else
  {
    for (const auto& [path, prim] : prims)
    {
      if (prim->hasApi("PhysicsRigidBodyAPI"))
        link_prims.push_back(prim);
    }
  }
  for (const auto* prim : link_prims)
    link_paths.insert(prim->path);

  for (const auto* prim : link_prims)
    model.links.push_back(parseLink(*prim, model));

  std::vector<const usd::Prim*> joint_prims;
  if (const auto* targets = robot.relationship("isaac:physics:robotJoints"))
  {
    for (const auto& path : *targets)
    {
      auto it = prims.find(path);
      if (it == prims.end())
        throw ParseError(robot.where(), "robotJoints target '" + path + "' does not exist");
      joint_prims.push_back(it->second);
    }
  }
  else
  {
    for (const auto& [path, prim] : prims)
    {
      if (isJointPrim(*prim))
        joint_prims.push_back(prim);
    }
  }

  for (const auto* prim : joint_prims)
  {
    model::Joint joint;
    if (parseJoint(*prim, model, joint))
      model.joints.push_back(std::move(joint));
  }

  model::validateTree(model);
  return model;
}

void UsdParser::indexPrims(const usd::Prim& prim)
{
  prims[prim.path] = &prim;
  for (const auto& c : prim.children)
    indexPrims(c);
}

model::Link UsdParser::parseLink(const usd::Prim& prim, model::CanonicalModel& model) const
{
  model::Link link;
  link.name = prim.name;
  link.location.file = prim.layer;
  link.location.prim_path = prim.path;
  link.inertial = parseInertial(prim, model);

  for (const auto& c : prim.children)
    collectGeometry(c, Eigen::Affine3d::Identity(), false, "", link, model);
  return link;
}

std::optional<model::Inertial> UsdParser::parseInertial(const usd::Prim& prim, model::CanonicalModel& model) const
{
  if (!prim.hasApi("PhysicsMassAPI") && !prim.attribute("physics:mass"))
    return std::nullopt;

  model::Inertial inertial;
  inertial.mass = number(prim, "physics:mass", 0.0);
  if (!std::isfinite(inertial.mass) || inertial.mass < 0.0)
    throw ParseError(prim.where(), "invalid mass");

  Eigen::Vector3d com = vector3(prim, "physics:centerOfMass", Eigen::Vector3d::Zero());
  if (!com.allFinite())
  {
    model.addWarning(model::SourceLocation{ prim.layer, 0, prim.path },
                     "center of mass of '" + prim.name + "' is not authored, using the link origin");
    com.setZero();
  }
  inertial.center_of_mass = com * meters_per_unit;

  const Eigen::Vector3d diagonal =
      vector3(prim, "physics:diagonalInertia", Eigen::Vector3d::Zero()) * meters_per_unit * meters_per_unit;
  if (!diagonal.allFinite())
    throw ParseError(prim.where(), "physics:diagonalInertia: non-finite value");
  inertial.inertia =
      geometry::rotateInertia(diagonal.asDiagonal().toDenseMatrix(), quaternion(prim, "physics:principalAxes"));
  return inertial;
}

void UsdParser::collectGeometry(const usd::Prim& prim, const Eigen::Affine3d& link_from_parent, bool collision,
                                const std::string& mesh_asset, model::Link& link, model::CanonicalModel& model) const
{
  if (link_paths.count(prim.path) || prim.hasApi("PhysicsRigidBodyAPI") || isJointPrim(prim))
    return;

  const Eigen::Affine3d link_from_prim = link_from_parent * localTransform(prim);
  const bool is_collision = collision || prim.hasApi("PhysicsCollisionAPI");
  const std::string asset = prim.referenced_assets.empty() ? mesh_asset : prim.referenced_assets.front();
  const model::SourceLocation location{ prim.layer, 0, prim.path };

  if (kGprims.count(prim.type_name))
  {
    model::GeometryInstance g;
    g.name = prim.name;
    g.location = location;
    g.shape = parseGprim(prim, link_from_prim, asset, g.pose);
    (is_collision ? link.collisions : link.visuals).push_back(std::move(g));
  }
  else if (kUnsupportedGprims.count(prim.type_name))
  {
    recordUnsupported(model, location, UnsupportedElementError(prim.where(), "gprim/" + prim.type_name));
  }

  for (const auto& c : prim.children)
    collectGeometry(c, link_from_prim, is_collision, asset, link, model);
}

geometry::Shape UsdParser::parseGprim(const usd::Prim& prim, const Eigen::Affine3d& link_from_prim,
                                      const std::string& mesh_asset, geometry::Pose& pose) const
{
  Eigen::Matrix3d R, S;
  link_from_prim.computeRotationScaling(&R, &S);
  const Eigen::Vector3d scale = S.diagonal();
  try
  {
    pose = geometry::makePose(link_from_prim.translation(), Eigen::Quaterniond(R));
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), std::string("xform: ") + e.what());
  }

  const double k = meters_per_unit;
  geometry::Shape shape;
  if (prim.type_name == "Cube")
  {
    const double size = number(prim, "size", 2.0);
    shape = geometry::makeBox(size * std::abs(scale.x()) * k, size * std::abs(scale.y()) * k,
                              size * std::abs(scale.z()) * k);
  }
  else if (prim.type_name == "Sphere")
  {
    shape = geometry::makeSphere(number(prim, "radius", 1.0) * scale.cwiseAbs().maxCoeff() * k);
  }
  else if (prim.type_name == "Cylinder" || prim.type_name == "Capsule")
  {
    const bool cylinder = prim.type_name == "Cylinder";
    const int a = axisIndex(prim, token(prim, "axis", "Z"));
    const double radial = std::max(std::abs(scale[(a + 1) % 3]), std::abs(scale[(a + 2) % 3]));
    const double radius = number(prim, "radius", cylinder ? 1.0 : 0.5) * radial * k;
    const double length = number(prim, "height", cylinder ? 2.0 : 1.0) * std::abs(scale[a]) * k;
    shape = cylinder ? geometry::makeCylinder(radius, length) : geometry::makeCapsule(radius, length);

    // Canonical symmetry axis is +Z.
    if (a != 2)
      pose = geometry::composePoses(
          pose, geometry::makePose(Eigen::Vector3d::Zero(),
                                   geometry::quaternionFromZAxis(Eigen::Vector3d::Unit(a))));
  }
  else
  {
    std::string uri = mesh_asset;
    if (uri.empty())
    {
      const std::string relative =
          prim.path.rfind(robot_path + "/", 0) == 0 ? prim.path.substr(robot_path.size() + 1) : prim.path;
      uri = "usd:" + relative;
    }
    shape = geometry::makeMesh(uri, scale);
  }

  try
  {
    geometry::validateShape(shape);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), e.what());
  }
  return shape;
}

Eigen::Affine3d UsdParser::localTransform(const usd::Prim& prim) const
{
  Eigen::Affine3d tf = Eigen::Affine3d::Identity();

  const usd::Attribute* order = prim.attribute("xformOpOrder");
  if (!order)
    return tf;

  std::vector<std::string> ops;
  try
  {
    ops = usd::toTexts(order->value);
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), std::string("xformOpOrder: ") + e.what());
  }

  for (std::string op : ops)
  {
    if (op == "!resetXformStack!")
      throw ParseError(prim.where(), "!resetXformStack! inside a link is not supported");

    bool invert = false;
    if (op.rfind("!invert!", 0) == 0)
    {
      invert = true;
      op = op.substr(8);
    }

    const usd::Attribute* attr = prim.attribute(op);
    if (!attr)
      throw ParseError(prim.where(), "xform op '" + op + "' has no value");
    if (op.rfind("xformOp:", 0) != 0)
      throw ParseError(prim.where(), "invalid xform op '" + op + "'");

    std::string kind = op.substr(8);
    kind = kind.substr(0, kind.find(':'));

    Eigen::Affine3d m = Eigen::Affine3d::Identity();
    try
    {
      if (kind == "translate")
        m.translate(usd::toVector3(attr->value) * meters_per_unit);
      else if (kind == "scale")
        m.scale(usd::toVector3(attr->value));
      else if (kind == "orient")
        m.rotate(geometry::canonicalQuaternion(usd::toQuaternion(attr->value)));
      else if (kind == "rotateX" || kind == "rotateY" || kind == "rotateZ")
        m.rotate(Eigen::AngleAxisd(geometry::toRadians(usd::toNumber(attr->value)),
                                   Eigen::Vector3d::Unit(kind.back() - 'X')));
      else if (isRotateOrder(kind))
        m.linear() = rotationFromEuler(usd::toVector3(attr->value), kind.substr(6));
      else if (kind == "transform")
      {
        // Row-vector convention: translation is the last row.
        Eigen::Matrix4d M = usd::toMatrix4(attr->value).transpose();
        M.block<3, 1>(0, 3) *= meters_per_unit;
        m.matrix() = M;
      }
      else
        throw ParseError(prim.where(), "unsupported xform op '" + op + "'");
    }
    catch (const std::invalid_argument& e)
    {
      throw ParseError(prim.where(), op + ": " + e.what());
    }
    if (!m.matrix().allFinite())
      throw ParseError(prim.where(), op + ": non-finite value");

    tf = tf * (invert ? m.inverse() : m);
  }
  return tf;
}

std::string UsdParser::bodyLink(const usd::Prim& joint_prim, const char* rel_name) const
{
  const auto* targets = joint_prim.relationship(rel_name);
  if (!targets || targets->empty())
    return {};
  if (targets->size() > 1)
    throw ParseError(joint_prim.where(), std::string(rel_name) + " has more than one target");

  const std::string& path = targets->front();
  if (!link_paths.count(path))
    throw ParseError(joint_prim.where(), std::string(rel_name) + " target '" + path + "' is not a robot link");
  return prims.at(path)->name;
}

bool UsdParser::parseJoint(const usd::Prim& prim, model::CanonicalModel& model, model::Joint& joint) const
{
  joint.name = prim.name;
  joint.location.file = prim.layer;
  joint.location.prim_path = prim.path;

  joint.parent_link = bodyLink(prim, "physics:body0");
  joint.child_link = bodyLink(prim, "physics:body1");
  if (joint.child_link.empty())
    throw ParseError(prim.where(), "joint '" + joint.name + "' has no physics:body1");

  // Anchors the articulation to the world, not part of the link tree.
  if (joint.parent_link.empty())
    return false;

  const std::string& type = prim.type_name;
  if (type == "PhysicsRevoluteJoint")
  {
    const usd::Attribute* lower = prim.attribute("physics:lowerLimit");
    const usd::Attribute* upper = prim.attribute("physics:upperLimit");
    const bool limited = lower && upper && std::isfinite(number(prim, "physics:lowerLimit", 0.0)) &&
                         std::isfinite(number(prim, "physics:upperLimit", 0.0));
    joint.type = limited ? model::JointType::Revolute : model::JointType::Continuous;
  }
  else if (type == "PhysicsPrismaticJoint")
  {
    joint.type = model::JointType::Prismatic;
  }
  else if (type == "PhysicsFixedJoint")
  {
    joint.type = model::JointType::Fixed;
  }
  else
  {
    recordUnsupported(model, joint.location, UnsupportedElementError(prim.where(), "joint/" + type),
                      "connection kept as fixed");
    joint.type = model::JointType::Fixed;
  }

  const Eigen::Vector3d pos0 = vector3(prim, "physics:localPos0", Eigen::Vector3d::Zero()) * meters_per_unit;
  const Eigen::Vector3d pos1 = vector3(prim, "physics:localPos1", Eigen::Vector3d::Zero()) * meters_per_unit;
  geometry::Pose frame0, frame1;
  try
  {
    frame0 = geometry::makePose(pos0, quaternion(prim, "physics:localRot0"));
    frame1 = geometry::makePose(pos1, quaternion(prim, "physics:localRot1"));
  }
  catch (const std::invalid_argument& e)
  {
    throw ParseError(prim.where(), std::string("joint frame: ") + e.what());
  }
  joint.origin = geometry::composePoses(frame0, geometry::inversePose(frame1));

  if (model::jointTypeHasAxis(joint.type))
  {
    const int a = axisIndex(prim, token(prim, "physics:axis", "X"));
    joint.axis = (frame1.orientation * Eigen::Vector3d::Unit(a)).normalized();
  }
  return true;
}

}  // namespace adapters
}  // namespace robodiff
