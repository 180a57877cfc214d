#include <robodiff/diff/diff_engine.h>

#include <algorithm>
#include <cmath>

#include <robodiff/errors.h>

namespace robodiff {
namespace diff {

namespace {

// Below this, values are equal in relative mode regardless of magnitude.
constexpr double kRelativeFloor = 1e-12;

std::vector<double> toValues(const Eigen::VectorXd& v)
{
  return std::vector<double>(v.data(), v.data() + v.size());
}

std::vector<double> toValues(const Eigen::Quaterniond& q)
{
  return { q.w(), q.x(), q.y(), q.z() };
}

class ModelComparator
{
public:
  ModelComparator(const DiffOptions& options, DiffReport& report)
    : options(options), categories(effectiveCategories(options)), report(report)
  {
  }

  void compare(const model::CanonicalModel& a, const model::CanonicalModel& b)
  {
    const Alignment alignment = alignModels(a, b);

    if (has(FieldCategory::Kinematics))
    {
      for (const auto* link : alignment.links_only_in_a)
        add(EntityKind::Link, link->name, "", link->name, {}, Classification::RemovedFromB);
      for (const auto* link : alignment.links_only_in_b)
        add(EntityKind::Link, link->name, "", {}, link->name, Classification::AddedInB);
      for (const auto* joint : alignment.joints_only_in_a)
        add(EntityKind::Joint, joint->name, "", joint->name, {}, Classification::RemovedFromB);
      for (const auto* joint : alignment.joints_only_in_b)
        add(EntityKind::Joint, joint->name, "", {}, joint->name, Classification::AddedInB);
      for (const auto& [ja, jb] : alignment.structure_mismatches)
        add(EntityKind::Joint, ja->name, "", ja->parent_link + " -> " + ja->child_link,
            jb->parent_link + " -> " + jb->child_link, Classification::UnmatchedStructure);

      for (const auto& [ja, jb] : alignment.joints)
        compareJoint(*ja, *jb);
    }

    for (const auto& [la, lb] : alignment.links)
      compareLink(*la, *lb);
  }

private:
  bool has(FieldCategory category) const
  {
    return categories.count(category) > 0;
  }

  void add(EntityKind kind, const std::string& id, const std::string& path, DiffValue value_a, DiffValue value_b,
           Classification classification = Classification::Mismatch)
  {
    report.entries.push_back(DiffEntry{ kind, id, path, std::move(value_a), std::move(value_b), classification });
  }

  bool differs(double a, double b) const
  {
    return exceedsTolerance(a, b, options.tolerance_linear, options.tolerance_mode);
  }

  bool differs(const Eigen::VectorXd& a, const Eigen::VectorXd& b) const
  {
    if (a.size() != b.size())
      return true;
    for (Eigen::Index i = 0; i < a.size(); ++i)
    {
      if (differs(a[i], b[i]))
        return true;
    }
    return false;
  }

  void compareScalar(EntityKind kind, const std::string& id, const std::string& path, double a, double b)
  {
    if (differs(a, b))
      add(kind, id, path, a, b);
  }

  void compareVector(EntityKind kind, const std::string& id, const std::string& path, const Eigen::VectorXd& a,
                     const Eigen::VectorXd& b)
  {
    if (differs(a, b))
      add(kind, id, path, toValues(a), toValues(b));
  }

  void compareOrientation(EntityKind kind, const std::string& id, const std::string& path,
                          const Eigen::Quaterniond& a, const Eigen::Quaterniond& b)
  {
    if (geometry::angularDistance(a, b) > options.tolerance_angular)
      add(kind, id, path, toValues(geometry::canonicalQuaternion(a)), toValues(geometry::canonicalQuaternion(b)));
  }

  void compareJoint(const model::Joint& a, const model::Joint& b)
  {
    const auto kind = EntityKind::Joint;
    if (a.type != b.type)
      add(kind, a.name, "kind", model::jointTypeToString(a.type), model::jointTypeToString(b.type));

    compareVector(kind, a.name, "origin.position", a.origin.position, b.origin.position);
    compareOrientation(kind, a.name, "origin.orientation", a.origin.orientation, b.origin.orientation);

    // A kind change already explains any axis difference.
    if (a.type == b.type && a.axis && b.axis)
      compareVector(kind, a.name, "axis", *a.axis, *b.axis);
  }

  void compareLink(const model::Link& a, const model::Link& b)
  {
    if (has(FieldCategory::Inertial))
      compareInertial(a, b);
    if (has(FieldCategory::Collision))
      compareGeometryList(a.name, "collision", a.collisions, b.collisions);
    if (has(FieldCategory::Visual))
      compareGeometryList(a.name, "visual", a.visuals, b.visuals);
  }

  void compareInertial(const model::Link& a, const model::Link& b)
  {
    const auto kind = EntityKind::Link;
    if (!a.inertial && !b.inertial)
      return;
    if (!b.inertial)
    {
      add(kind, a.name, "inertial", a.inertial->mass, {}, Classification::RemovedFromB);
      return;
    }
    if (!a.inertial)
    {
      add(kind, a.name, "inertial", {}, b.inertial->mass, Classification::AddedInB);
      return;
    }

    const model::Inertial& ia = *a.inertial;
    const model::Inertial& ib = *b.inertial;
    compareScalar(kind, a.name, "inertial.mass", ia.mass, ib.mass);
    compareVector(kind, a.name, "inertial.center_of_mass", ia.center_of_mass, ib.center_of_mass);
    compareVector(kind, a.name, "inertial.inertia", geometry::inertiaComponents(ia.inertia),
                  geometry::inertiaComponents(ib.inertia));
  }

  void compareGeometryList(const std::string& link, const std::string& prefix,
                           const std::vector<model::GeometryInstance>& a,
                           const std::vector<model::GeometryInstance>& b)
  {
    const auto kind = EntityKind::Link;
    if (a.empty() && b.empty())
      return;
    if (b.empty())
    {
      add(kind, link, prefix, static_cast<double>(a.size()), {}, Classification::RemovedFromB);
      return;
    }
    if (a.empty())
    {
      add(kind, link, prefix, {}, static_cast<double>(b.size()), Classification::AddedInB);
      return;
    }

    const std::size_t common = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < common; ++i)
      compareGeometry(link, prefix + "[" + std::to_string(i) + "]", a[i], b[i]);

    for (std::size_t i = common; i < a.size(); ++i)
      add(kind, link, prefix + "[" + std::to_string(i) + "]", geometry::shapeTypeToString(a[i].shape.type), {},
          Classification::RemovedFromB);
    for (std::size_t i = common; i < b.size(); ++i)
      add(kind, link, prefix + "[" + std::to_string(i) + "]", {}, geometry::shapeTypeToString(b[i].shape.type),
          Classification::AddedInB);
  }

  void compareGeometry(const std::string& link, const std::string& path, const model::GeometryInstance& a,
                       const model::GeometryInstance& b)
  {
    const auto kind = EntityKind::Link;
    const geometry::Shape& sa = a.shape;
    const geometry::Shape& sb = b.shape;

    compareVector(kind, link, path + ".pose.position", a.pose.position, b.pose.position);

    if (sa.type != sb.type)
    {
      add(kind, link, path + ".geometry.type", geometry::shapeTypeToString(sa.type),
          geometry::shapeTypeToString(sb.type));
      compareOrientation(kind, link, path + ".pose.orientation", a.pose.orientation, b.pose.orientation);
      return;
    }

    switch (sa.type)
    {
      case geometry::ShapeType::Box:
        compareVector(kind, link, path + ".geometry.size", geometry::getBoxSize(sa), geometry::getBoxSize(sb));
        break;
      case geometry::ShapeType::Sphere:
        compareScalar(kind, link, path + ".geometry.radius", geometry::getShapeRadius(sa),
                      geometry::getShapeRadius(sb));
        break;
      case geometry::ShapeType::Cylinder:
      case geometry::ShapeType::Capsule:
        compareScalar(kind, link, path + ".geometry.radius", geometry::getShapeRadius(sa),
                      geometry::getShapeRadius(sb));
        compareScalar(kind, link, path + ".geometry.length", geometry::getShapeLength(sa),
                      geometry::getShapeLength(sb));
        break;
      case geometry::ShapeType::Mesh:
      {
        const std::string ua = normalizeMeshReference(sa.uri, options.mesh_reference_mode);
        const std::string ub = normalizeMeshReference(sb.uri, options.mesh_reference_mode);
        if (ua != ub)
          add(kind, link, path + ".geometry.uri", ua, ub);
        compareVector(kind, link, path + ".geometry.scale", sa.scale, sb.scale);
        break;
      }
      default:
        break;
    }

    // Rotational symmetry: a sphere has no orientation, a cylinder or capsule only a symmetry axis.
    if (sa.type == geometry::ShapeType::Sphere)
      return;
    if (geometry::hasAxialSymmetry(sa.type))
    {
      const Eigen::Vector3d za = a.pose.orientation * Eigen::Vector3d::UnitZ();
      const Eigen::Vector3d zb = b.pose.orientation * Eigen::Vector3d::UnitZ();
      if (geometry::lineAngle(za, zb) > options.tolerance_angular)
        add(kind, link, path + ".pose.orientation", toValues(geometry::canonicalQuaternion(a.pose.orientation)),
            toValues(geometry::canonicalQuaternion(b.pose.orientation)));
      return;
    }
    compareOrientation(kind, link, path + ".pose.orientation", a.pose.orientation, b.pose.orientation);
  }

  const DiffOptions& options;
  const std::set<FieldCategory> categories;
  DiffReport& report;
};

}  // namespace

std::set<FieldCategory> effectiveCategories(const DiffOptions& options)
{
  std::set<FieldCategory> categories = options.fields;
  if (categories.empty())
    categories = { FieldCategory::Kinematics, FieldCategory::Inertial, FieldCategory::Collision };
  if (options.include_visual)
    categories.insert(FieldCategory::Visual);
  return categories;
}

bool exceedsTolerance(double a, double b, double tolerance, ToleranceMode mode)
{
  const double delta = std::abs(a - b);
  if (mode == ToleranceMode::Relative)
    return delta > std::max(tolerance * std::max(std::abs(a), std::abs(b)), kRelativeFloor);
  return delta > tolerance;
}

DiffReport diffModels(const model::CanonicalModel& a, const model::CanonicalModel& b, const DiffOptions& options)
{
  if (options.tolerance_linear < 0.0 || options.tolerance_angular < 0.0)
    throw ComparisonScopeError("tolerances must not be negative");

  DiffReport report;
  report.model_a = a.name;
  report.model_b = b.name;

  ModelComparator comparator(options, report);
  comparator.compare(a, b);
  report.sort();

  for (const auto& w : a.warnings)
    report.warnings.push_back(ReportWarning{ ModelSide::A, w });
  for (const auto& w : b.warnings)
    report.warnings.push_back(ReportWarning{ ModelSide::B, w });
  return report;
}

FieldCategory fieldCategoryFromString(const std::string& str)
{
  if (str == "kinematics")
    return FieldCategory::Kinematics;
  if (str == "inertial")
    return FieldCategory::Inertial;
  if (str == "collision")
    return FieldCategory::Collision;
  if (str == "visual")
    return FieldCategory::Visual;
  throw ComparisonScopeError("Unknown field category: " + str);
}

std::string fieldCategoryToString(FieldCategory category)
{
  switch (category)
  {
    case FieldCategory::Kinematics:
      return "kinematics";
    case FieldCategory::Inertial:
      return "inertial";
    case FieldCategory::Collision:
      return "collision";
    case FieldCategory::Visual:
      return "visual";
  }
  return "unknown";
}

ToleranceMode toleranceModeFromString(const std::string& str)
{
  if (str == "absolute")
    return ToleranceMode::Absolute;
  if (str == "relative")
    return ToleranceMode::Relative;
  throw std::runtime_error("Unknown ToleranceMode: " + str);
}

std::string toleranceModeToString(ToleranceMode mode)
{
  return mode == ToleranceMode::Absolute ? "absolute" : "relative";
}

std::ostream& operator<<(std::ostream& os, FieldCategory category)
{
  return os << fieldCategoryToString(category);
}

}  // namespace diff
}  // namespace robodiff
