#include <robodiff/geometry/frame.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace robodiff {
namespace geometry {

double toRadians(double degrees)
{
  return degrees * M_PI / 180.0;
}

double toDegrees(double radians)
{
  return radians * 180.0 / M_PI;
}

Eigen::Quaterniond canonicalQuaternion(const Eigen::Quaterniond& q)
{
  const double n = q.norm();
  if (!(n > 0.0) || !std::isfinite(n))
    throw std::invalid_argument("quaternion has zero or non-finite norm");

  Eigen::Quaterniond c(q.coeffs() / n);
  bool flip = c.w() < 0.0;
  if (c.w() == 0.0)
  {
    // Tie-break on the first non-zero vector component.
    for (int i = 0; i < 3; ++i)
    {
      if (c.vec()[i] != 0.0)
      {
        flip = c.vec()[i] < 0.0;
        break;
      }
    }
  }
  if (flip)
    c.coeffs() = -c.coeffs();
  return c;
}

Eigen::Vector3d normalizeDirection(const Eigen::Vector3d& v)
{
  const double n = v.norm();
  if (!(n > 0.0) || !std::isfinite(n))
    throw std::invalid_argument("direction vector has zero or non-finite norm");
  return v / n;
}

Eigen::Quaterniond quaternionFromRPY(double roll, double pitch, double yaw)
{
  Eigen::AngleAxisd rx(roll, Eigen::Vector3d::UnitX());
  Eigen::AngleAxisd ry(pitch, Eigen::Vector3d::UnitY());
  Eigen::AngleAxisd rz(yaw, Eigen::Vector3d::UnitZ());
  return canonicalQuaternion(Eigen::Quaterniond(rz * ry * rx));
}

Eigen::Quaterniond quaternionFromEuler(const Eigen::Vector3d& angles, const std::string& sequence)
{
  if (sequence.size() != 3)
    throw std::invalid_argument("euler sequence must have 3 letters, got '" + sequence + "'");

  Eigen::Quaterniond q = Eigen::Quaterniond::Identity();
  for (int i = 0; i < 3; ++i)
  {
    const char c = sequence[i];
    Eigen::Vector3d axis;
    switch (std::tolower(static_cast<unsigned char>(c)))
    {
      case 'x':
        axis = Eigen::Vector3d::UnitX();
        break;
      case 'y':
        axis = Eigen::Vector3d::UnitY();
        break;
      case 'z':
        axis = Eigen::Vector3d::UnitZ();
        break;
      default:
        throw std::invalid_argument("invalid euler sequence '" + sequence + "'");
    }

    Eigen::Quaterniond r(Eigen::AngleAxisd(angles[i], axis));
    if (std::islower(static_cast<unsigned char>(c)))
      q = q * r;  // moving axes
    else
      q = r * q;  // fixed axes
  }
  return canonicalQuaternion(q);
}

Eigen::Quaterniond quaternionFromWXYZ(double w, double x, double y, double z)
{
  return canonicalQuaternion(Eigen::Quaterniond(w, x, y, z));
}

Eigen::Quaterniond quaternionFromXYZW(double x, double y, double z, double w)
{
  return canonicalQuaternion(Eigen::Quaterniond(w, x, y, z));
}

Eigen::Quaterniond quaternionFromAxisAngle(const Eigen::Vector3d& axis, double angle)
{
  return canonicalQuaternion(Eigen::Quaterniond(Eigen::AngleAxisd(angle, normalizeDirection(axis))));
}

Eigen::Quaterniond quaternionFromXYAxes(const Eigen::Vector3d& x, const Eigen::Vector3d& y)
{
  const Eigen::Vector3d X = normalizeDirection(x);
  const Eigen::Vector3d Y = normalizeDirection(y - X.dot(y) * X);
  const Eigen::Vector3d Z = X.cross(Y);

  Eigen::Matrix3d R;
  R.col(0) = X;
  R.col(1) = Y;
  R.col(2) = Z;
  return quaternionFromMatrix(R);
}

Eigen::Quaterniond quaternionFromZAxis(const Eigen::Vector3d& z)
{
  const Eigen::Vector3d Z = normalizeDirection(z);
  // Anti-parallel: half turn about X.
  if (Z.z() < -1.0 + 1e-14)
    return canonicalQuaternion(Eigen::Quaterniond(0.0, 1.0, 0.0, 0.0));
  return canonicalQuaternion(Eigen::Quaterniond::FromTwoVectors(Eigen::Vector3d::UnitZ(), Z));
}

Eigen::Quaterniond quaternionFromMatrix(const Eigen::Matrix3d& rotation)
{
  return canonicalQuaternion(Eigen::Quaterniond(rotation));
}

Eigen::Isometry3d toIsometry(const Pose& pose)
{
  Eigen::Isometry3d tf = Eigen::Isometry3d::Identity();
  tf.linear() = pose.orientation.toRotationMatrix();
  tf.translation() = pose.position;
  return tf;
}

Pose poseFromIsometry(const Eigen::Isometry3d& tf)
{
  return makePose(tf.translation(), Eigen::Quaterniond(tf.rotation()));
}

Pose makePose(const Eigen::Vector3d& position, const Eigen::Quaterniond& orientation)
{
  if (!position.allFinite())
    throw std::invalid_argument("position is not finite");
  Pose p;
  p.position = position;
  p.orientation = canonicalQuaternion(orientation);
  return p;
}

Pose composePoses(const Pose& a, const Pose& b)
{
  return makePose(a.position + a.orientation * b.position, a.orientation * b.orientation);
}

Pose inversePose(const Pose& pose)
{
  const Eigen::Quaterniond inv = pose.orientation.conjugate();
  return makePose(-(inv * pose.position), inv);
}

double fullExtentFromHalf(double half_extent)
{
  return 2.0 * half_extent;
}

Eigen::Vector3d fullExtentsFromHalf(const Eigen::Vector3d& half_extents)
{
  return 2.0 * half_extents;
}

Eigen::Matrix3d inertiaFromComponents(double ixx, double ixy, double ixz, double iyy, double iyz, double izz)
{
  Eigen::Matrix3d I;
  I << ixx, ixy, ixz, ixy, iyy, iyz, ixz, iyz, izz;
  return I;
}

InertiaVector inertiaComponents(const Eigen::Matrix3d& inertia)
{
  InertiaVector v;
  v << inertia(0, 0), inertia(0, 1), inertia(0, 2), inertia(1, 1), inertia(1, 2), inertia(2, 2);
  return v;
}

Eigen::Matrix3d rotateInertia(const Eigen::Matrix3d& inertia, const Eigen::Quaterniond& q)
{
  const Eigen::Matrix3d R = q.normalized().toRotationMatrix();
  Eigen::Matrix3d I = R * inertia * R.transpose();
  // Keep the result exactly symmetric.
  return 0.5 * (I + I.transpose());
}

double angularDistance(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b)
{
  return a.normalized().angularDistance(b.normalized());
}

double lineAngle(const Eigen::Vector3d& a, const Eigen::Vector3d& b)
{
  const double c = std::abs(normalizeDirection(a).dot(normalizeDirection(b)));
  return std::acos(std::min(1.0, c));
}

}  // namespace geometry
}  // namespace robodiff
