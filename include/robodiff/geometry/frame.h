#ifndef ROBODIFF_GEOMETRY_FRAME_H_
#define ROBODIFF_GEOMETRY_FRAME_H_

#include <string>

#include <Eigen/Core>
#include <Eigen/Geometry>

namespace robodiff {
namespace geometry {

using InertiaVector = Eigen::Matrix<double, 6, 1>;  // ixx, ixy, ixz, iyy, iyz, izz

// Position + unit quaternion. Orientation is kept in canonical form (see canonicalQuaternion).
struct Pose
{
  Eigen::Vector3d position = Eigen::Vector3d::Zero();
  Eigen::Quaterniond orientation = Eigen::Quaterniond::Identity();
};

// ---- Core helpers -----------------------------------------------------------

double toRadians(double degrees);
double toDegrees(double radians);

/**
 * @brief Normalize a quaternion and pick the representative with non-negative scalar part.
 *
 * When the scalar part is zero the first non-zero vector component is made positive, so q and -q
 * always map to the same value.
 * @throws std::invalid_argument on a zero-norm or non-finite quaternion.
 */
Eigen::Quaterniond canonicalQuaternion(const Eigen::Quaterniond& q);

/**
 * @brief Normalize a direction vector.
 * @throws std::invalid_argument on a zero-norm or non-finite vector.
 */
Eigen::Vector3d normalizeDirection(const Eigen::Vector3d& v);

// ---- Orientation encodings --------------------------------------------------

// Fixed-axis roll, pitch, yaw: R = Rz(yaw) * Ry(pitch) * Rx(roll).
Eigen::Quaterniond quaternionFromRPY(double roll, double pitch, double yaw);

/**
 * @brief Euler angles applied in the order given by a three letter sequence.
 *
 * Lower case letters rotate about the moving (intrinsic) axes, upper case letters about the fixed
 * (extrinsic) axes. Cases may be mixed. "XYZ" is equivalent to quaternionFromRPY.
 * @throws std::invalid_argument on a malformed sequence.
 */
Eigen::Quaterniond quaternionFromEuler(const Eigen::Vector3d& angles, const std::string& sequence);

Eigen::Quaterniond quaternionFromWXYZ(double w, double x, double y, double z);
Eigen::Quaterniond quaternionFromXYZW(double x, double y, double z, double w);
Eigen::Quaterniond quaternionFromAxisAngle(const Eigen::Vector3d& axis, double angle);

// Frame whose X axis is x and whose Y axis is y orthogonalized against x.
Eigen::Quaterniond quaternionFromXYAxes(const Eigen::Vector3d& x, const Eigen::Vector3d& y);

// Minimal rotation taking +Z onto z.
Eigen::Quaterniond quaternionFromZAxis(const Eigen::Vector3d& z);

Eigen::Quaterniond quaternionFromMatrix(const Eigen::Matrix3d& rotation);

// ---- Frames -----------------------------------------------------------------

Eigen::Isometry3d toIsometry(const Pose& pose);
Pose poseFromIsometry(const Eigen::Isometry3d& tf);
// Throws std::invalid_argument on a non-finite position or an invalid orientation.
Pose makePose(const Eigen::Vector3d& position, const Eigen::Quaterniond& orientation);

// a * b, i.e. b expressed in the parent frame of a.
Pose composePoses(const Pose& a, const Pose& b);
Pose inversePose(const Pose& pose);

// ---- Extents and units ------------------------------------------------------

double fullExtentFromHalf(double half_extent);
Eigen::Vector3d fullExtentsFromHalf(const Eigen::Vector3d& half_extents);

// ---- Inertia ----------------------------------------------------------------

Eigen::Matrix3d inertiaFromComponents(double ixx, double ixy, double ixz, double iyy, double iyz, double izz);
InertiaVector inertiaComponents(const Eigen::Matrix3d& inertia);

// Express a tensor given in a frame rotated by q in the parent axes: R * I * R^T.
Eigen::Matrix3d rotateInertia(const Eigen::Matrix3d& inertia, const Eigen::Quaterniond& q);

// ---- Distances --------------------------------------------------------------

// Rotation angle between two orientations, in [0, pi]. q and -q are the same orientation.
double angularDistance(const Eigen::Quaterniond& a, const Eigen::Quaterniond& b);

// Angle between two lines through the origin (direction sign ignored), in [0, pi/2].
double lineAngle(const Eigen::Vector3d& a, const Eigen::Vector3d& b);

}  // namespace geometry
}  // namespace robodiff

#endif  // ROBODIFF_GEOMETRY_FRAME_H_
