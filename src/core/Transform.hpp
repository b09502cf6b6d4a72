#pragma once
#include <string>

#include "Eigen/Dense"

// homogeneous transform primitives used to chain coordinates through the frame graph
// every function here is pure, points are stored as columns
namespace Transforms {

// 4x4 homogeneous translation by offset
Eigen::Matrix4d translation(const Eigen::Vector3d& offset);

// 4x4 homogeneous rotation built from elementary rotations about the axes named in axis_order,
// angles(k) being the angle about axis_order[k]
// each successive rotation left-multiplies the previous ones, so "xyz" yields Rz * Ry * Rx
Eigen::Matrix4d rotation(const Eigen::VectorXd& angles, const std::string& axis_order);

// expresses points given in a parent frame in the coordinates of a child frame
// whose placement relative to the parent is described by rotation and translation
Eigen::Matrix3Xd forwardTransform(const Eigen::Matrix3Xd& points, const Eigen::Vector3d& rotation, const Eigen::Vector3d& translation);
Eigen::Vector3d  forwardTransform(const Eigen::Vector3d& point, const Eigen::Vector3d& rotation, const Eigen::Vector3d& translation);

// inverse of forwardTransform: child frame coordinates back into the parent frame
Eigen::Matrix3Xd reverseTransform(const Eigen::Matrix3Xd& points, const Eigen::Vector3d& rotation, const Eigen::Vector3d& translation);
Eigen::Vector3d  reverseTransform(const Eigen::Vector3d& point, const Eigen::Vector3d& rotation, const Eigen::Vector3d& translation);

} // namespace Transforms
