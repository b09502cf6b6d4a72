#include "Transform.hpp"

#include <stdexcept>

using namespace Eigen;

namespace Transforms {

namespace {
	Vector3d unitAxis(char axis)
	{
		switch (axis) {
		case 'x': case 'X': return Vector3d::UnitX();
		case 'y': case 'Y': return Vector3d::UnitY();
		case 'z': case 'Z': return Vector3d::UnitZ();
		}
		throw std::invalid_argument(std::string("Unknown rotation axis: ") + axis);
	}

	// applies a homogeneous matrix to a batch of points and drops the homogeneous row
	Matrix3Xd applyHomogeneous(const Matrix4d& transform, const Matrix3Xd& points)
	{
		Matrix4Xd homogeneous(4, points.cols());
		homogeneous.topRows<3>() = points;
		homogeneous.row(3).setOnes();
		return (transform * homogeneous).topRows<3>();
	}
}

Matrix4d translation(const Vector3d& offset)
{
	Affine3d t = Affine3d::Identity() * Translation3d(offset);
	return t.matrix();
}

Matrix4d rotation(const VectorXd& angles, const std::string& axis_order)
{
	if (angles.size() != (Index)axis_order.size()) {
		throw std::invalid_argument("Rotation needs one angle per axis, got " +
			std::to_string(angles.size()) + " angles for axis order \"" + axis_order + "\"");
	}

	Affine3d r = Affine3d::Identity();
	for (size_t k = 0; k < axis_order.size(); k++) {
		r = AngleAxisd(angles(k), unitAxis(axis_order[k])) * r;
	}
	return r.matrix();
}

Matrix3Xd forwardTransform(const Matrix3Xd& points, const Vector3d& rotation, const Vector3d& translation)
{
	// undo the rotation in reverse axis order, then undo the offset
	Vector3d reversed(-rotation(2), -rotation(1), -rotation(0));
	Matrix4d transform = Transforms::rotation(reversed, "zyx") * Transforms::translation(-translation);
	return applyHomogeneous(transform, points);
}

Vector3d forwardTransform(const Vector3d& point, const Vector3d& rotation, const Vector3d& translation)
{
	Matrix3Xd points = point;
	return forwardTransform(points, rotation, translation).col(0);
}

Matrix3Xd reverseTransform(const Matrix3Xd& points, const Vector3d& rotation, const Vector3d& translation)
{
	Matrix4d transform = Transforms::translation(translation) * Transforms::rotation(rotation, "xyz");
	return applyHomogeneous(transform, points);
}

Vector3d reverseTransform(const Vector3d& point, const Vector3d& rotation, const Vector3d& translation)
{
	Matrix3Xd points = point;
	return reverseTransform(points, rotation, translation).col(0);
}

} // namespace Transforms
