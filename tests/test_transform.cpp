#include <gtest/gtest.h>

#include <stdexcept>

#include "core/Transform.hpp"
#include "core/Utility.hpp"

using namespace Eigen;

namespace {

const double TOL = 1e-9;

void expectVectorNear(const Vector3d& expected, const Vector3d& actual, double tol = TOL)
{
	EXPECT_NEAR(expected.x(), actual.x(), tol);
	EXPECT_NEAR(expected.y(), actual.y(), tol);
	EXPECT_NEAR(expected.z(), actual.z(), tol);
}

TEST(TransformTest, TranslationMovesPoints)
{
	Matrix4d t = Transforms::translation(Vector3d(1, -2, 3));
	Vector4d p = t * Vector4d(10, 10, 10, 1);
	EXPECT_NEAR(11, p(0), TOL);
	EXPECT_NEAR(8, p(1), TOL);
	EXPECT_NEAR(13, p(2), TOL);
	EXPECT_NEAR(1, p(3), TOL);
}

TEST(TransformTest, RotationOrderLeftMultiplies)
{
	Vector3d angles(0.3, -0.2, 0.7);
	Matrix4d r = Transforms::rotation(angles, "xyz");

	Matrix3d expected = (AngleAxisd(0.7, Vector3d::UnitZ()) *
		AngleAxisd(-0.2, Vector3d::UnitY()) *
		AngleAxisd(0.3, Vector3d::UnitX())).toRotationMatrix();

	EXPECT_TRUE(r.topLeftCorner(3, 3).isApprox(expected, TOL));
	EXPECT_TRUE(r.topRightCorner(3, 1).isZero(TOL));
	EXPECT_NEAR(1, r(3, 3), TOL);
}

TEST(TransformTest, SingleAxisQuarterTurn)
{
	VectorXd angle(1);
	angle << M_PI / 2;
	Matrix4d r = Transforms::rotation(angle, "z");
	Vector4d p = r * Vector4d(1, 0, 0, 1);
	EXPECT_NEAR(0, p(0), TOL);
	EXPECT_NEAR(1, p(1), TOL);
	EXPECT_NEAR(0, p(2), TOL);
}

TEST(TransformTest, RotationRejectsBadInput)
{
	EXPECT_THROW(Transforms::rotation(Vector3d(0, 0, 0), "xy"), std::invalid_argument);
	EXPECT_THROW(Transforms::rotation(Vector3d(0, 0, 0), "xyw"), std::invalid_argument);
}

TEST(TransformTest, ForwardThenReverseIsIdentity)
{
	Vector3d rotation(0.1, -0.4, 1.2);
	Vector3d offset(100, -50, 25);

	Matrix3Xd points(3, 4);
	points << 0, 1, -20, 300,
	          0, 2, 15, -40,
	          0, 3, 7, 12;

	Matrix3Xd child = Transforms::forwardTransform(points, rotation, offset);
	Matrix3Xd back = Transforms::reverseTransform(child, rotation, offset);
	EXPECT_LT((back - points).cwiseAbs().maxCoeff(), 1e-9);

	Matrix3Xd parent = Transforms::reverseTransform(points, rotation, offset);
	Matrix3Xd again = Transforms::forwardTransform(parent, rotation, offset);
	EXPECT_LT((again - points).cwiseAbs().maxCoeff(), 1e-9);
}

TEST(TransformTest, ChildOriginMapsToOffset)
{
	Vector3d rotation(0.5, 0.25, -0.75);
	Vector3d offset(12, 34, 56);

	// the child origin sits at the offset in parent coordinates
	expectVectorNear(offset, Transforms::reverseTransform(Vector3d(0, 0, 0), rotation, offset));
	expectVectorNear(Vector3d::Zero(), Transforms::forwardTransform(offset, rotation, offset));
}

TEST(TransformTest, ReverseRotatesBeforeTranslating)
{
	// child rotated a quarter turn about z and shifted along x
	Vector3d rotation(0, 0, M_PI / 2);
	Vector3d offset(10, 0, 0);

	// child x axis points along parent y
	expectVectorNear(Vector3d(10, 1, 0), Transforms::reverseTransform(Vector3d(1, 0, 0), rotation, offset));
	expectVectorNear(Vector3d(1, 0, 0), Transforms::forwardTransform(Vector3d(10, 1, 0), rotation, offset));
}

TEST(TransformTest, BatchMatchesSinglePoint)
{
	Vector3d rotation(-0.3, 0.6, 0.9);
	Vector3d offset(-5, 5, 1);

	Matrix3Xd points(3, 2);
	points.col(0) = Vector3d(1, 2, 3);
	points.col(1) = Vector3d(-4, 0, 8);

	Matrix3Xd batch = Transforms::forwardTransform(points, rotation, offset);
	expectVectorNear(Transforms::forwardTransform(Vector3d(points.col(0)), rotation, offset), batch.col(0));
	expectVectorNear(Transforms::forwardTransform(Vector3d(points.col(1)), rotation, offset), batch.col(1));
}

} // namespace
