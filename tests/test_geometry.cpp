#include <gtest/gtest.h>

#include <cmath>
#include <limits>

#include "core/Errors.hpp"
#include "core/Utility.hpp"
#include "linkage/Geometry.hpp"

using namespace Eigen;
using namespace Geometry;

namespace {

const double TOL = 1e-9;

void expectVectorNear(const Vector3d& expected, const Vector3d& actual, double tol = TOL)
{
	EXPECT_NEAR(expected.x(), actual.x(), tol);
	EXPECT_NEAR(expected.y(), actual.y(), tol);
	EXPECT_NEAR(expected.z(), actual.z(), tol);
}

// z = 1 + x + 2y
Plane slopedPlane()
{
	return threePointPlane(Vector3d(0, 0, 1), Vector3d(1, 0, 2), Vector3d(0, 1, 3));
}

TEST(PlaneTest, ThreePointPlaneContainsItsPoints)
{
	Vector3d a(120, -40, 33), b(-500, 610, 77), c(5000, 610, 165);
	Plane plane = threePointPlane(a, b, c);

	EXPECT_NEAR(1, plane.normal.norm(), TOL);
	EXPECT_NEAR(0, plane.normal.dot(a - plane.point), 1e-9);
	EXPECT_NEAR(0, plane.normal.dot(b - plane.point), 1e-9);
	EXPECT_NEAR(0, plane.normal.dot(c - plane.point), 1e-9);
	EXPECT_NEAR(b.z(), plane.height(b.x(), b.y()), 1e-9);
	EXPECT_NEAR(c.z(), plane.height(c.x(), c.y()), 1e-9);
}

TEST(PlaneTest, CollinearPointsThrow)
{
	EXPECT_THROW(threePointPlane(Vector3d(0, 0, 0), Vector3d(1, 1, 1), Vector3d(2, 2, 2)), GeometryError);
	EXPECT_THROW(threePointPlane(Vector3d(1, 2, 3), Vector3d(1, 2, 3), Vector3d(0, 0, 0)), GeometryError);
}

TEST(PlaneTest, EvaluatesAnyAxis)
{
	Plane plane = slopedPlane();
	EXPECT_NEAR(9, plane.height(2, 3), TOL);
	EXPECT_NEAR(9, plane.evaluate(2, 2, 3), TOL);
	EXPECT_NEAR(2, plane.evaluate(0, 3, 9), TOL);
	EXPECT_NEAR(3, plane.evaluate(1, 2, 9), TOL);
}

TEST(PlaneTest, ParallelAxisThrows)
{
	Plane flat = threePointPlane(Vector3d(0, 0, 5), Vector3d(1, 0, 5), Vector3d(0, 1, 5));
	EXPECT_NEAR(5, flat.height(100, -100), TOL);
	EXPECT_THROW(flat.evaluate(0, 1, 5), GeometryError);
	EXPECT_THROW(flat.evaluate(3, 1, 5), GeometryError);
}

TEST(PlaneTest, ProjectsOntoPlane)
{
	Plane plane = slopedPlane();
	Vector3d p(4, -2, 10);
	Vector3d q = plane.project(p);

	EXPECT_NEAR(q.z(), plane.height(q.x(), q.y()), TOL);
	EXPECT_NEAR(0, (p - q).cross(plane.normal).norm(), TOL);
	expectVectorNear(q, plane.project(q));
}

TEST(LineTest, IntersectionOfAxisAlignedPlanes)
{
	Plane y_plane = threePointPlane(Vector3d(0, 2, 0), Vector3d(1, 2, 0), Vector3d(0, 2, 1));
	Plane z_plane = threePointPlane(Vector3d(0, 0, 3), Vector3d(1, 0, 3), Vector3d(0, 1, 3));

	Line line = planeIntersection(y_plane, z_plane);
	expectVectorNear(Vector3d(0, 2, 3), line.point);
	expectVectorNear(Vector3d(1, 0, 0), line.direction);
	expectVectorNear(Vector3d(-7.5, 2, 3), line(-7.5));
}

TEST(LineTest, IntersectionLiesInBothPlanes)
{
	Plane first = slopedPlane();
	Plane second = threePointPlane(Vector3d(10, -3, 0), Vector3d(-4, 8, 2), Vector3d(6, 6, -9));
	Line line = planeIntersection(first, second);

	EXPECT_NEAR(0, line.point.x(), TOL);
	EXPECT_NEAR(1, line.direction.x(), TOL);
	for (double x : { -100.0, 0.0, 42.0 }) {
		Vector3d p = line(x);
		EXPECT_NEAR(x, p.x(), TOL);
		EXPECT_NEAR(0, first.normal.dot(p - first.point), 1e-8);
		EXPECT_NEAR(0, second.normal.dot(p - second.point), 1e-8);
	}
}

TEST(LineTest, DegenerateIntersectionsThrow)
{
	Plane z3 = threePointPlane(Vector3d(0, 0, 3), Vector3d(1, 0, 3), Vector3d(0, 1, 3));
	Plane z5 = threePointPlane(Vector3d(0, 0, 5), Vector3d(1, 0, 5), Vector3d(0, 1, 5));
	EXPECT_THROW(planeIntersection(z3, z5), GeometryError);

	// x = 1 and y = 2 meet in a vertical line
	Plane x1 = threePointPlane(Vector3d(1, 0, 0), Vector3d(1, 1, 0), Vector3d(1, 0, 1));
	Plane y2 = threePointPlane(Vector3d(0, 2, 0), Vector3d(1, 2, 0), Vector3d(0, 2, 1));
	EXPECT_THROW(planeIntersection(x1, y2), GeometryError);
}

TEST(LineTest, ProjectsOntoLine)
{
	Line line;
	line.point = Vector3d(0, 2, 3);
	line.direction = Vector3d(1, 0, 0);
	expectVectorNear(Vector3d(5, 2, 3), projectOntoLine(line, Vector3d(5, 0, 0)));

	line.direction = Vector3d(1, 1, 0);
	Vector3d p(3, -1, 7);
	Vector3d q = projectOntoLine(line, p);
	EXPECT_NEAR(0, (p - q).dot(line.direction), TOL);
	EXPECT_NEAR(3, q.z(), TOL);
}

TEST(LerpTest, BlendsEndPoints)
{
	Vector3d a(0, 10, -4), b(8, 2, 4);
	expectVectorNear(a, lerp(a, b, 0));
	expectVectorNear(b, lerp(a, b, 1));
	expectVectorNear(Vector3d(2, 8, -2), lerp(a, b, 0.25));
}

TEST(SwingArmTest, LengthFromGain)
{
	EXPECT_EQ(LONG_SWING_ARM, swingArmLength(0));

	double gain = -1.0 * RAD_PER_DEG / MM_PER_INCH;
	EXPECT_NEAR(1 / std::atan(std::abs(gain)), swingArmLength(gain), 1e-6);
	EXPECT_NEAR(swingArmLength(gain), swingArmLength(-gain), TOL);
	EXPECT_NEAR(1455.3, swingArmLength(gain), 0.1);
}

TEST(InstantCenterTest, LiesOnJackingLineAndSwingArmCircle)
{
	struct Case { double x0, hc, length, rl; };
	const Case cases[] = {
		{ 610.0, 32.385, 1455.3, 199.39 },		// front view
		{ 762.5, 21.59, 5821.0, 199.39 },		// side view
		{ -610.0, 32.385, 1455.3, 199.39 },	// other side of the centerline
	};

	for (const Case& c : cases) {
		Vector2d ic = instantCenter(c.x0, c.hc, c.length, c.rl);

		// circle around the wheel center
		double dx = ic(0) - c.x0;
		double dy = ic(1) - c.rl;
		EXPECT_NEAR(c.length, std::sqrt(dx * dx + dy * dy), 1e-6);

		// line from the contact patch through the center height at coordinate 0
		EXPECT_NEAR(c.hc * (1 - ic(0) / c.x0), ic(1), 1e-6);

		// the instant center lies across the centerline from the contact patch
		EXPECT_LT(ic(0) * c.x0, 0);
	}
}

TEST(InstantCenterTest, FrontViewReference)
{
	Vector2d ic = instantCenter(610.0, 0.15 * 8.5 * MM_PER_INCH, swingArmLength(-RAD_PER_DEG / MM_PER_INCH), 7.85 * MM_PER_INCH);
	EXPECT_NEAR(-839.8, ic(0), 0.5);
	EXPECT_NEAR(76.97, ic(1), 0.1);
}

TEST(InstantCenterTest, ContactPatchOnCenterline)
{
	const double cases[][3] = {
		{ 21.59, 1455.3, 199.39 },
		{ 21.59, 999.1, 150.3 },
		{ 21.59, 1455.3, 150.3 },
	};

	for (const auto& c : cases) {
		double hc = c[0], length = c[1], rl = c[2];
		Vector2d ic = instantCenter(0.0, hc, length, rl);

		// straight above the wheel center, one swing arm away
		EXPECT_EQ(0, ic(0));
		EXPECT_NEAR(rl + length, ic(1), 1e-6);
	}
}

TEST(InstantCenterTest, GroundLevelCenter)
{
	double rl = 200, length = 1000;
	Vector2d ic = instantCenter(600, 0, length, rl);
	EXPECT_EQ(0, ic(1));
	EXPECT_NEAR(600 - std::sqrt(length * length - rl * rl), ic(0), TOL);

	EXPECT_THROW(instantCenter(600, 0, 100, rl), GeometryError);
}

TEST(InstantCenterTest, InfiniteSwingArmIsLong)
{
	Vector2d ic = instantCenter(600, 30, std::numeric_limits<double>::infinity(), 200);
	EXPECT_TRUE(std::isfinite(ic(0)));
	EXPECT_TRUE(std::isfinite(ic(1)));

	Vector2d long_arm = instantCenter(600, 30, LONG_SWING_ARM, 200);
	EXPECT_NEAR(long_arm(0), ic(0), 1e-6);
	EXPECT_NEAR(long_arm(1), ic(1), 1e-6);
}

TEST(KingpinTest, UpperBallJointSetsInclination)
{
	Vector3d lower(0, -22.35, -75.5);
	Vector3d upper(3, -33.0, 82.5);
	double kpi = 3 * RAD_PER_DEG;

	Vector3d result = kingpinUpperBallJoint(lower, upper, kpi);
	EXPECT_EQ(upper.x(), result.x());
	EXPECT_EQ(upper.z(), result.z());
	EXPECT_NEAR(kpi, std::atan2(lower.y() - result.y(), result.z() - lower.z()), TOL);

	Vector3d vertical = kingpinUpperBallJoint(lower, upper, 0);
	EXPECT_NEAR(lower.y(), vertical.y(), TOL);
}

} // namespace
