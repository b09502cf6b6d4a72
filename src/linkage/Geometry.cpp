#include "Geometry.hpp"

#include <cmath>
#include <limits>

#include "core/Errors.hpp"
#include "core/Utility.hpp"

using namespace Eigen;

namespace Geometry {

namespace {
	const double EPSILON = 1e-12;
}

double Plane::evaluate(int axis, double u, double v) const
{
	if (axis < 0 || axis > 2)
		throw GeometryError("Plane axis out of range: " + std::to_string(axis));
	if (std::abs(normal(axis)) < EPSILON)
		throw GeometryError("Plane is parallel to the " + std::string(axisName(axis)) + " axis");

	// the two remaining axes in increasing order
	int i = axis == 0 ? 1 : 0;
	int j = axis == 2 ? 1 : 2;

	return point(axis) - (normal(i) * (u - point(i)) + normal(j) * (v - point(j))) / normal(axis);
}

Vector3d Plane::project(const Vector3d& p) const
{
	double distance = normal.dot(p - point);
	return p - distance * normal;
}

Plane threePointPlane(const Vector3d& a, const Vector3d& b, const Vector3d& c)
{
	Vector3d n = (a - b).cross(a - c);
	if (n.norm() < EPSILON)
		throw GeometryError("Plane points are collinear");

	Plane plane;
	plane.point = a;
	plane.normal = n.normalized();
	return plane;
}

Line planeIntersection(const Plane& first, const Plane& second)
{
	const Vector3d& n1 = first.normal;
	const Vector3d& n2 = second.normal;

	double d1 = n1.dot(first.point);
	double d2 = n2.dot(second.point);
	double n12 = n1.dot(n2);

	if (1 - n12 * n12 < EPSILON)
		throw GeometryError("Planes are parallel");

	// advance one unit per unit of x
	Vector3d s = n1.cross(n2);
	if (std::abs(s.x()) < EPSILON)
		throw GeometryError("Plane intersection has no longitudinal extent");
	s /= s.x();

	// closest point of the line to the origin, then slid back to x = 0
	Vector3d p0 = (n1 * (d1 - d2 * n12) + n2 * (d2 - d1 * n12)) / (1 - n12 * n12);
	p0 -= p0.x() * s;

	Line line;
	line.point = p0;
	line.direction = s;
	return line;
}

Vector3d projectOntoLine(const Line& line, const Vector3d& p)
{
	Vector3d a = line(0);
	Vector3d b = line(1);

	Vector3d s = b - a;
	Vector3d v = p - a;

	return a + s.dot(v) / s.dot(s) * s;
}

double swingArmLength(double gain)
{
	if (gain == 0)
		return LONG_SWING_ARM;
	return 1 / std::atan(std::abs(gain));
}

Vector2d instantCenter(double x0, double hc, double length, double rl)
{
	if (std::isinf(length))
		length = LONG_SWING_ARM;

	// height where the jacking line meets the circle of radius length around (x0, rl)
	if (hc != 0) {
		double a = 1 + (x0 / hc) * (x0 / hc);
		double b = -2 * rl;
		double c = rl * rl - length * length;

		double discriminant = b * b - 4 * a * c;
		if (discriminant < 0)
			throw GeometryError("Jacking line does not reach the swing arm circle");

		double y = (-b + sign(hc) * std::sqrt(discriminant)) / (2 * a);

		// back on the jacking line, exact for a contact patch at coordinate 0
		return Vector2d(x0 * (1 - y / hc), y);
	}

	// ground level center, the jacking line is the ground itself
	double reach = length * length - rl * rl;
	if (reach < 0)
		throw GeometryError("Swing arm is shorter than the loaded radius");

	return Vector2d(x0 - sign(x0) * std::sqrt(reach), 0);
}

Vector3d kingpinUpperBallJoint(const Vector3d& lower, const Vector3d& upper, double kpi)
{
	Vector3d result = upper;
	result.y() = lower.y() - (upper.z() - lower.z()) * std::tan(kpi);
	return result;
}

} // namespace Geometry
