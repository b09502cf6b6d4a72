#pragma once
#include "Eigen/Dense"

// closed-form geometry used to place the linkage hardpoints
// every function is pure and takes its points explicitly
namespace Geometry {

// swing arm length substituted when the camber or caster gain is zero (1 km)
const double LONG_SWING_ARM = 1e6;

// plane through a point with a unit normal
struct Plane {
	Eigen::Vector3d point;
	Eigen::Vector3d normal;

	// solves the plane equation for coordinate axis given the other two coordinates
	// in increasing axis order, e.g. axis 2 gives z(x, y)
	double			evaluate(int axis, double u, double v) const;
	double			height(double x, double y) const { return evaluate(2, x, y); }
	Eigen::Vector3d	project(const Eigen::Vector3d& p) const;
};

// line parametrized by the longitudinal coordinate: operator()(x) has x as its first component
struct Line {
	Eigen::Vector3d point;		// point on the line with x = 0
	Eigen::Vector3d direction;	// direction with x = 1

	Eigen::Vector3d operator()(double x) const { return point + x * direction; }
};

inline Eigen::Vector3d lerp(const Eigen::Vector3d& a, const Eigen::Vector3d& b, double alpha)
{
	return a * (1 - alpha) + b * alpha;
}

// normal = normalize(cross(a - b, a - c)), anchored at a
Plane threePointPlane(const Eigen::Vector3d& a, const Eigen::Vector3d& b, const Eigen::Vector3d& c);

// intersection line of two planes with unit normals
Line planeIntersection(const Plane& first, const Plane& second);

// orthogonal projection of p onto the line
Eigen::Vector3d projectOntoLine(const Line& line, const Eigen::Vector3d& p);

// 1 / atan(|gain|), LONG_SWING_ARM when the gain is zero
double swingArmLength(double gain);

// Intersection of the jacking line with the swing arm circle.
// x0: contact patch coordinate (lateral for the front view, longitudinal for the side view)
// hc: roll or pitch center height the jacking line passes through at coordinate 0
// length: swing arm length, rl: loaded radius
// returns (coordinate, height) of the instant center
Eigen::Vector2d instantCenter(double x0, double hc, double length, double rl);

// upper ball joint with its lateral coordinate moved so the kingpin axis makes angle kpi with vertical
Eigen::Vector3d kingpinUpperBallJoint(const Eigen::Vector3d& lower, const Eigen::Vector3d& upper, double kpi);

} // namespace Geometry
