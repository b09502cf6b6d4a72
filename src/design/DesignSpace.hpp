#pragma once

#include <array>
#include <map>
#include <string>
#include <vector>

#include "Eigen/Dense"

// hardpoints whose coordinates are drawn from the design space
enum class PointId
{
	LAF,	// lower A-arm front, inboard
	LAR,	// lower A-arm rear, inboard
	UAF,	// upper A-arm front, inboard
	UAR,	// upper A-arm rear, inboard
	TA,		// tie rod, inboard
	LB,		// lower ball joint
	UB,		// upper ball joint
	TB		// tie rod, outboard
};

const int NUM_DESIGN_POINTS = 8;
const int NO_DONOR = -1;

// static description of one design point
struct PointSpec {
	PointId id;
	const char* key;			// PoI key in the owning frame
	const char* title;			// PoI title in the owning frame
	const char* description;	// used in bound warnings
	const char* frame;			// frame the bound is expressed in

	// axes drawn from the bound, the rest are placed by the solver
	std::array<bool, 3> sampled;

	// per axis, the point whose bound and position are inherited
	// when this point's own bound on that axis is zero (NO_DONOR if none)
	std::array<int, 3> donor;
};

const std::array<PointSpec, NUM_DESIGN_POINTS>&	pointSpecs();
const PointSpec&								pointSpec(PointId id);
// nullptr if key is not a design point
const PointSpec*								findPointSpec(const std::string& key);

struct DesignBound {
	// row per axis (longitudinal, lateral, vertical), columns are min and max
	// a row of NaN marks a fixed parameter that is not drawn from a range
	Eigen::Matrix<double, 3, 2> range;

	double	min(int axis) const { return range(axis, 0); }
	double	max(int axis) const { return range(axis, 1); }
	double	width(int axis) const { return range(axis, 1) - range(axis, 0); }
	bool	isFixed(int axis) const;
	bool	isZero(int axis) const { return range(axis, 0) == 0 && range(axis, 1) == 0; }
	bool	contains(int axis, double value) const;
};

using BoundTable = std::map<PointId, DesignBound>;

// non-fatal report of a point written outside of its design bound
struct BoundViolationWarning {
	PointId	point;
	int		axis;
	double	min;
	double	max;
	double	value;

	std::string describe() const;
};

// Bounds and normalized sample of every design point.
// Construction validates the bound table and applies bound inheritance.
class DesignSpace {
public:
	DesignSpace() = default;
	explicit DesignSpace(const BoundTable& bounds);

	const DesignBound&	getBound(PointId id) const { return bounds_.at(id); }
	const BoundTable&	getBounds() const { return bounds_; }

	// axis takes its bound and position from the donor point
	bool				isInherited(PointId id, int axis) const { return inherited_.at(id)[axis]; }
	// axis can be set to any fraction in [0, 1]
	bool				isSampled(PointId id, int axis) const { return sampled_.at(id)[axis]; }

	Eigen::Vector3d		getSample(PointId id) const { return sample_.at(id); }
	void				setSample(PointId id, const Eigen::Vector3d& fractions);
	void				setSample(PointId id, int axis, double fraction);
	void				setUniformSample(double fraction);

	// absolute coordinates of every design point, in the frame of its bound
	std::map<PointId, Eigen::Vector3d>	resolvePositions() const;

	std::vector<BoundViolationWarning>	checkBounds(PointId id, const Eigen::Vector3d& position) const;

	// min + fraction * (max - min) per axis, fixed axes resolve to 0
	static double			sample(double min, double max, double fraction);
	static Eigen::Vector3d	sample(const DesignBound& bound, const Eigen::Vector3d& fractions);

private:
	BoundTable								bounds_;
	std::map<PointId, std::array<bool, 3>>	inherited_;
	std::map<PointId, std::array<bool, 3>>	sampled_;
	std::map<PointId, Eigen::Vector3d>		sample_;
};
