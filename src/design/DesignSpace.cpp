#include "DesignSpace.hpp"

#include <cmath>
#include <iomanip>
#include <sstream>

#include "core/Errors.hpp"
#include "core/Utility.hpp"

using namespace std;
using namespace Eigen;

namespace {
	const double DEFAULT_SAMPLE = 0.5;

	// round-off allowed when a point comes back through a frame conversion, mm
	const double BOUND_TOLERANCE = 1e-6;

	const array<PointSpec, NUM_DESIGN_POINTS> POINT_SPECS = { {
		{ PointId::LAF, "LAF", "Lower A-Arm Front Pickup", "Inner Lower A-Arm Front Pickup", "X",
			{ true, true, false },  { NO_DONOR, NO_DONOR, NO_DONOR } },
		{ PointId::LAR, "LAR", "Lower A-Arm Rear Pickup",  "Inner Lower A-Arm Rear Pickup",  "X",
			{ true, true, false },  { NO_DONOR, (int)PointId::LAF, NO_DONOR } },
		{ PointId::UAF, "UAF", "Upper A-Arm Front Pickup", "Inner Upper A-Arm Front Pickup", "X",
			{ true, false, false }, { (int)PointId::LAF, NO_DONOR, NO_DONOR } },
		{ PointId::UAR, "UAR", "Upper A-Arm Rear Pickup",  "Inner Upper A-Arm Rear Pickup",  "X",
			{ true, false, false }, { (int)PointId::LAR, (int)PointId::UAF, NO_DONOR } },
		{ PointId::TA,  "TA",  "Tie Rod Pickup",           "Inner Tie Rod Pickup",           "X",
			{ true, true, false },  { NO_DONOR, NO_DONOR, NO_DONOR } },
		{ PointId::LB,  "LB",  "Lower Pickup",             "Outer Lower A-Arm Pickup",       "W",
			{ true, true, true },   { NO_DONOR, NO_DONOR, NO_DONOR } },
		{ PointId::UB,  "UB",  "Upper Pickup",             "Outer Upper A-Arm Pickup",       "W",
			{ true, false, true },  { NO_DONOR, NO_DONOR, NO_DONOR } },
		{ PointId::TB,  "TB",  "Tie Rod Pickup",           "Outer Tie Rod Pickup",           "W",
			{ true, true, true },   { NO_DONOR, NO_DONOR, NO_DONOR } },
	} };
}

const array<PointSpec, NUM_DESIGN_POINTS>& pointSpecs()
{
	return POINT_SPECS;
}

const PointSpec& pointSpec(PointId id)
{
	return POINT_SPECS[(int)id];
}

const PointSpec* findPointSpec(const string& key)
{
	for (const PointSpec& spec : POINT_SPECS) {
		if (key == spec.key)
			return &spec;
	}
	return nullptr;
}

bool DesignBound::isFixed(int axis) const
{
	return std::isnan(range(axis, 0)) || std::isnan(range(axis, 1));
}

bool DesignBound::contains(int axis, double value) const
{
	if (isFixed(axis))
		return true;
	return min(axis) - BOUND_TOLERANCE <= value && value <= max(axis) + BOUND_TOLERANCE;
}

string BoundViolationWarning::describe() const
{
	const PointSpec& spec = pointSpec(point);

	stringstream ss;
	ss << spec.description << " (" << spec.key << ") Exceeds " << axisName(axis) << " Bounds" << endl;
	ss << setprecision(3) << "Min: " << min << ", Max: " << max << ", Current: " << value;
	return ss.str();
}

DesignSpace::DesignSpace(const BoundTable& bounds)
{
	for (const PointSpec& spec : pointSpecs()) {
		auto it = bounds.find(spec.id);
		if (it == bounds.end())
			throw DesignSpaceError(string("Missing design bound for point ") + spec.key);

		const DesignBound& raw = it->second;
		for (int axis = 0; axis < 3; axis++) {
			if (std::isnan(raw.min(axis)) != std::isnan(raw.max(axis))) {
				throw DesignSpaceError(string("Bound of ") + spec.key + " mixes NaN and numeric limits on the "
					+ axisName(axis) + " axis");
			}
			if (!raw.isFixed(axis) && raw.min(axis) > raw.max(axis)) {
				throw DesignSpaceError(string("Bound of ") + spec.key + " has min > max on the "
					+ axisName(axis) + " axis");
			}
		}

		// Inherit the donor's range where this bound is left at zero. Donors come earlier
		// in the point table, so their rows are already final.
		DesignBound normalized = raw;
		array<bool, 3> inherited = { false, false, false };
		array<bool, 3> sampled = { false, false, false };
		Vector3d fractions = Vector3d::Zero();

		for (int axis = 0; axis < 3; axis++) {
			if (spec.donor[axis] != NO_DONOR && raw.isZero(axis)) {
				normalized.range.row(axis) = bounds_.at((PointId)spec.donor[axis]).range.row(axis);
				inherited[axis] = true;
			}

			// a zero width range has nothing to sample
			sampled[axis] = spec.sampled[axis] && !raw.isFixed(axis) && raw.width(axis) != 0;
			if (sampled[axis])
				fractions(axis) = DEFAULT_SAMPLE;
		}

		bounds_[spec.id] = normalized;
		inherited_[spec.id] = inherited;
		sampled_[spec.id] = sampled;
		sample_[spec.id] = fractions;
	}
}

void DesignSpace::setSample(PointId id, int axis, double fraction)
{
	const PointSpec& spec = pointSpec(id);
	if (axis < 0 || axis > 2)
		throw DesignSpaceError("Axis index out of range: " + to_string(axis));
	if (!(fraction >= 0 && fraction <= 1)) {
		throw DesignSpaceError(string("Sample of ") + spec.key + " on the " + axisName(axis)
			+ " axis must lie in [0, 1], got " + to_string(fraction));
	}
	if (!isSampled(id, axis) && fraction != 0) {
		throw DesignSpaceError(string("The ") + axisName(axis) + " axis of " + spec.key
			+ " is not sampled and must stay at 0");
	}
	sample_[id](axis) = fraction;
}

void DesignSpace::setSample(PointId id, const Vector3d& fractions)
{
	// validate everything before writing anything
	Vector3d previous = sample_.at(id);
	try {
		for (int axis = 0; axis < 3; axis++)
			setSample(id, axis, fractions(axis));
	}
	catch (const DesignSpaceError&) {
		sample_[id] = previous;
		throw;
	}
}

void DesignSpace::setUniformSample(double fraction)
{
	for (const PointSpec& spec : pointSpecs()) {
		for (int axis = 0; axis < 3; axis++) {
			if (isSampled(spec.id, axis))
				setSample(spec.id, axis, fraction);
		}
	}
}

double DesignSpace::sample(double min, double max, double fraction)
{
	// interpolation form keeps both end points exact
	return min * (1 - fraction) + max * fraction;
}

Vector3d DesignSpace::sample(const DesignBound& bound, const Vector3d& fractions)
{
	Vector3d position;
	for (int axis = 0; axis < 3; axis++) {
		position(axis) = bound.isFixed(axis) ? 0.0 : sample(bound.min(axis), bound.max(axis), fractions(axis));
	}
	return position;
}

map<PointId, Vector3d> DesignSpace::resolvePositions() const
{
	map<PointId, Vector3d> positions;
	for (const PointSpec& spec : pointSpecs()) {
		Vector3d position = sample(bounds_.at(spec.id), sample_.at(spec.id));

		// coincident with the donor, not merely inside the same range
		for (int axis = 0; axis < 3; axis++) {
			if (isInherited(spec.id, axis))
				position(axis) = positions.at((PointId)spec.donor[axis])(axis);
		}
		positions[spec.id] = position;
	}
	return positions;
}

vector<BoundViolationWarning> DesignSpace::checkBounds(PointId id, const Vector3d& position) const
{
	vector<BoundViolationWarning> warnings;
	const DesignBound& bound = getBound(id);
	for (int axis = 0; axis < 3; axis++) {
		if (!bound.contains(axis, position(axis)))
			warnings.push_back({ id, axis, bound.min(axis), bound.max(axis), position(axis) });
	}
	return warnings;
}
