#include "LinkageSystem.hpp"

#include <iomanip>
#include <map>

#include "DoubleWishbone.hpp"
#include "core/Errors.hpp"

using namespace std;
using namespace Eigen;

namespace {
	// where the inboard pickups live once the solver has moved them into their member frames
	const map<string, pair<string, string>> SOLVED_LOCATIONS = {
		{ "LAF", { "LA", "LAF" } },
		{ "LAR", { "LA", "LAR" } },
		{ "UAF", { "UA", "UAF" } },
		{ "UAR", { "UA", "UAR" } },
		{ "TA",  { "TR", "O" } },
	};

	const char* CENTER_KEYS[] = { "RC", "FC", "PC", "SC" };
}

LinkageSystem::LinkageSystem(string name, const Target& target, const BoundTable& bounds) :
	name_(std::move(name)),
	target_(target)
{
	switch (target.linkage) {
	case LinkageType::DOUBLE_WISHBONE:
		frames_ = FrameGraph(DoubleWishbone::frameDescriptors());
		break;
	case LinkageType::MULTILINK:
		throw UnsupportedLinkageType("Multilink linkages are not supported, only double wishbone");
	default:
		throw UnsupportedLinkageType("Linkage type not recognized");
	}

	design_space_ = DesignSpace(bounds);
}

Vector3d LinkageSystem::evaluatePoint(const string& point, const string& source, const string& target) const
{
	return frames_.evaluatePoint(point, source, target);
}

Vector3d LinkageSystem::evaluatePoint(const Vector3d& point, const string& source, const string& target) const
{
	return frames_.evaluatePoint(point, source, target);
}

void LinkageSystem::setPoint(const string& point, const string& frame, const Vector3d& value)
{
	setPoint(point, frame, value, frame);
}

void LinkageSystem::setPoint(const string& point, const string& frame, const Vector3d& value, const string& source)
{
	// fail on a bad name before reporting anything
	frames_.getPointPosition(frame, point);

	Vector3d local = frames_.evaluatePoint(value, source, frame);

	// bounds are expressed in the design point's own frame
	if (const PointSpec* spec = findPointSpec(point)) {
		Vector3d bounded = frames_.evaluatePoint(local, frame, spec->frame);
		for (const BoundViolationWarning& warning : design_space_.checkBounds(spec->id, bounded)) {
			cerr << "Warning: " << warning.describe() << endl;
			warnings_.push_back(warning);
		}
	}

	frames_.setPointPosition(frame, point, local);
}

FrameAxes LinkageSystem::getFrameAxes(const string& frame, const string& target) const
{
	FrameAxes axes;
	axes.origin = evaluatePoint("O", frame, target);
	axes.x_axis = evaluatePoint("E1", frame, target);
	axes.y_axis = evaluatePoint("E2", frame, target);
	axes.z_axis = evaluatePoint("E3", frame, target);
	return axes;
}

vector<Hardpoint> LinkageSystem::hardpoints() const
{
	vector<Hardpoint> points;

	for (const PointSpec& spec : pointSpecs()) {
		string frame = spec.frame;
		string key = spec.key;

		if (!frames_.getFrame(frame).findPoint(key)) {
			auto it = SOLVED_LOCATIONS.find(key);
			if (it == SOLVED_LOCATIONS.end())
				throw PointNotFoundError(key, frame);
			frame = it->second.first;
			key = it->second.second;
		}

		points.push_back({ spec.key, spec.description, frame, evaluatePoint(key, frame, "I") });
	}

	const Frame& root = frames_.getFrame("I");
	for (const char* key : CENTER_KEYS) {
		const PointOfInterest* poi = root.findPoint(key);
		if (!poi)
			throw PointNotFoundError(key, "I");
		points.push_back({ key, poi->title, "I", poi->position });
	}

	return points;
}

void LinkageSystem::printHardpoints(ostream& out) const
{
	ios::fmtflags flags = out.flags();
	streamsize precision = out.precision();

	out << "Hardpoints of " << name_ << " (mm, Intermediate frame):" << endl;
	out << fixed << setprecision(2);
	for (const Hardpoint& p : hardpoints()) {
		out << "	" << left << setw(5) << p.key << setw(34) << p.title << right
			<< setw(10) << p.position.x()
			<< setw(10) << p.position.y()
			<< setw(10) << p.position.z() << endl;
	}
	out.flags(flags);
	out.precision(precision);
}

LinkageSystem buildLinkage(const string& name, const Target& target, const BoundTable& bounds)
{
	return LinkageSystem(name, target, bounds);
}

LinkageSystem generateLinkage(LinkageSystem system)
{
	switch (system.getTarget().linkage) {
	case LinkageType::DOUBLE_WISHBONE:
		return DoubleWishbone::solve(std::move(system));
	default:
		throw UnsupportedLinkageType("Linkage type not recognized");
	}
}
