#include "DoubleWishbone.hpp"

#include <iostream>
#include <map>
#include <string>
#include <utility>

#include "Geometry.hpp"
#include "core/Errors.hpp"
#include "core/Utility.hpp"

using namespace std;
using namespace Eigen;

namespace DoubleWishbone {

namespace {
	// length of the axis marker points every frame carries
	const double AXIS_MARKER = 25;

	// the frames and points that make up one A-arm
	struct ArmPoints {
		const char* frame;
		const char* ball;
		const char* front;
		const char* rear;
	};

	const ArmPoints LOWER_ARM = { "LA", "LB", "LAF", "LAR" };
	const ArmPoints UPPER_ARM = { "UA", "UB", "UAF", "UAR" };

	// axle frame copies that are redundant once the member frames are placed
	const char* AXLE_PICKUPS[] = { "LAF", "LAR", "UAF", "UAR", "TA" };

	PointOfInterest poi(const string& title, const string& style, const Vector3d& position = Vector3d::Zero())
	{
		return { title, position, style };
	}

	PoiTable defaultPoints()
	{
		return {
			{ "O",  poi("Origin", "k.") },
			{ "E1", poi("x-Axis", "k.", Vector3d(AXIS_MARKER, 0, 0)) },
			{ "E2", poi("y-Axis", "k.", Vector3d(0, AXIS_MARKER, 0)) },
			{ "E3", poi("z-Axis", "k.", Vector3d(0, 0, AXIS_MARKER)) },
		};
	}

	FrameDescriptor frame(const string& name, const string& title, const string& parent,
		array<bool, 6> dof, const PoiTable& extra_points)
	{
		FrameDescriptor d;
		d.name = name;
		d.title = title;
		d.parent = parent;
		d.rotation = Vector3d::Zero();
		d.position = Vector3d::Zero();
		d.dof = dof;
		d.points = defaultPoints();
		d.points.insert(d.points.end(), extra_points.begin(), extra_points.end());
		return d;
	}

	// Pivot axis and orientation of an A-arm frame. The apex is the ball joint projected onto the pivot axis,
	// x points at the front pickup and the ball joint lies on y.
	void placeArmFrame(LinkageSystem& system, const ArmPoints& arm)
	{
		FrameGraph& frames = system.getFrames();

		Vector3d fc = system.evaluatePoint("FC", "I", "X");
		Vector3d sc = system.evaluatePoint("SC", "I", "X");
		Vector3d ta = system.evaluatePoint("TA", "X", "X");
		Vector3d laf = system.evaluatePoint("LAF", "X", "X");
		Vector3d lar = system.evaluatePoint("LAR", "X", "X");
		Vector3d ball = system.evaluatePoint(arm.ball, "W", "X");

		Geometry::Plane outboard = Geometry::threePointPlane(ball, fc, sc);
		Geometry::Plane inboard = Geometry::threePointPlane(ta, laf, lar);
		Geometry::Line pivot = Geometry::planeIntersection(inboard, outboard);

		frames.setFramePosition(arm.frame, Geometry::projectOntoLine(pivot, ball));

		// each angle depends on the frame state left by the previous one
		Vector3d rotation = Vector3d::Zero();
		frames.setFrameRotation(arm.frame, rotation);

		Vector3d front = system.evaluatePoint(arm.front, "X", arm.frame);
		rotation.z() = atan2(front.y(), front.x());
		frames.setFrameRotation(arm.frame, rotation);

		front = system.evaluatePoint(arm.front, "X", arm.frame);
		rotation.y() = -atan2(front.z(), front.x());
		frames.setFrameRotation(arm.frame, rotation);

		ball = system.evaluatePoint(arm.ball, "W", arm.frame);
		rotation.x() = atan2(ball.z(), ball.y());
		frames.setFrameRotation(arm.frame, rotation);

		frames.setPointPosition(arm.frame, arm.front, system.evaluatePoint(arm.front, "X", arm.frame));
		frames.setPointPosition(arm.frame, arm.rear, system.evaluatePoint(arm.rear, "X", arm.frame));
		frames.setPointPosition(arm.frame, arm.ball, system.evaluatePoint(arm.ball, "W", arm.frame));
	}
}

vector<FrameDescriptor> frameDescriptors()
{
	vector<FrameDescriptor> frames;

	// world-like reference at ground level below the CG
	frames.push_back(frame("I", "Intermediate", "", { false, false, false, false, false, false }, {
		{ "RC", poi("Roll Center", "kx") },
		{ "FC", poi("Front Instant Center", "k*") },
		{ "PC", poi("Pitch Center", "kx") },
		{ "SC", poi("Side Instant Center", "k*") },
	}));

	frames.push_back(frame("B", "Body", "I", { false, false, true, true, true, false }, {}));

	// origin at the contact patch
	frames.push_back(frame("T", "Tire", "I", { true, true, false, true, false, true }, {}));

	// origin at the wheel center
	frames.push_back(frame("W", "Wheel", "T", { false, false, false, false, true, false }, {
		{ "LB", poi("Lower Pickup", "ks") },
		{ "UB", poi("Upper Pickup", "ks") },
		{ "TB", poi("Tie Rod Pickup", "ks") },
	}));

	frames.push_back(frame("X", "Axle", "B", { false, false, false, false, false, false }, {
		{ "LAF", poi("Lower A-Arm Front Pickup", "ks") },
		{ "LAR", poi("Lower A-Arm Rear Pickup", "ks") },
		{ "UAF", poi("Upper A-Arm Front Pickup", "ks") },
		{ "UAR", poi("Upper A-Arm Rear Pickup", "ks") },
		{ "TA",  poi("Tie Rod Pickup", "ks") },
	}));

	// suspension members, revolute about their x axis
	frames.push_back(frame("LA", "Lower A-Arm", "X", { false, false, false, true, false, false }, {
		{ "LB",  poi("Apex", "ko") },
		{ "LAF", poi("Front Pickup", "ko") },
		{ "LAR", poi("Rear Pickup", "ko") },
	}));

	frames.push_back(frame("UA", "Upper A-Arm", "X", { false, false, false, true, false, false }, {
		{ "UB",  poi("Apex", "ko") },
		{ "UAF", poi("Front Pickup", "ko") },
		{ "UAR", poi("Rear Pickup", "ko") },
	}));

	frames.push_back(frame("TR", "Tie Rod", "X", { false, false, false, true, false, true }, {
		{ "TB", poi("Outer Pickup", "ko") },
	}));

	return frames;
}

LinkageSystem placeStaticFrames(LinkageSystem system)
{
	const Target& t = system.getTarget();
	FrameGraph& frames = system.getFrames();

	// body at CG height, pitched by the rake
	frames.setFramePosition("B", Vector3d(0, 0, t.cg.z()));
	frames.setFrameRotation("B", Vector3d(0, t.rake, 0));

	// contact patch, cambered and toed
	frames.setFramePosition("T", Vector3d(t.cg.x(), t.track / 2, 0));
	frames.setFrameRotation("T", Vector3d(-t.camber, 0, t.toe));

	// wheel center along the cambered tire axis, castered
	frames.setFramePosition("W", Vector3d(0, 0, t.loaded_radius / sin(M_PI / 2 - t.camber)));
	frames.setFrameRotation("W", Vector3d(0, -t.caster, 0));

	// axle centerline at ride height
	frames.setFramePosition("X", Vector3d(t.cg.x(), 0, t.ride_height - t.cg.z()));

	return system;
}

LinkageSystem placeSampledPoints(LinkageSystem system)
{
	FrameGraph& frames = system.getFrames();
	map<PointId, Vector3d> positions = system.getDesignSpace().resolvePositions();

	for (const PointSpec& spec : pointSpecs()) {
		// a system that was solved before has dropped its axle frame copies
		if (!frames.getFrame(spec.frame).findPoint(spec.key))
			frames.addPoint(spec.frame, spec.key, poi(spec.title, "ks"));

		frames.setPointPosition(spec.frame, spec.key, positions.at(spec.id));
	}

	return system;
}

LinkageSystem placeInstantCenters(LinkageSystem system)
{
	const Target& t = system.getTarget();
	FrameGraph& frames = system.getFrames();

	double fvsa = Geometry::swingArmLength(t.camber_gain);
	double svsa = Geometry::swingArmLength(t.caster_gain);
	system.setSwingArmLengths(fvsa, svsa);

	Vector3d tire = frames.getFrame("T").position;

	// front view
	double roll_height = t.cg.z() * t.roll_center / 100;
	frames.setPointPosition("I", "RC", Vector3d(tire.x(), 0, roll_height));

	Vector2d fc = Geometry::instantCenter(tire.y(), roll_height, fvsa, t.loaded_radius);
	frames.setPointPosition("I", "FC", Vector3d(tire.x(), fc(0), fc(1)));

	// side view
	double pitch_height = t.cg.z() * t.pitch_center / 100;
	frames.setPointPosition("I", "PC", Vector3d(0, tire.y(), pitch_height));

	Vector2d sc = Geometry::instantCenter(tire.x(), pitch_height, svsa, t.loaded_radius);
	frames.setPointPosition("I", "SC", Vector3d(sc(0), tire.y(), sc(1)));

	return system;
}

LinkageSystem placeOutboardPickups(LinkageSystem system)
{
	const Target& t = system.getTarget();

	if (t.axle == AxleType::REAR) {
		throw NotImplementedError("Upper ball joint placement from the mechanical scrub target "
			"(rear axle) is not implemented");
	}

	// Simplified KPI: UB only moves laterally in the wheel frame. A shift in the intermediate
	// frame would also move it longitudinally through static toe and camber.
	Vector3d lb = system.evaluatePoint("LB", "W", "W");
	Vector3d ub = system.evaluatePoint("UB", "W", "W");
	system.setPoint("UB", "W", Geometry::kingpinUpperBallJoint(lb, ub, t.kpi));

	return system;
}

LinkageSystem placeInboardPickups(LinkageSystem system)
{
	Vector3d fc = system.evaluatePoint("FC", "I", "X");
	Vector3d sc = system.evaluatePoint("SC", "I", "X");

	// tie rod
	Vector3d tb = system.evaluatePoint("TB", "W", "X");
	Vector3d ta = system.evaluatePoint("TA", "X", "X");

	Geometry::Plane tie_rod = Geometry::threePointPlane(tb, fc, sc);
	ta.z() = tie_rod.height(ta.x(), ta.y());
	system.setPoint("TA", "X", ta);

	// lower A-arm
	Vector3d lb = system.evaluatePoint("LB", "W", "X");
	Vector3d laf = system.evaluatePoint("LAF", "X", "X");
	Vector3d lar = system.evaluatePoint("LAR", "X", "X");

	Geometry::Plane lower = Geometry::threePointPlane(lb, fc, sc);
	laf.z() = lower.height(laf.x(), laf.y());
	lar.z() = lower.height(lar.x(), lar.y());
	system.setPoint("LAF", "X", laf);
	system.setPoint("LAR", "X", lar);

	return system;
}

LinkageSystem placeUpperInboardPickups(LinkageSystem system)
{
	Vector3d fc = system.evaluatePoint("FC", "I", "X");
	Vector3d sc = system.evaluatePoint("SC", "I", "X");
	Vector3d ub = system.evaluatePoint("UB", "W", "X");

	Vector3d ta = system.evaluatePoint("TA", "X", "X");
	Vector3d laf = system.evaluatePoint("LAF", "X", "X");
	Vector3d lar = system.evaluatePoint("LAR", "X", "X");
	Vector3d uaf = system.evaluatePoint("UAF", "X", "X");
	Vector3d uar = system.evaluatePoint("UAR", "X", "X");

	Geometry::Plane upper = Geometry::threePointPlane(ub, fc, sc);
	Geometry::Plane inboard = Geometry::threePointPlane(ta, laf, lar);
	Geometry::Line pivot = Geometry::planeIntersection(inboard, upper);

	// only the longitudinal coordinates of the sampled pickups survive
	system.setPoint("UAF", "X", pivot(uaf.x()));
	system.setPoint("UAR", "X", pivot(uar.x()));

	return system;
}

LinkageSystem placeArmFrames(LinkageSystem system)
{
	placeArmFrame(system, LOWER_ARM);
	placeArmFrame(system, UPPER_ARM);
	return system;
}

LinkageSystem placeTieRodFrame(LinkageSystem system)
{
	FrameGraph& frames = system.getFrames();

	frames.setFramePosition("TR", system.evaluatePoint("TA", "X", "X"));

	// yaw so the outer pickup has no x, then roll so it has no z
	Vector3d rotation = Vector3d::Zero();
	frames.setFrameRotation("TR", rotation);

	Vector3d tb = system.evaluatePoint("TB", "W", "TR");
	rotation.z() = -atan2(tb.x(), tb.y());
	frames.setFrameRotation("TR", rotation);

	tb = system.evaluatePoint("TB", "W", "TR");
	rotation.x() = atan2(tb.z(), tb.y());
	frames.setFrameRotation("TR", rotation);

	frames.setPointPosition("TR", "TB", system.evaluatePoint("TB", "W", "TR"));

	return system;
}

LinkageSystem removeRedundantPoints(LinkageSystem system)
{
	FrameGraph& frames = system.getFrames();
	for (const char* key : AXLE_PICKUPS)
		frames.removePoint("X", key);
	return system;
}

LinkageSystem solve(LinkageSystem system)
{
	typedef LinkageSystem(*Stage)(LinkageSystem);
	const pair<const char*, Stage> stages[] = {
		{ "static frames", placeStaticFrames },
		{ "sampled points", placeSampledPoints },
		{ "instant centers", placeInstantCenters },
		{ "outboard pickups", placeOutboardPickups },
		{ "inboard pickups", placeInboardPickups },
		{ "upper inboard pickups", placeUpperInboardPickups },
		{ "A-arm frames", placeArmFrames },
		{ "tie rod frame", placeTieRodFrame },
		{ "redundant points", removeRedundantPoints },
	};

	system.setSolved(false);
	for (const auto& stage : stages) {
		if (system.isVerbose())
			cout << "Double wishbone: " << stage.first << endl;
		system = stage.second(std::move(system));
	}
	system.setSolved(true);

	if (system.isVerbose()) {
		cout << "Front view swing arm: " << system.getFrontViewSwingArm() << " mm" << endl;
		cout << "Side view swing arm: " << system.getSideViewSwingArm() << " mm" << endl;
		system.printHardpoints(cout);
	}

	return system;
}

} // namespace DoubleWishbone
