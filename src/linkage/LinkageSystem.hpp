#pragma once
#include <iostream>
#include <string>
#include <vector>

#include "Eigen/Dense"

#include "core/FrameGraph.hpp"
#include "design/DesignSpace.hpp"
#include "design/Target.hpp"

// a point reported to consumers, expressed in the root frame
struct Hardpoint {
	std::string		key;
	std::string		title;
	std::string		frame;		// frame the point is stored in
	Eigen::Vector3d	position;	// in the Intermediate frame
};

// origin and axis marker points of a frame, what a plotter draws
struct FrameAxes {
	Eigen::Vector3d origin;
	Eigen::Vector3d x_axis;
	Eigen::Vector3d y_axis;
	Eigen::Vector3d z_axis;
};

// Frame graph of one suspension corner together with its targets and design space.
// The solver stages take and return this state by value.
class LinkageSystem {
public:
	LinkageSystem(std::string name, const Target& target, const BoundTable& bounds);

	const std::string&		getName() const { return name_; }
	const Target&			getTarget() const { return target_; }

	// sampling hook, samples may be changed before solving
	DesignSpace&			getDesignSpace() { return design_space_; }
	const DesignSpace&		getDesignSpace() const { return design_space_; }

	FrameGraph&				getFrames() { return frames_; }
	const FrameGraph&		getFrames() const { return frames_; }

	// point queries, see FrameGraph::evaluatePoint
	Eigen::Vector3d			evaluatePoint(const std::string& point, const std::string& source, const std::string& target) const;
	Eigen::Vector3d			evaluatePoint(const Eigen::Vector3d& point, const std::string& source, const std::string& target) const;

	// writes value, given in source coordinates, into the point's position in frame
	// design points are checked against their bounds, violations are reported but still written
	void					setPoint(const std::string& point, const std::string& frame, const Eigen::Vector3d& value);
	void					setPoint(const std::string& point, const std::string& frame, const Eigen::Vector3d& value, const std::string& source);

	const std::vector<BoundViolationWarning>& getWarnings() const { return warnings_; }
	void					clearWarnings() { warnings_.clear(); }

	// swing arm lengths in mm, set by the instant center stage
	double					getFrontViewSwingArm() const { return fvsa_; }
	double					getSideViewSwingArm() const { return svsa_; }
	void					setSwingArmLengths(double fvsa, double svsa) { fvsa_ = fvsa; svsa_ = svsa; }

	bool					isSolved() const { return solved_; }
	void					setSolved(bool solved) { solved_ = solved; }

	bool					isVerbose() const { return verbose_; }
	void					setVerbose(bool verbose) { verbose_ = verbose; }

	// reporting
	FrameAxes				getFrameAxes(const std::string& frame, const std::string& target = "I") const;
	Eigen::Affine3d			getToRootTransform(const std::string& frame) const { return frames_.getToRootTransform(frame); }
	std::vector<Hardpoint>	hardpoints() const;
	void					printHardpoints(std::ostream& out) const;

private:
	std::string				name_;
	Target					target_;
	DesignSpace				design_space_;
	FrameGraph				frames_;

	std::vector<BoundViolationWarning> warnings_;

	double					fvsa_ = 0;
	double					svsa_ = 0;
	bool					solved_ = false;
	bool					verbose_ = false;
};

// creates the unsolved frame graph for the target's linkage type
LinkageSystem buildLinkage(const std::string& name, const Target& target, const BoundTable& bounds);

// runs every solver stage of the system's linkage type and returns the populated system
LinkageSystem generateLinkage(LinkageSystem system);
