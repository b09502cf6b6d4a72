#pragma once

#include <map>
#include <string>
#include <vector>

#include "Eigen/Dense"
#include "Frame.hpp"

// Tree of coordinate frames rooted at a single frame.
// Each frame owns a transform relative to its parent and a table of points.
// The topology is fixed at construction, transforms and points are mutable.
class FrameGraph
{
public:
	// next-hop value meaning the path has reached its target
	static constexpr int ARRIVED = -1;

	FrameGraph() = default;
	explicit FrameGraph(const std::vector<FrameDescriptor>& descriptors);

	int						getFrameIndex(const std::string& name) const;
	bool					hasFrame(const std::string& name) const;
	const std::string&		getFrameName(unsigned index) const;
	int						getFrameParent(unsigned index) const;
	size_t					getNumFrames() const { return frames_.size(); }

	Frame&					getFrame(const std::string& name);
	const Frame&			getFrame(const std::string& name) const;
	const Frame&			getFrame(unsigned index) const;

	void					setFrameRotation(const std::string& name, const Eigen::Vector3d& euler_angles);
	void					setFramePosition(const std::string& name, const Eigen::Vector3d& position);

	// next frame on the tree path from source towards target, ARRIVED when source == target
	int						getNextHop(unsigned source, unsigned target) const;
	std::vector<int>		getPath(unsigned source, unsigned target) const;

	// point given by key in the source frame, expressed in the target frame
	Eigen::Vector3d			evaluatePoint(const std::string& point, const std::string& source, const std::string& target) const;
	// literal coordinates given in the source frame, expressed in the target frame
	Eigen::Vector3d			evaluatePoint(const Eigen::Vector3d& point, const std::string& source, const std::string& target) const;
	Eigen::Matrix3Xd		evaluatePoints(const Eigen::Matrix3Xd& points, const std::string& source, const std::string& target) const;

	const Eigen::Vector3d&	getPointPosition(const std::string& frame, const std::string& point) const;
	// raw overwrite of a point's local position, no coordinate conversion
	void					setPointPosition(const std::string& frame, const std::string& point, const Eigen::Vector3d& position);
	void					addPoint(const std::string& frame, const std::string& point, const PointOfInterest& poi);
	void					removePoint(const std::string& frame, const std::string& point);

	// homogeneous transform from the frame's coordinates to the parent's / root's coordinates
	Eigen::Affine3d			getToParentTransform(unsigned index) const;
	Eigen::Affine3d			getToRootTransform(const std::string& name) const;

private:
	// throws FrameNotFoundError for an index past the last frame
	void					checkIndex(unsigned index) const;
	void					validateTopology() const;
	void					computePathTable();
	bool					isAncestor(unsigned ancestor, unsigned frame) const;
	Eigen::Matrix3Xd		walkPath(Eigen::Matrix3Xd points, unsigned source, unsigned target) const;

	std::vector<Frame>		frames_;
	std::map<std::string, int> frameNameMap_;

	// path_table_[source][target] = next hop
	std::vector<std::vector<int>> path_table_;
};
