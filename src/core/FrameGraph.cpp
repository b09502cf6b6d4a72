#include "FrameGraph.hpp"
#include "Errors.hpp"
#include "Transform.hpp"

#include <algorithm>

using namespace std;
using namespace Eigen;

PointOfInterest* Frame::findPoint(const string& key)
{
	auto it = find_if(points.begin(), points.end(),
		[&](const pair<string, PointOfInterest>& p) { return p.first == key; });
	return it == points.end() ? nullptr : &it->second;
}

const PointOfInterest* Frame::findPoint(const string& key) const
{
	auto it = find_if(points.begin(), points.end(),
		[&](const pair<string, PointOfInterest>& p) { return p.first == key; });
	return it == points.end() ? nullptr : &it->second;
}

bool Frame::removePoint(const string& key)
{
	auto it = find_if(points.begin(), points.end(),
		[&](const pair<string, PointOfInterest>& p) { return p.first == key; });
	if (it == points.end())
		return false;
	points.erase(it);
	return true;
}

FrameGraph::FrameGraph(const vector<FrameDescriptor>& descriptors)
{
	if (descriptors.empty())
		throw GraphConstructionError("Frame graph needs at least one frame");

	for (const FrameDescriptor& d : descriptors) {
		if (d.name.empty())
			throw GraphConstructionError("Frame with title \"" + d.title + "\" has no name");
		if (frameNameMap_.count(d.name))
			throw GraphConstructionError("Duplicate frame name: " + d.name);

		Frame f;
		f.name = d.name;
		f.title = d.title;
		f.rotation = d.rotation;
		f.position = d.position;
		f.dof = d.dof;
		f.points = d.points;
		f.parent = -1;

		frameNameMap_[d.name] = (int)frames_.size();
		frames_.push_back(f);
	}

	// link every frame to its declared parent
	int root = -1;
	for (size_t i = 0; i < descriptors.size(); i++) {
		const FrameDescriptor& d = descriptors[i];
		if (d.parent.empty()) {
			if (root != -1)
				throw GraphConstructionError("Frames " + frames_[root].name + " and " + d.name + " are both roots");
			root = (int)i;
			continue;
		}

		auto it = frameNameMap_.find(d.parent);
		if (it == frameNameMap_.end())
			throw GraphConstructionError("Frame " + d.name + " declares unknown parent " + d.parent);
		if (it->second == (int)i)
			throw GraphConstructionError("Frame " + d.name + " is its own parent");

		frames_[i].parent = it->second;
		frames_[it->second].children.push_back((int)i);
	}

	if (root == -1)
		throw GraphConstructionError("Frame graph has no root frame");

	validateTopology();
	computePathTable();
}

void FrameGraph::validateTopology() const
{
	// with a single root, every parent chain must reach it within n steps or it loops
	const size_t n = frames_.size();
	for (size_t i = 0; i < n; i++) {
		int current = (int)i;
		size_t steps = 0;
		while (frames_[current].parent != -1) {
			current = frames_[current].parent;
			if (++steps > n)
				throw GraphConstructionError("Frame " + frames_[i].name + " is part of a cycle");
		}
	}
}

bool FrameGraph::isAncestor(unsigned ancestor, unsigned frame) const
{
	for (int i = frames_[frame].parent; i != -1; i = frames_[i].parent) {
		if (i == (int)ancestor)
			return true;
	}
	return false;
}

void FrameGraph::computePathTable()
{
	// In a tree the next hop is either one step up to the parent, or, when the
	// target lies below the source, the child of the source on the target's ancestor chain.
	const size_t n = frames_.size();
	path_table_.assign(n, vector<int>(n, ARRIVED));

	for (unsigned source = 0; source < n; source++) {
		for (unsigned target = 0; target < n; target++) {
			if (source == target)
				continue;

			if (isAncestor(source, target)) {
				int hop = (int)target;
				while (frames_[hop].parent != (int)source)
					hop = frames_[hop].parent;
				path_table_[source][target] = hop;
			}
			else {
				path_table_[source][target] = frames_[source].parent;
			}
		}
	}
}

int FrameGraph::getFrameIndex(const string& name) const
{
	auto it = frameNameMap_.find(name);
	if (it == frameNameMap_.end())
		throw FrameNotFoundError(name);
	return it->second;
}

bool FrameGraph::hasFrame(const string& name) const
{
	return frameNameMap_.count(name) != 0;
}

void FrameGraph::checkIndex(unsigned index) const
{
	if (index >= frames_.size())
		throw FrameNotFoundError("#" + to_string(index));
}

const string& FrameGraph::getFrameName(unsigned index) const
{
	checkIndex(index);
	return frames_[index].name;
}

int FrameGraph::getFrameParent(unsigned index) const
{
	checkIndex(index);
	return frames_[index].parent;
}

const Frame& FrameGraph::getFrame(unsigned index) const
{
	checkIndex(index);
	return frames_[index];
}

int FrameGraph::getNextHop(unsigned source, unsigned target) const
{
	checkIndex(source);
	checkIndex(target);
	return path_table_[source][target];
}

Frame& FrameGraph::getFrame(const string& name)
{
	return frames_[getFrameIndex(name)];
}

const Frame& FrameGraph::getFrame(const string& name) const
{
	return frames_[getFrameIndex(name)];
}

void FrameGraph::setFrameRotation(const string& name, const Vector3d& euler_angles)
{
	getFrame(name).rotation = euler_angles;
}

void FrameGraph::setFramePosition(const string& name, const Vector3d& position)
{
	getFrame(name).position = position;
}

vector<int> FrameGraph::getPath(unsigned source, unsigned target) const
{
	checkIndex(source);
	checkIndex(target);
	vector<int> path{ (int)source };
	for (int current = (int)source; current != (int)target; ) {
		current = path_table_[current][target];
		path.push_back(current);
	}
	return path;
}

Vector3d FrameGraph::evaluatePoint(const string& point, const string& source, const string& target) const
{
	const Frame& frame = getFrame(source);
	int target_index = getFrameIndex(target);

	const PointOfInterest* poi = frame.findPoint(point);
	if (!poi)
		throw PointNotFoundError(point, source);

	Matrix3Xd points = poi->position;
	return walkPath(points, getFrameIndex(source), target_index).col(0);
}

Vector3d FrameGraph::evaluatePoint(const Vector3d& point, const string& source, const string& target) const
{
	Matrix3Xd points = point;
	return evaluatePoints(points, source, target).col(0);
}

Matrix3Xd FrameGraph::evaluatePoints(const Matrix3Xd& points, const string& source, const string& target) const
{
	return walkPath(points, getFrameIndex(source), getFrameIndex(target));
}

Matrix3Xd FrameGraph::walkPath(Matrix3Xd points, unsigned source, unsigned target) const
{
	unsigned current = source;
	while (current != target) {
		int next = path_table_[current][target];

		if (next == frames_[current].parent) {
			// up towards the root, the current frame's transform maps it into its parent
			const Frame& f = frames_[current];
			points = Transforms::reverseTransform(points, f.rotation, f.position);
		}
		else {
			// down into a child, expressed with the child's own transform
			const Frame& f = frames_[next];
			points = Transforms::forwardTransform(points, f.rotation, f.position);
		}
		current = (unsigned)next;
	}
	return points;
}

const Vector3d& FrameGraph::getPointPosition(const string& frame, const string& point) const
{
	const PointOfInterest* poi = getFrame(frame).findPoint(point);
	if (!poi)
		throw PointNotFoundError(point, frame);
	return poi->position;
}

void FrameGraph::setPointPosition(const string& frame, const string& point, const Vector3d& position)
{
	PointOfInterest* poi = getFrame(frame).findPoint(point);
	if (!poi)
		throw PointNotFoundError(point, frame);
	poi->position = position;
}

void FrameGraph::addPoint(const string& frame, const string& point, const PointOfInterest& poi)
{
	Frame& f = getFrame(frame);
	if (PointOfInterest* existing = f.findPoint(point)) {
		*existing = poi;
		return;
	}
	f.points.push_back({ point, poi });
}

void FrameGraph::removePoint(const string& frame, const string& point)
{
	if (!getFrame(frame).removePoint(point))
		throw PointNotFoundError(point, frame);
}

Affine3d FrameGraph::getToParentTransform(unsigned index) const
{
	checkIndex(index);
	const Frame& f = frames_[index];

	// rotation order in this case: Z * Y * X
	Affine3d to_parent = Translation3d(f.position) *
		AngleAxisd(f.rotation.z(), Vector3d::UnitZ()) *
		AngleAxisd(f.rotation.y(), Vector3d::UnitY()) *
		AngleAxisd(f.rotation.x(), Vector3d::UnitX());
	return to_parent;
}

Affine3d FrameGraph::getToRootTransform(const string& name) const
{
	// current frame to root = parent frame to root * current frame to parent
	Affine3d to_root = Affine3d::Identity();
	for (int i = getFrameIndex(name); i != -1; i = frames_[i].parent) {
		to_root = getToParentTransform(i) * to_root;
	}
	return to_root;
}
