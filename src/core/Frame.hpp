#pragma once

#include <array>
#include <string>
#include <utility>
#include <vector>

#include "Eigen/Dense"

struct PointOfInterest
{
	// human readable name, e.g. "Lower A-Arm Front Pickup"
	std::string title;

	// position in the coordinates of the owning frame
	Eigen::Vector3d position;

	// plotting style, not used by the solver
	std::string style;
};

// ordered point table, insertion order is kept for reporting
using PoiTable = std::vector<std::pair<std::string, PointOfInterest>>;

// everything needed to create a frame, parent is referenced by name ("" for the root)
struct FrameDescriptor
{
	std::string name;
	std::string title;
	std::string parent;
	Eigen::Vector3d rotation;
	Eigen::Vector3d position;
	std::array<bool, 6> dof;
	PoiTable points;
};

struct Frame
{
	// short key used for lookups ("I", "LA", ...)
	std::string name;
	std::string title;

	// Frame rotation in Euler angles about x, y, z relative to the parent.
	// Applied in x, y, z order when mapping into the parent.
	Eigen::Vector3d rotation;

	// Origin of this frame in the parent's coordinate system.
	Eigen::Vector3d position;

	// which of the six spatial freedoms (3 translations, 3 rotations)
	// this frame has relative to its parent, documentary only
	std::array<bool, 6> dof;

	PoiTable points;

	// Index of parent frame (-1 for root).
	int parent;
	std::vector<int> children;

	PointOfInterest*		findPoint(const std::string& key);
	const PointOfInterest*	findPoint(const std::string& key) const;
	bool					removePoint(const std::string& key);
};
