#pragma once
#include <string>

#include "DesignSpace.hpp"
#include "Target.hpp"

// contents of one design file, everything needed to build a linkage
struct DesignFile {
	std::string	name;
	Target		target;
	BoundTable	bounds;
};

// Reads a line based design file:
//   # comment
//   <key> <value> [unit]
//   bound <POINT> <xmin> <xmax> <ymin> <ymax> <zmin> <zmax> [unit]
// Values are converted to mm, rad and rad/mm. Throws ConfigError on the first bad line.
DesignFile loadDesignFile(const std::string& filename);
