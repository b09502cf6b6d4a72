#pragma once
#define _USE_MATH_DEFINES
#include <math.h>

// unit conversions, everything is stored in mm and rad
const double MM_PER_INCH = 25.4;
const double RAD_PER_DEG = M_PI / 180.0;

inline double inchToMm(double inches) { return inches * MM_PER_INCH; }
inline double degToRad(double degrees) { return degrees * RAD_PER_DEG; }
inline double radToDeg(double radians) { return radians / RAD_PER_DEG; }

inline double sign(double value) {
	return (value > 0) - (value < 0);
}

// names of the three axes of every frame
inline const char* axisName(int axis) {
	static const char* names[] = { "Longitudinal", "Lateral", "Vertical" };
	return names[axis];
}
