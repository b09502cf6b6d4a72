#pragma once
#include "Eigen/Dense"

enum class LinkageType
{
	DOUBLE_WISHBONE,
	MULTILINK
};

enum class AxleType
{
	FRONT,
	REAR
};

// Vehicle level design intent, read-only input to the linkage solver.
// Lengths in mm, angles in rad, gains in rad/mm, center heights in % of CG height.
struct Target {
	LinkageType linkage = LinkageType::DOUBLE_WISHBONE;
	AxleType axle = AxleType::FRONT;

	// vehicle
	double wheelbase = 0;
	double weight_distribution = 50;	// front weight in %
	double sprung_mass = 0;				// kg
	Eigen::Vector3d cg = Eigen::Vector3d::Zero();	// x = CG to axle, z = CG height
	double ride_height = 0;
	double rake = 0;
	double loaded_radius = 0;

	// linkage
	double track = 0;
	double toe = 0;
	double pitch_center = 0;
	double caster = 0;
	double caster_gain = 0;
	double roll_center = 0;
	double camber = 0;
	double camber_gain = 0;
	double scrub = 0;
	double kpi = 0;

	// springs, carried along for the strut and spring design stages
	double ride_ratio = 0;
	double arb_ratio = 0;
};

// longitudinal distance from the CG to the given axle
inline double axleOffsetFromCg(double wheelbase, double front_weight_pct, AxleType axle)
{
	if (axle == AxleType::FRONT)
		return wheelbase * (1 - front_weight_pct / 100);
	return -wheelbase * front_weight_pct / 100;
}
