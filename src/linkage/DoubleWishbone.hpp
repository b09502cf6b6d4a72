#pragma once
#include <vector>

#include "LinkageSystem.hpp"
#include "core/Frame.hpp"

// Static design of a double wishbone corner.
// The stages must run in the order listed since each one reads points placed by the ones before it.
namespace DoubleWishbone {

// frames and points of an unsolved double wishbone, root first
std::vector<FrameDescriptor> frameDescriptors();

// body, tire, wheel and axle frames from the vehicle targets
LinkageSystem placeStaticFrames(LinkageSystem system);

// axle and wheel frame pickups from the design space sample
LinkageSystem placeSampledPoints(LinkageSystem system);

// roll and pitch centers with their front and side view instant centers
LinkageSystem placeInstantCenters(LinkageSystem system);

// upper ball joint lateral position from the KPI target
// the rear axle (mechanical scrub target) is not implemented and throws NotImplementedError
LinkageSystem placeOutboardPickups(LinkageSystem system);

// tie rod and lower A-arm inboard heights from the planes through their ball joints and the instant centers
LinkageSystem placeInboardPickups(LinkageSystem system);

// upper A-arm inboard pickups on the intersection of the upper arm plane and the inboard pickup plane
LinkageSystem placeUpperInboardPickups(LinkageSystem system);

// lower and upper A-arm frames on their pivot axes
LinkageSystem placeArmFrames(LinkageSystem system);

// tie rod frame at the inboard tie rod pickup, pointing at the outer pickup
LinkageSystem placeTieRodFrame(LinkageSystem system);

// drops the axle frame copies of the pickups now stored in the member frames
LinkageSystem removeRedundantPoints(LinkageSystem system);

// every stage in order
LinkageSystem solve(LinkageSystem system);

} // namespace DoubleWishbone
