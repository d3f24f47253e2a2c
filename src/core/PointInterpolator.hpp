#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Densifies a waypoint route into one position per elapsed second, driven by
// the speed profile. Each leg is walked as a constant-bearing great-circle
// segment at the speed sampled when the leg starts. Leg durations are floored
// to whole seconds independently, so the elapsed counter drifts from exact
// fractional timing; that is accepted.
class PointInterpolator {
public:
  PointInterpolator() = default;
  // No single leg is walked for longer than max_leg_seconds.
  explicit PointInterpolator(int max_leg_seconds)
      : max_leg_seconds_(max_leg_seconds) {}

  // Stops once the elapsed counter reaches total_seconds. The leg in progress
  // is always emitted whole, so the result can be longer than total_seconds.
  std::vector<InterpolatedPoint>
  interpolate(const std::vector<Waypoint> &waypoints,
              const SpeedProfile &speed_profile, int total_seconds) const;

  // Points for a single leg starting at second `elapsed`.
  std::vector<InterpolatedPoint> interpolateLeg(const Waypoint &p1,
                                                const Waypoint &p2,
                                                double speed,
                                                int elapsed) const;

  // floor(distance / speed), at least one second and at most max_seconds
  static int legDuration(double distance_m, double speed,
                         int max_seconds = kDefaultMaxLegSeconds);

  static constexpr int kDefaultMaxLegSeconds = 24 * 60 * 60;

private:
  int max_leg_seconds_ = kDefaultMaxLegSeconds;
};
