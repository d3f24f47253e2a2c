#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

class ElevationProfile {
public:
  // Per-second elevation deltas: each leg's total climb spread evenly across
  // floor(distance / avg_speed) seconds, then zero-padded or truncated to
  // total_seconds. Legs shorter than one second of travel contribute nothing.
  static ElevationChanges perSecondChanges(const std::vector<Waypoint> &pts,
                                           double avg_speed,
                                           int total_seconds);
};
