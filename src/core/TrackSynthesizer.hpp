#pragma once
#include "core/PhysiologyGenerator.hpp"
#include "core/PointInterpolator.hpp"
#include "core/RandomStream.hpp"
#include "core/SpeedProfileGenerator.hpp"
#include "core/TrackAssembler.hpp"
#include "models/CoreTypes.hpp"
#include "models/params.hpp"
#include <vector>

// Everything one run produced. The speed profile is handed back so an
// optional diagnostics step can inspect it.
struct SynthesisResult {
  Track track;
  SpeedProfile speed_profile;
  ElevationChanges elevation_changes;
  int total_seconds = 0;
  uint64_t seed = 0;
};

// Runs the whole pipeline for one route:
// speed profile -> interpolation -> elevation/physiology -> assembly.
class TrackSynthesizer {
public:
  explicit TrackSynthesizer(SynthesisParams p);

  // Planned activity length in seconds for a route: the target length (or the
  // route's own length when none is configured) at average speed, stretched
  // by the duration factor.
  int plannedDuration(const std::vector<Waypoint> &waypoints) const;

  SynthesisResult synthesize(const std::vector<Waypoint> &waypoints,
                             RandomStream &rng, const TimePoint &start) const;

  // Same, with an explicit duration. total_seconds == 0 gives an empty track.
  SynthesisResult synthesize(const std::vector<Waypoint> &waypoints,
                             int total_seconds, RandomStream &rng,
                             const TimePoint &start) const;

  const SynthesisParams &params() const noexcept { return P; }

private:
  SynthesisParams P;
  SpeedProfileGenerator speed_gen_;
  PointInterpolator interpolator_;
  PhysiologyGenerator physio_;
  TrackAssembler assembler_;
};
