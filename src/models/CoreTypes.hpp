#pragma once

#include <chrono>
#include <cstddef>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

using Json = nlohmann::json;
using TimePoint = std::chrono::system_clock::time_point;

// Route-defining point with elevation. Degrees / metres.
struct Waypoint {
  double lat = 0.0;
  double lon = 0.0;
  double ele = 0.0;
};

// A waypoint produced by the interpolator, tagged with its second offset from
// the activity start.
struct InterpolatedPoint {
  double lat = 0.0;
  double lon = 0.0;
  double ele = 0.0;
  int t_index = 0;
};

// Heart rate [bpm] and cadence [rpm] for one second.
struct PhysiologySample {
  int hr = 0;
  int cadence = 0;
};

// One second of the final recording.
struct TrackSample {
  InterpolatedPoint point;
  TimePoint timestamp;
  PhysiologySample physio;
  double pace_min_per_km = 0.0;
};

// Assembled, second-resolution activity. Built once by TrackAssembler.
struct Track {
  std::string name = "Generated Route";
  std::string activity_type = "foot_walking";
  std::vector<TrackSample> samples;

  bool empty() const noexcept { return samples.empty(); }
  std::size_t size() const noexcept { return samples.size(); }
};

// Ordered per-second series shared between the generators.
using SpeedProfile = std::vector<double>;    // m/s
using ElevationChanges = std::vector<double>; // m per second
