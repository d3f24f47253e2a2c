#include "core/TrackAssembler.hpp"
#include <string>

std::vector<TimePoint> TrackAssembler::generateTimestamps(
    size_t n, const TimePoint &start, int interval_seconds) {
  std::vector<TimePoint> out;
  out.reserve(n);
  for (size_t i = 0; i < n; ++i)
    out.push_back(start + std::chrono::seconds(static_cast<long long>(i) *
                                               interval_seconds));
  return out;
}

std::vector<double> TrackAssembler::paceProfile(const SpeedProfile &speed) {
  std::vector<double> pace(speed.size());
  for (size_t i = 0; i < speed.size(); ++i) {
    // pace(min/km) = 1000 / (speed * 60)
    pace[i] = (speed[i] > 0.0) ? 1000.0 / (speed[i] * 60.0) : 999.0;
  }
  return pace;
}

Track TrackAssembler::assemble(const std::vector<InterpolatedPoint> &points,
                               std::vector<int> heart_rate,
                               std::vector<int> cadence,
                               std::vector<double> pace,
                               const TimePoint &start,
                               const Meta &meta) const {
  Track track;
  track.name = meta.name;
  track.activity_type = meta.activity_type;

  const size_t N = points.size();
  if (N == 0)
    return track;

  alignSeries(heart_rate, N);
  alignSeries(cadence, N);
  if (pace.empty())
    pace.assign(N, 0.0);
  alignSeries(pace, N);

  const auto timestamps = generateTimestamps(N, start);
  if (timestamps.size() != N || heart_rate.size() != N ||
      cadence.size() != N || pace.size() != N) {
    throw std::logic_error(
        "series length mismatch after alignment: points=" + std::to_string(N) +
        " timestamps=" + std::to_string(timestamps.size()) +
        " hr=" + std::to_string(heart_rate.size()) +
        " cadence=" + std::to_string(cadence.size()));
  }

  track.samples.reserve(N);
  for (size_t i = 0; i < N; ++i) {
    TrackSample s;
    s.point = points[i];
    s.timestamp = timestamps[i];
    s.physio = PhysiologySample{heart_rate[i], cadence[i]};
    s.pace_min_per_km = pace[i];
    track.samples.push_back(s);
  }
  return track;
}
