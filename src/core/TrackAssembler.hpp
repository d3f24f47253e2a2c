#pragma once
#include "models/CoreTypes.hpp"
#include <stdexcept>
#include <string>
#include <vector>

// Aligns positions, timestamps and physiology into the final Track.
class TrackAssembler {
public:
  struct Meta {
    std::string name = "Generated Route";
    std::string activity_type = "foot_walking";
  };

  // Brings `series` to exactly n samples in place: truncates when longer,
  // repeats the last sample for the deficit when shorter. An empty series
  // cannot be padded (std::logic_error).
  template <typename T> static void alignSeries(std::vector<T> &series,
                                                size_t n) {
    if (series.size() > n) {
      series.resize(n);
    } else if (series.size() < n) {
      if (series.empty())
        throw std::logic_error("cannot pad an empty series to length " +
                               std::to_string(n));
      const T last = series.back();
      series.insert(series.end(), n - series.size(), last);
    }
  }

  static std::vector<TimePoint> generateTimestamps(size_t n,
                                                   const TimePoint &start,
                                                   int interval_seconds = 1);

  // min/km from m/s; 999 for non-positive speed
  static std::vector<double> paceProfile(const SpeedProfile &speed);

  // hr/cadence/pace are taken by value and aligned to points.size().
  Track assemble(const std::vector<InterpolatedPoint> &points,
                 std::vector<int> heart_rate, std::vector<int> cadence,
                 std::vector<double> pace, const TimePoint &start,
                 const Meta &meta) const;
};
