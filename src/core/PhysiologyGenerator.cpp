#include "core/PhysiologyGenerator.hpp"
#include <algorithm>
#include <cmath>

// out-of-range samples count as "no deviation"
static inline double sample_or_zero(const std::vector<double> &v, size_t t) {
  if (t >= v.size() || !std::isfinite(v[t]))
    return 0.0;
  return v[t];
}

static inline double speed_deviation(const SpeedProfile &speed, size_t t,
                                     double avg_speed) {
  if (t >= speed.size() || !std::isfinite(speed[t]))
    return 0.0;
  return speed[t] - avg_speed;
}

static inline int clamp_to_int(double v, int lo, int hi) {
  if (!std::isfinite(v))
    return lo;
  return static_cast<int>(std::clamp(v, static_cast<double>(lo),
                                     static_cast<double>(hi)));
}

double PhysiologyGenerator::warmupOffset(double progress) const {
  const double sigmoid =
      1.0 / (1.0 + std::exp(-P.warmup_steepness * (progress - P.warmup_center)));
  return -P.hr_warmup_depth + P.hr_warmup_depth * sigmoid;
}

std::vector<int> PhysiologyGenerator::heartRate(
    int total_seconds, int avg_bpm, double avg_speed,
    const SpeedProfile &speed, const ElevationChanges &elevation,
    RandomStream &rng) const {
  if (total_seconds <= 0)
    return {};
  const size_t T = static_cast<size_t>(total_seconds);
  std::vector<int> bpm(T);

  // cold start
  bpm[0] = clamp_to_int(avg_bpm - P.hr_warmup_depth, HR_MIN, HR_MAX);

  for (size_t t = 1; t < T; ++t) {
    const double progress = static_cast<double>(t) / T;
    const double base = warmupOffset(progress);
    const double from_speed =
        P.hr_speed_gain * speed_deviation(speed, t, avg_speed);
    const double from_climb = P.hr_elevation_gain * sample_or_zero(elevation, t);
    const double total = avg_bpm + base + from_speed + from_climb + rng.jitter();
    bpm[t] = clamp_to_int(total, HR_MIN, HR_MAX);
  }
  return bpm;
}

std::vector<int> PhysiologyGenerator::cadence(
    int total_seconds, int avg_cadence, double avg_speed,
    const SpeedProfile &speed, const ElevationChanges &elevation,
    RandomStream &rng) const {
  if (total_seconds <= 0)
    return {};
  const size_t T = static_cast<size_t>(total_seconds);
  std::vector<int> cad(T);

  cad[0] = clamp_to_int(avg_cadence + rng.jitter(), CADENCE_MIN, CADENCE_MAX);

  for (size_t t = 1; t < T; ++t) {
    const double from_speed =
        P.cad_speed_gain * speed_deviation(speed, t, avg_speed);
    const double from_climb =
        P.cad_elevation_gain * sample_or_zero(elevation, t);
    const double total = avg_cadence + from_speed + from_climb + rng.jitter();
    cad[t] = clamp_to_int(total, CADENCE_MIN, CADENCE_MAX);
  }
  return cad;
}
