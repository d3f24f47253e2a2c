#pragma once
#include "core/RandomStream.hpp"
#include "models/CoreTypes.hpp"
#include <vector>

// Synthetic heart-rate and cadence series correlated with the speed profile
// and the per-second elevation changes.
//
// hr[t]  = avg_bpm + warmup(t/T) + 10*(v[t]-v_avg) + 8*dh[t] + jitter
// cad[t] = avg_cad + 3*(v[t]-v_avg) + 2*dh[t] + jitter
//
// warmup is a logistic ramp from -20 to 0 centred at 20% of the run. Sample 0
// is a cold start (avg_bpm - 20) for hr and avg_cad + jitter for cadence.
class PhysiologyGenerator {
public:
  struct Params {
    double hr_speed_gain = 10.0;
    double hr_elevation_gain = 8.0;
    double hr_warmup_depth = 20.0;
    double warmup_center = 0.2;
    double warmup_steepness = 12.0;
    double cad_speed_gain = 3.0;
    double cad_elevation_gain = 2.0;
  };

  static constexpr int HR_MIN = 60;
  static constexpr int HR_MAX = 200;
  static constexpr int CADENCE_MIN = 30;
  static constexpr int CADENCE_MAX = 150;

  PhysiologyGenerator() = default;
  explicit PhysiologyGenerator(Params p) : P(p) {}

  std::vector<int> heartRate(int total_seconds, int avg_bpm, double avg_speed,
                             const SpeedProfile &speed,
                             const ElevationChanges &elevation,
                             RandomStream &rng) const;

  std::vector<int> cadence(int total_seconds, int avg_cadence,
                           double avg_speed, const SpeedProfile &speed,
                           const ElevationChanges &elevation,
                           RandomStream &rng) const;

  // base term of the heart-rate model, -depth .. 0
  double warmupOffset(double progress) const;

  const Params &params() const noexcept { return P; }

private:
  Params P;
};
