#pragma once
#include "core/RandomStream.hpp"
#include "models/CoreTypes.hpp"
#include <vector>

// Builds the per-second planned speed series for a whole activity.
class SpeedProfileGenerator {
public:
  struct Params {
    double fluctuation_sd = 1.8; // m/s, raw noise before smoothing
    int poly_degree = 10;        // smoothing polynomial
    double min_speed_ratio = 0.90; // floor as fraction of average; 0 = off
    double start_speed_ratio = 0.2; // first raw sample, slow start
  };

  SpeedProfileGenerator() = default;
  explicit SpeedProfileGenerator(Params p) : P(p) {}

  // total_seconds samples; never below min_speed_ratio * avg_speed.
  SpeedProfile generate(int total_seconds, double avg_speed,
                        double speed_decrease, RandomStream &rng) const;

  // Least-squares polynomial through y over x = 0..n-1, evaluated back at the
  // same integer abscissae. Degree is capped at n-1.
  static std::vector<double> polyfitSmooth(const std::vector<double> &y,
                                           int degree);

  const Params &params() const noexcept { return P; }

private:
  Params P;
};
