#include "core/SpeedProfileGenerator.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <cmath>
#include <stdexcept>

std::vector<double>
SpeedProfileGenerator::polyfitSmooth(const std::vector<double> &y,
                                     int degree) {
  const int n = static_cast<int>(y.size());
  if (n == 0)
    return {};
  const int deg = std::clamp(degree, 0, n - 1);
  if (n == 1)
    return y;

  // Vandermonde on t scaled to [-1, 1]
  const double half = 0.5 * (n - 1);
  Eigen::MatrixXd V(n, deg + 1);
  Eigen::VectorXd b(n);
  for (int i = 0; i < n; ++i) {
    const double x = (i - half) / half;
    double xp = 1.0;
    for (int k = 0; k <= deg; ++k) {
      V(i, k) = xp;
      xp *= x;
    }
    b(i) = y[i];
  }
  Eigen::VectorXd coeffs = V.colPivHouseholderQr().solve(b);
  Eigen::VectorXd fitted = V * coeffs;

  std::vector<double> out(n);
  for (int i = 0; i < n; ++i)
    out[i] = fitted(i);
  return out;
}

SpeedProfile SpeedProfileGenerator::generate(int total_seconds,
                                             double avg_speed,
                                             double speed_decrease,
                                             RandomStream &rng) const {
  if (total_seconds < 0)
    throw std::invalid_argument("total_seconds must be >= 0");
  if (total_seconds == 0)
    return {};
  const size_t T = static_cast<size_t>(total_seconds);

  // 1) Noisy desired speeds around the average, slow first second
  std::vector<double> desired(T);
  for (size_t i = 0; i < T; ++i)
    desired[i] = avg_speed + rng.normal(0.0, P.fluctuation_sd);
  desired[0] = P.start_speed_ratio * avg_speed;

  // 2) Smooth with a polynomial fit
  SpeedProfile profile = polyfitSmooth(desired, P.poly_degree);

  // 3) Linear fatigue ramp 0 -> speed_decrease across the run
  for (size_t i = 0; i < T; ++i) {
    const double frac = (T > 1) ? static_cast<double>(i) / (T - 1) : 0.0;
    profile[i] -= speed_decrease * frac;
  }

  // 4) Floor
  const double min_speed = std::max(0.0, P.min_speed_ratio * avg_speed);
  for (auto &v : profile) {
    if (!std::isfinite(v) || v < min_speed)
      v = min_speed;
  }
  return profile;
}
