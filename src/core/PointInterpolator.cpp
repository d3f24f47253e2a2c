#include "core/PointInterpolator.hpp"
#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>

int PointInterpolator::legDuration(double distance_m, double speed,
                                   int max_seconds) {
  if (!(speed > 0.0) || !std::isfinite(distance_m))
    return 1;
  const double secs = std::floor(distance_m / speed);
  if (secs < 1.0)
    return 1;
  const int cap = std::max(1, max_seconds);
  if (!std::isfinite(secs) || secs > static_cast<double>(cap))
    return cap;
  return static_cast<int>(secs);
}

std::vector<InterpolatedPoint>
PointInterpolator::interpolateLeg(const Waypoint &p1, const Waypoint &p2,
                                  double speed, int elapsed) const {
  const double distance = GeoUtils::haversine(p1, p2);
  const double bearing = GeoUtils::bearing(p1, p2);
  const int num_seconds = legDuration(distance, speed, max_leg_seconds_);
  const double step = (speed > 0.0) ? speed : 0.0;
  const double ele_diff = p2.ele - p1.ele;

  std::vector<InterpolatedPoint> out;
  out.reserve(static_cast<size_t>(num_seconds));
  for (int i = 1; i <= num_seconds; ++i) {
    const double fraction = static_cast<double>(i) / num_seconds;
    const Waypoint at = GeoUtils::destination(p1, bearing, step * i);
    out.push_back(InterpolatedPoint{at.lat, at.lon, p1.ele + ele_diff * fraction,
                                    elapsed + i - 1});
  }
  return out;
}

std::vector<InterpolatedPoint>
PointInterpolator::interpolate(const std::vector<Waypoint> &waypoints,
                               const SpeedProfile &speed_profile,
                               int total_seconds) const {
  std::vector<InterpolatedPoint> out;
  if (total_seconds <= 0 || waypoints.size() < 2 || speed_profile.empty())
    return out;

  int current_time = 0;
  for (size_t i = 0; i + 1 < waypoints.size(); ++i) {
    const size_t idx =
        std::min(static_cast<size_t>(current_time), speed_profile.size() - 1);
    const double speed = speed_profile[idx];

    auto leg = interpolateLeg(waypoints[i], waypoints[i + 1], speed,
                              current_time);
    current_time += static_cast<int>(leg.size());
    out.insert(out.end(), leg.begin(), leg.end());

    if (current_time >= total_seconds)
      break;
  }
  return out;
}
