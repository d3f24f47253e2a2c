#include "core/ElevationProfile.hpp"
#include "core/GeoUtils.hpp"
#include <cmath>
#include <stdexcept>

ElevationChanges
ElevationProfile::perSecondChanges(const std::vector<Waypoint> &pts,
                                   double avg_speed, int total_seconds) {
  if (!(avg_speed > 0.0))
    throw std::invalid_argument("avg_speed must be positive");
  const size_t T = total_seconds > 0 ? static_cast<size_t>(total_seconds) : 0;

  ElevationChanges changes;
  changes.reserve(T);
  for (size_t i = 0; i + 1 < pts.size() && changes.size() < T; ++i) {
    const double ele_change = pts[i + 1].ele - pts[i].ele;
    const double distance = GeoUtils::haversine(pts[i], pts[i + 1]);
    const auto num_seconds =
        static_cast<size_t>(std::floor(distance / avg_speed));
    if (num_seconds == 0)
      continue;
    const double per_sec = ele_change / static_cast<double>(num_seconds);
    changes.insert(changes.end(), num_seconds, per_sec);
  }
  changes.resize(T, 0.0);
  return changes;
}
