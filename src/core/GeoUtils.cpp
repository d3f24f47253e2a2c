#include "core/GeoUtils.hpp"
#include <algorithm>
#include <cmath>

static inline double to_rad(double deg) { return deg * (M_PI / 180); }
static inline double to_deg(double rad) { return rad * (180 / M_PI); }

double GeoUtils::haversine(double lat1, double lon1, double lat2,
                           double lon2) {
  double phi1 = to_rad(lat1);
  double phi2 = to_rad(lat2);
  double delta_phi = to_rad(lat2 - lat1);
  double delta_gamma = to_rad(lon2 - lon1);
  double h = pow(sin(delta_phi / 2), 2) +
             cos(phi1) * cos(phi2) * pow(sin(delta_gamma / 2), 2);
  // guard rounding just above 1 for antipodal points
  h = std::min(1.0, h);
  return 2 * EARTH_RADIUS_M * asin(sqrt(h));
}

double GeoUtils::haversine(const Waypoint &p1, const Waypoint &p2) {
  return haversine(p1.lat, p1.lon, p2.lat, p2.lon);
}

double GeoUtils::bearing(const Waypoint &p1, const Waypoint &p2) {
  const double lat1 = to_rad(p1.lat);
  const double lat2 = to_rad(p2.lat);
  const double d_lon = to_rad(p2.lon - p1.lon);

  const double x = sin(d_lon) * cos(lat2);
  const double y = cos(lat1) * sin(lat2) - sin(lat1) * cos(lat2) * cos(d_lon);

  double b = std::fmod(to_deg(atan2(x, y)) + 360.0, 360.0);
  // fmod can return exactly 360 for tiny negative inputs
  if (b >= 360.0)
    b -= 360.0;
  return b;
}

Waypoint GeoUtils::destination(const Waypoint &origin, double bearing_deg,
                               double distance_m) {
  const double delta = distance_m / EARTH_RADIUS_M; // angular distance
  const double theta = to_rad(bearing_deg);
  const double lat1 = to_rad(origin.lat);
  const double lon1 = to_rad(origin.lon);

  const double lat2 =
      asin(sin(lat1) * cos(delta) + cos(lat1) * sin(delta) * cos(theta));
  const double lon2 =
      lon1 + atan2(sin(theta) * sin(delta) * cos(lat1),
                   cos(delta) - sin(lat1) * sin(lat2));

  // normalise longitude to [-180, 180)
  double lon_deg = std::fmod(to_deg(lon2) + 540.0, 360.0) - 180.0;
  return Waypoint{to_deg(lat2), lon_deg, origin.ele};
}

double GeoUtils::routeLength(const std::vector<Waypoint> &pts) {
  double acc_m = 0.0;
  for (size_t i = 1; i < pts.size(); ++i)
    acc_m += haversine(pts[i - 1], pts[i]);
  return acc_m;
}

bool GeoUtils::isValid(const Waypoint &p) {
  return std::isfinite(p.lat) && std::isfinite(p.lon) &&
         std::isfinite(p.ele) && p.lat >= -90.0 && p.lat <= 90.0 &&
         p.lon >= -180.0 && p.lon <= 180.0;
}
