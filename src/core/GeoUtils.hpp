#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Spherical-earth geodesy used by the interpolator and the elevation series.
// All angles in degrees, distances in metres.
class GeoUtils {
public:
  static constexpr double EARTH_RADIUS_M = 6371000.0;

  // haversine formulas
  static double haversine(double lat1, double lon1, double lat2, double lon2);
  static double haversine(const Waypoint &p1, const Waypoint &p2);

  // Initial compass bearing p1 -> p2 in [0, 360)
  static double bearing(const Waypoint &p1, const Waypoint &p2);

  // Point reached travelling distance_m along bearing_deg from origin.
  // Elevation is copied from origin.
  static Waypoint destination(const Waypoint &origin, double bearing_deg,
                              double distance_m);

  // Sum of leg distances
  static double routeLength(const std::vector<Waypoint> &pts);

  static bool isValid(const Waypoint &p);
};
