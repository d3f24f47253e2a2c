#pragma once
#include "models/CoreTypes.hpp"
#include <vector>

// Supplies the ordered waypoints of a route. How they are produced (a file,
// a directions service, a map tool) is up to the implementation. Failures are
// reported by throwing; the engine never retries.
class RouteSource {
public:
  virtual ~RouteSource() = default;
  virtual std::vector<Waypoint> fetch() = 0;
};
