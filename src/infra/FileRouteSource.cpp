#include "FileRouteSource.hpp"
#include "core/Log.hpp"
#include "models/RouteDocument.hpp"
#include <fstream>
#include <stdexcept>

std::vector<Waypoint> FileRouteSource::fetch() {
  std::ifstream in(path_);
  if (!in)
    throw std::runtime_error("Cannot open route file " + path_);

  Json body;
  try {
    in >> body;
  } catch (const Json::parse_error &e) {
    throw std::runtime_error("Route file " + path_ +
                             " is not valid JSON: " + e.what());
  }
  RouteDocument doc = body.get<RouteDocument>();
  log_debug("Parsed " + std::to_string(doc.waypoints.size()) +
            " waypoints from " + path_ + " (" + std::to_string(doc.skipped) +
            " skipped)");
  return doc.waypoints;
}
