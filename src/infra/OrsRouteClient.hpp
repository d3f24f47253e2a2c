#pragma once
#include "core/RouteSource.hpp"
#include <nlohmann/json.hpp>
#include <string>

// Round-trip route from the OpenRouteService directions API, requested as
// GeoJSON with elevation. Any transport or HTTP failure is fatal to the run.
class OrsRouteClient final : public RouteSource {
public:
  struct Config {
    std::string base_url = "https://api.openrouteservice.org";
    std::string api_key;
    std::string profile = "foot-walking"; // or cycling-road
    int round_trip_points = 5;
    int timeout_s = 30;

    static Config from_json(const nlohmann::json &j);
  };

  OrsRouteClient(Config cfg, double start_lat, double start_lon,
                 double length_m);

  std::vector<Waypoint> fetch() override;

  // Request body for the directions call
  nlohmann::json buildPayload() const;
  std::string path() const;

private:
  Config cfg_;
  double start_lat_;
  double start_lon_;
  double length_m_;
};
