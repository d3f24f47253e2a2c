// OrsRouteClient talks to OpenRouteService over HTTPS using cpp-httplib.

#include "OrsRouteClient.hpp"
#include "core/Log.hpp"
#include "models/RouteDocument.hpp"

#include "httplib.h"

#include <stdexcept>
#include <utility>

OrsRouteClient::Config OrsRouteClient::Config::from_json(const nlohmann::json &j) {
  Config c;
  if (!j.is_object())
    return c;
  c.base_url = j.value("base_url", c.base_url);
  c.api_key = j.value("api_key", c.api_key);
  c.profile = j.value("profile", c.profile);
  c.round_trip_points = j.value("round_trip_points", c.round_trip_points);
  c.timeout_s = j.value("timeout_s", c.timeout_s);
  return c;
}

OrsRouteClient::OrsRouteClient(Config cfg, double start_lat, double start_lon,
                               double length_m)
    : cfg_(std::move(cfg)), start_lat_(start_lat), start_lon_(start_lon),
      length_m_(length_m) {
  if (!GeoUtils::isValid(Waypoint{start_lat_, start_lon_, 0.0}))
    throw std::invalid_argument("start coordinates out of range");
  if (!(length_m_ > 0.0))
    throw std::invalid_argument("round-trip length must be positive");
}

nlohmann::json OrsRouteClient::buildPayload() const {
  // ORS wants [lon, lat]
  return nlohmann::json{
      {"coordinates", nlohmann::json::array({{start_lon_, start_lat_}})},
      {"options",
       {{"round_trip",
         {{"length", static_cast<long long>(length_m_)},
          {"points", cfg_.round_trip_points}}}}},
      {"elevation", true},
      {"instructions", false},
      {"geometry_simplify", false}};
}

std::string OrsRouteClient::path() const {
  return "/v2/directions/" + cfg_.profile + "/geojson";
}

std::vector<Waypoint> OrsRouteClient::fetch() {
  if (cfg_.api_key.empty())
    throw std::runtime_error("OpenRouteService API key is not configured");

  httplib::Client cli(cfg_.base_url);
  cli.set_connection_timeout(cfg_.timeout_s, 0);
  cli.set_read_timeout(cfg_.timeout_s, 0);

  httplib::Headers headers = {{"Authorization", cfg_.api_key},
                              {"Accept", "application/geo+json"}};
  auto res = cli.Post(path(), headers, buildPayload().dump(),
                      "application/json");
  if (!res)
    throw std::runtime_error("Error fetching route: " +
                             httplib::to_string(res.error()));
  if (res->status != 200) {
    log_warn("OrsRouteClient", "Error fetching route: " +
                                   std::to_string(res->status) + " " +
                                   res->body);
    throw std::runtime_error("Error fetching route: " +
                             std::to_string(res->status) + " - " + res->body);
  }
  log_debug("Route data fetched successfully.");

  nlohmann::json body;
  try {
    body = nlohmann::json::parse(res->body);
  } catch (const nlohmann::json::parse_error &e) {
    throw std::runtime_error(std::string("directions response: ") + e.what());
  }
  return body.get<RouteDocument>().waypoints;
}
