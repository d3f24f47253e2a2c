#pragma once

#include "core/GeoUtils.hpp"
#include "core/Log.hpp"
#include "models/CoreTypes.hpp"
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

// Route inputs understood by the engine, parsed from JSON:
//   {"waypoints": [{"lat":..,"lon":..,"ele":..}, ...]}   (or a bare array)
//   GeoJSON LineString / Feature / FeatureCollection, [lon, lat, ele?]
// Entries with non-numeric or out-of-range fields are skipped with a
// diagnostic; an input with no usable waypoint left is an error.
struct RouteDocument {
  std::vector<Waypoint> waypoints;
  size_t skipped = 0;
};

// numbers or numeric strings; nullopt otherwise
inline std::optional<double> parse_number(const Json &x) {
  if (x.is_number())
    return x.get<double>();
  if (x.is_string()) {
    const auto s = x.get<std::string>();
    try {
      size_t used = 0;
      double v = std::stod(s, &used);
      if (used == s.size())
        return v;
    } catch (const std::exception &) {
      // not numeric
    }
  }
  return std::nullopt;
}

// --- {"lat","lon","ele"} object ----
inline std::optional<Waypoint> waypoint_from_object(const Json &j) {
  if (!j.is_object() || !j.contains("lat") || !j.contains("lon"))
    return std::nullopt;
  auto lat = parse_number(j["lat"]);
  auto lon = parse_number(j["lon"]);
  std::optional<double> ele = 0.0;
  if (j.contains("ele"))
    ele = parse_number(j["ele"]);
  else if (j.contains("elv"))
    ele = parse_number(j["elv"]);
  else if (j.contains("elevation"))
    ele = parse_number(j["elevation"]);
  if (!lat || !lon || !ele)
    return std::nullopt;
  Waypoint w{*lat, *lon, *ele};
  if (!GeoUtils::isValid(w))
    return std::nullopt;
  return w;
}

// --- [lon, lat, ele?] GeoJSON position ----
inline std::optional<Waypoint> waypoint_from_position(const Json &j) {
  if (!j.is_array() || j.size() < 2)
    return std::nullopt;
  auto lon = parse_number(j[0]);
  auto lat = parse_number(j[1]);
  std::optional<double> ele = 0.0;
  if (j.size() >= 3)
    ele = parse_number(j[2]);
  if (!lat || !lon || !ele)
    return std::nullopt;
  Waypoint w{*lat, *lon, *ele};
  if (!GeoUtils::isValid(w))
    return std::nullopt;
  return w;
}

inline void append_positions(const Json &coords, RouteDocument &doc) {
  if (!coords.is_array())
    return;
  for (const auto &pt : coords) {
    if (auto w = waypoint_from_position(pt)) {
      doc.waypoints.push_back(*w);
    } else {
      ++doc.skipped;
      log_warn("RouteDocument",
               "Invalid coordinate " + pt.dump() + ". Skipping point.");
    }
  }
}

inline void append_geometry(const Json &geom, RouteDocument &doc) {
  if (!geom.is_object())
    return;
  const std::string type = geom.value("type", "");
  if (type == "LineString") {
    append_positions(geom.value("coordinates", Json::array()), doc);
  } else if (type == "MultiLineString") {
    for (const auto &line : geom.value("coordinates", Json::array()))
      append_positions(line, doc);
  }
}

inline void from_json(const Json &j, RouteDocument &doc) {
  doc = RouteDocument{};

  auto append_objects = [&doc](const Json &arr) {
    for (const auto &entry : arr) {
      if (auto w = waypoint_from_object(entry)) {
        doc.waypoints.push_back(*w);
      } else {
        ++doc.skipped;
        log_warn("RouteDocument", "Invalid coordinate or elevation value: " +
                                      entry.dump() + ". Skipping point.");
      }
    }
  };

  if (j.is_array()) {
    append_objects(j);
  } else if (j.contains("waypoints") && j["waypoints"].is_array()) {
    append_objects(j["waypoints"]);
  } else {
    const std::string type = j.value("type", "");
    if (type == "FeatureCollection") {
      for (const auto &feat : j.value("features", Json::array()))
        if (feat.is_object() && feat.contains("geometry"))
          append_geometry(feat["geometry"], doc);
    } else if (type == "Feature" && j.contains("geometry")) {
      append_geometry(j["geometry"], doc);
    } else {
      append_geometry(j, doc);
    }
  }

  if (doc.waypoints.empty())
    throw std::runtime_error("No usable waypoints in route (" +
                             std::to_string(doc.skipped) + " skipped)");
}

inline void to_json(Json &j, const Waypoint &w) {
  j = Json{{"lat", w.lat}, {"lon", w.lon}, {"ele", w.ele}};
}
