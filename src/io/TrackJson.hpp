#pragma once
#include "io/TimeFormat.hpp"
#include "models/CoreTypes.hpp"
#include <nlohmann/json.hpp>

// JSON view of a track for HTTP clients:
// {timestamps, bpmProfile, cadenceProfile, paceProfile, route}
inline nlohmann::json track_to_json(const Track &track) {
  using nlohmann::json;
  json timestamps = json::array();
  json bpm = json::array();
  json cad = json::array();
  json pace = json::array();
  json route = json::array();
  for (const auto &s : track.samples) {
    timestamps.push_back(formatIsoUtc(s.timestamp));
    bpm.push_back(s.physio.hr);
    cad.push_back(s.physio.cadence);
    pace.push_back(s.pace_min_per_km);
    route.push_back(
        {{"lat", s.point.lat}, {"lon", s.point.lon}, {"ele", s.point.ele}});
  }
  return json{{"name", track.name},
              {"type", track.activity_type},
              {"points", track.size()},
              {"timestamps", timestamps},
              {"bpmProfile", bpm},
              {"cadenceProfile", cad},
              {"paceProfile", pace},
              {"route", route}};
}
