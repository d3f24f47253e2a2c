#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <stdexcept>
#include <string>

// User-supplied parameters controlling one synthesis run.
struct SynthesisParams {
  // Pace / speed. avg_speed_mps is authoritative; a pace key overrides it.
  double avg_speed_mps = 1000.0 / (4.0 * 60.0); // 4 min/km
  double route_length_m = 0.0; // 0 = use the route's own length
  double duration_factor = 1.3;
  int max_duration_s = 24 * 60 * 60; // longer plans are rejected

  int avg_bpm = 100;
  int avg_cadence = 80;

  // Speed profile shape
  double speed_decrease_mps = 0.2;
  double fluctuation_sd_mps = 1.8;
  double min_speed_ratio = 0.90; // 0 disables the floor
  double start_speed_ratio = 0.2;
  int poly_degree = 10;

  // Output
  std::string output_file = "route_strava.gpx";
  std::string start_time_iso; // empty = now
  std::string track_name = "Generated Route";
  std::string activity_type = "foot_walking";
  bool include_cadence = true;

  std::optional<uint64_t> seed;

  static double pace_to_speed(double min_per_km) {
    if (!(min_per_km > 0.0))
      throw std::invalid_argument("pace must be positive");
    return 1000.0 / (min_per_km * 60.0);
  }

  // Overlay present keys onto `base`.
  static SynthesisParams from_json(const nlohmann::json &j,
                                   SynthesisParams base);

  // Throws std::invalid_argument on values the engine cannot work with.
  void validate() const {
    if (!(avg_speed_mps > 0.0))
      throw std::invalid_argument("avg_speed_mps must be positive");
    if (route_length_m < 0.0)
      throw std::invalid_argument("route_length_m must be >= 0");
    if (!(duration_factor > 0.0))
      throw std::invalid_argument("duration_factor must be positive");
    if (max_duration_s <= 0)
      throw std::invalid_argument("max_duration_s must be positive");
    if (fluctuation_sd_mps < 0.0)
      throw std::invalid_argument("fluctuation_sd_mps must be >= 0");
    if (min_speed_ratio < 0.0)
      throw std::invalid_argument("min_speed_ratio must be >= 0");
    if (poly_degree < 0)
      throw std::invalid_argument("poly_degree must be >= 0");
  }
};

inline SynthesisParams SynthesisParams::from_json(const nlohmann::json &j,
                                                  SynthesisParams base = SynthesisParams{}) {
  SynthesisParams p = base;
  if (!j.is_object())
    return p;
  if (j.contains("avg_speed_mps"))
    p.avg_speed_mps = j.at("avg_speed_mps").get<double>();
  if (j.contains("avg_pace_min_per_km"))
    p.avg_speed_mps = pace_to_speed(j.at("avg_pace_min_per_km").get<double>());
  if (j.contains("route_length_m"))
    p.route_length_m = j.at("route_length_m").get<double>();
  if (j.contains("duration_factor"))
    p.duration_factor = j.at("duration_factor").get<double>();
  if (j.contains("max_duration_s"))
    p.max_duration_s = j.at("max_duration_s").get<int>();
  if (j.contains("avg_bpm"))
    p.avg_bpm = j.at("avg_bpm").get<int>();
  if (j.contains("avg_cadence"))
    p.avg_cadence = j.at("avg_cadence").get<int>();
  if (j.contains("speed_decrease_mps"))
    p.speed_decrease_mps = j.at("speed_decrease_mps").get<double>();
  if (j.contains("fluctuation_sd_mps"))
    p.fluctuation_sd_mps = j.at("fluctuation_sd_mps").get<double>();
  if (j.contains("min_speed_ratio"))
    p.min_speed_ratio = j.at("min_speed_ratio").get<double>();
  if (j.contains("start_speed_ratio"))
    p.start_speed_ratio = j.at("start_speed_ratio").get<double>();
  if (j.contains("poly_degree"))
    p.poly_degree = j.at("poly_degree").get<int>();
  if (j.contains("output_file"))
    p.output_file = j.at("output_file").get<std::string>();
  if (j.contains("start_time"))
    p.start_time_iso = j.at("start_time").get<std::string>();
  if (j.contains("track_name"))
    p.track_name = j.at("track_name").get<std::string>();
  if (j.contains("activity_type"))
    p.activity_type = j.at("activity_type").get<std::string>();
  if (j.contains("include_cadence"))
    p.include_cadence = j.at("include_cadence").get<bool>();
  if (j.contains("seed") && !j.at("seed").is_null())
    p.seed = j.at("seed").get<uint64_t>();
  return p;
}
