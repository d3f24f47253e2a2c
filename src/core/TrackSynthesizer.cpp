// TrackSynthesizer wires the generators together for a single run.

#include "core/TrackSynthesizer.hpp"
#include "core/ElevationProfile.hpp"
#include "core/GeoUtils.hpp"
#include "core/Log.hpp"
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

static SpeedProfileGenerator::Params speed_params_from(const SynthesisParams &p) {
  SpeedProfileGenerator::Params sp;
  sp.fluctuation_sd = p.fluctuation_sd_mps;
  sp.poly_degree = p.poly_degree;
  sp.min_speed_ratio = p.min_speed_ratio;
  sp.start_speed_ratio = p.start_speed_ratio;
  return sp;
}

TrackSynthesizer::TrackSynthesizer(SynthesisParams p)
    : P(std::move(p)), speed_gen_(speed_params_from(P)),
      interpolator_(P.max_duration_s) {
  P.validate();
}

int TrackSynthesizer::plannedDuration(
    const std::vector<Waypoint> &waypoints) const {
  const double length_m = (P.route_length_m > 0.0)
                              ? P.route_length_m
                              : GeoUtils::routeLength(waypoints);
  // whole seconds at average speed, then stretched
  const double base = std::floor(length_m / P.avg_speed_mps);
  const double stretched = std::floor(base * P.duration_factor);
  if (!std::isfinite(stretched) || stretched < 0.0)
    throw std::invalid_argument("cannot derive a duration from route length " +
                                std::to_string(length_m));
  if (stretched > static_cast<double>(P.max_duration_s))
    throw std::invalid_argument(
        "planned duration of " + std::to_string(stretched) +
        " s exceeds max_duration_s (" + std::to_string(P.max_duration_s) + ")");
  return static_cast<int>(stretched);
}

SynthesisResult
TrackSynthesizer::synthesize(const std::vector<Waypoint> &waypoints,
                             RandomStream &rng, const TimePoint &start) const {
  return synthesize(waypoints, plannedDuration(waypoints), rng, start);
}

SynthesisResult
TrackSynthesizer::synthesize(const std::vector<Waypoint> &waypoints,
                             int total_seconds, RandomStream &rng,
                             const TimePoint &start) const {
  if (total_seconds < 0)
    throw std::invalid_argument("total_seconds must be >= 0");
  if (total_seconds > P.max_duration_s)
    throw std::invalid_argument("total_seconds exceeds max_duration_s (" +
                                std::to_string(P.max_duration_s) + ")");

  SynthesisResult result;
  result.total_seconds = total_seconds;
  result.seed = rng.seed();
  result.track.name = P.track_name;
  result.track.activity_type = P.activity_type;

  if (total_seconds == 0) {
    log_debug("Requested duration is 0 s; returning an empty track");
    return result;
  }
  if (waypoints.size() < 2)
    throw std::invalid_argument("route needs at least 2 waypoints, got " +
                                std::to_string(waypoints.size()));

  const double v_avg = P.avg_speed_mps;
  log_debug("Synthesizing " + std::to_string(total_seconds) + " s over " +
            std::to_string(waypoints.size()) + " waypoints (seed " +
            std::to_string(rng.seed()) + ")");

  result.speed_profile =
      speed_gen_.generate(total_seconds, v_avg, P.speed_decrease_mps, rng);

  result.elevation_changes =
      ElevationProfile::perSecondChanges(waypoints, v_avg, total_seconds);

  auto heart_rate =
      physio_.heartRate(total_seconds, P.avg_bpm, v_avg, result.speed_profile,
                        result.elevation_changes, rng);
  auto cadence =
      physio_.cadence(total_seconds, P.avg_cadence, v_avg,
                      result.speed_profile, result.elevation_changes, rng);

  const auto points =
      interpolator_.interpolate(waypoints, result.speed_profile, total_seconds);
  log_debug("Interpolated " + std::to_string(points.size()) +
            " points for a planned " + std::to_string(total_seconds) + " s");

  TrackAssembler::Meta meta;
  meta.name = P.track_name;
  meta.activity_type = P.activity_type;
  result.track = assembler_.assemble(
      points, std::move(heart_rate), std::move(cadence),
      TrackAssembler::paceProfile(result.speed_profile), start, meta);
  return result;
}
