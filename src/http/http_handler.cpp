#include "http_handler.hpp"
#include "core/Log.hpp"
#include "debug/json_debug.hpp"
#include "io/GpxWriter.hpp"
#include "io/TimeFormat.hpp"
#include "io/TrackJson.hpp"
#include "models/RouteDocument.hpp"

#include <chrono>
#include <stdexcept>

using json = nlohmann::json;

static void send_error(httplib::Response &res, int status,
                       const std::string &msg) {
  res.status = status;
  json err = {{"ok", false}, {"error", msg}};
  res.set_content(err.dump(), "application/json");
}

// ===== routes =====

void HttpHandler::callPostHandler(const std::string &action,
                                  const httplib::Request &req,
                                  httplib::Response &res) {
  if (!limiter_.allow(req.remote_addr)) {
    send_error(res, 429, "Too many requests");
    return;
  }
  if (action == "generate") {
    handleGenerate(req, res);
  } else if (action == "generate-single") {
    handleGenerateSingle(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

void HttpHandler::callGetHandler(const std::string &action,
                                 const httplib::Request &req,
                                 httplib::Response &res) {
  if (action == "health") {
    handleHealth(req, res);
  } else {
    res.status = 404;
    res.set_content("Unknown action: " + action, "text/plain");
  }
}

// ===== shared =====

// Configured start time, or now. Throws std::runtime_error on a bad timestamp.
static TimePoint start_time_of(const SynthesisParams &params) {
  return params.start_time_iso.empty() ? std::chrono::system_clock::now()
                                       : parseIsoUtc(params.start_time_iso);
}

void HttpHandler::respondWithTrack(const std::vector<Waypoint> &waypoints,
                                   const SynthesisParams &params,
                                   const TimePoint &start,
                                   const httplib::Request &req,
                                   httplib::Response &res) {
  RandomStream rng = params.seed ? RandomStream(*params.seed) : RandomStream();

  TrackSynthesizer synth(params);
  SynthesisResult result = synth.synthesize(waypoints, rng, start);
  log_debug("Generated track with " + std::to_string(result.track.size()) +
            " points");

  const std::string format =
      req.has_param("format") ? req.get_param_value("format") : "json";
  if (format == "gpx") {
    GpxWriter::Options opts;
    opts.include_cadence = params.include_cadence;
    res.status = 200;
    res.set_content(GpxWriter(opts).toString(result.track),
                    "application/gpx+xml");
    return;
  }
  json out = track_to_json(result.track);
  out["ok"] = true;
  out["seed"] = result.seed;
  out["plannedSeconds"] = result.total_seconds;
  res.status = 200;
  res.set_content(out.dump(), "application/json");
}

// ===== POST: /generate =====
// body: {"waypoints":[...]} or GeoJSON, plus optional "params"

void HttpHandler::handleGenerate(const httplib::Request &req,
                                 httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_body(req.body, e).dump(), "application/json");
    return;
  }

  SynthesisParams params;
  TimePoint start;
  std::vector<Waypoint> waypoints;
  try {
    const json overrides = body.is_object()
                               ? body.value("params", json::object())
                               : json::object();
    params = SynthesisParams::from_json(overrides, defaults_);
    params.validate();
    start = start_time_of(params);
    waypoints = body.get<RouteDocument>().waypoints;
  } catch (const std::exception &e) {
    send_error(res, 400, e.what());
    return;
  }
  if (waypoints.size() < 2) {
    send_error(res, 400, "route needs at least 2 usable waypoints");
    return;
  }

  try {
    respondWithTrack(waypoints, params, start, req, res);
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, e.what());
  } catch (const std::exception &e) {
    log_error(std::string("generate: ") + e.what());
    send_error(res, 500, e.what());
  }
}

// ===== POST: /generate-single =====
// body: {"startCoords":{"lat","lon"}, "routeLength":m, "routeType":profile}

void HttpHandler::handleGenerateSingle(const httplib::Request &req,
                                       httplib::Response &res) {
  json body;
  try {
    body = json::parse(req.body);
  } catch (const json::parse_error &e) {
    res.status = 400;
    res.set_content(parse_error_body(req.body, e).dump(), "application/json");
    return;
  }

  SynthesisParams params;
  TimePoint start;
  OrsRouteClient::Config ors = ors_;
  double lat = 0.0, lon = 0.0, length_m = 0.0;
  try {
    const auto &start = body.at("startCoords");
    lat = start.at("lat").get<double>();
    lon = start.at("lon").get<double>();
    length_m = body.at("routeLength").get<double>();
    const std::string route_type = body.value("routeType", "");
    if (!route_type.empty())
      ors.profile = route_type;
    params = SynthesisParams::from_json(body.value("params", json::object()),
                                        defaults_);
    params.route_length_m = length_m;
    params.validate();
    start = start_time_of(params);
    // refuse oversized round trips before calling out to the directions API
    TrackSynthesizer(params).plannedDuration({});
  } catch (const std::exception &e) {
    send_error(res, 400, std::string("Invalid request: ") + e.what());
    return;
  }

  log_debug("Received request to generate a round trip of " +
            std::to_string(length_m) + " m");

  std::vector<Waypoint> waypoints;
  try {
    OrsRouteClient client(ors, lat, lon, length_m);
    waypoints = client.fetch();
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, e.what());
    return;
  } catch (const std::exception &e) {
    log_error(std::string("route fetch: ") + e.what());
    send_error(res, 502,
               std::string("An error occurred while fetching route data: ") +
                   e.what());
    return;
  }
  if (waypoints.size() < 2) {
    send_error(res, 502, "No track points found in the route.");
    return;
  }

  try {
    respondWithTrack(waypoints, params, start, req, res);
  } catch (const std::invalid_argument &e) {
    send_error(res, 400, e.what());
  } catch (const std::exception &e) {
    log_error(std::string("generate-single: ") + e.what());
    send_error(res, 500, e.what());
  }
}

// ===== GET: /health =====

void HttpHandler::handleHealth(const httplib::Request &,
                               httplib::Response &res) {
  json ok = {{"ok", true},
             {"message", "tracksynth alive"},
             {"avg_speed_mps", defaults_.avg_speed_mps},
             {"ors_profile", ors_.profile}};
  res.status = 200;
  res.set_content(ok.dump(), "application/json");
}
