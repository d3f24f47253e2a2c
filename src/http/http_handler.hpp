#pragma once

#include "core/TrackSynthesizer.hpp"
#include "http/RateLimiter.hpp"
#include "httplib.h"
#include "infra/OrsRouteClient.hpp"
#include "models/params.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <utility>

// Thin wrapper around httplib callbacks. The main server forwards requests to
// these member functions based on the action string parsed from the URL.
class HttpHandler {
public:
  HttpHandler(SynthesisParams defaults, OrsRouteClient::Config ors,
              int rate_limit = 5)
      : defaults_(std::move(defaults)), ors_(std::move(ors)),
        limiter_(rate_limit) {}

  void callPostHandler(const std::string &action, const httplib::Request &req,
                       httplib::Response &res);
  void callGetHandler(const std::string &action, const httplib::Request &req,
                      httplib::Response &res);

private:
  SynthesisParams defaults_;
  OrsRouteClient::Config ors_;
  RateLimiter limiter_;

  // Individual request handlers
  void handleGenerate(const httplib::Request &req, httplib::Response &res);
  void handleGenerateSingle(const httplib::Request &req,
                            httplib::Response &res);
  void handleHealth(const httplib::Request &req, httplib::Response &res);

  // Runs the engine and writes JSON or GPX depending on ?format=
  void respondWithTrack(const std::vector<Waypoint> &waypoints,
                        const SynthesisParams &params, const TimePoint &start,
                        const httplib::Request &req, httplib::Response &res);
};
