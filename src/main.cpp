// Entry point for tracksynth. With a route file argument it synthesizes one
// GPX track and exits; without one it starts the HTTP service and exposes the
// endpoints handled by `HttpHandler`.
//
//   tracksynth [--config config/settings.json] [route.json [out.gpx]]

#include "core/Log.hpp"
#include "core/TrackSynthesizer.hpp"
#include "debug/ProfileInspect.hpp"
#include "http/http_handler.hpp"
#include "infra/FileRouteSource.hpp"
#include "io/GpxWriter.hpp"
#include "io/TimeFormat.hpp"
#include <nlohmann/json.hpp>

#include <execinfo.h>
#include <fstream>
#include <iostream>
#include <signal.h>
#include <string>
#include <unistd.h>
#include <vector>

using json = nlohmann::json;

static void bt_handler(int sig) {
  void *bt[64];
  int n = backtrace(bt, 64);
  dprintf(2, "\n=== FATAL SIG %d ===\n", sig);
  backtrace_symbols_fd(bt, n, 2);
  _exit(128 + sig);
}
static void install_bt_handlers() {
  signal(SIGSEGV, bt_handler);
  signal(SIGABRT, bt_handler);
  signal(SIGFPE, bt_handler);
  signal(SIGILL, bt_handler);
  signal(SIGBUS, bt_handler);
}

static int run_file_mode(const json &settings, const std::string &route_path,
                         const std::string &out_override) {
  SynthesisParams params =
      SynthesisParams::from_json(settings.value("synthesis", json::object()));
  if (!out_override.empty())
    params.output_file = out_override;

  FileRouteSource source(route_path);
  const auto waypoints = source.fetch();
  if (waypoints.size() < 2) {
    std::cerr << "[ERROR] Route " << route_path
              << " has fewer than 2 usable waypoints\n";
    return 1;
  }

  RandomStream rng = params.seed ? RandomStream(*params.seed) : RandomStream();
  const TimePoint start = params.start_time_iso.empty()
                              ? std::chrono::system_clock::now()
                              : parseIsoUtc(params.start_time_iso);

  TrackSynthesizer synth(params);
  SynthesisResult result = synth.synthesize(waypoints, rng, start);

  // ---------------------- Optional diagnostics ----------------------------
  const auto diag = settings.value("diagnostics", json::object());
  const double floor_ref = params.min_speed_ratio * params.avg_speed_mps;
  if (diag.value("print_speed_stats", false)) {
    print_profile_stats("speed", result.speed_profile, params.avg_speed_mps,
                        floor_ref);
  }
  const std::string csv = diag.value("speed_profile_csv", "");
  if (!csv.empty()) {
    dump_profile_csv(csv, result.speed_profile, params.avg_speed_mps,
                     floor_ref);
    log_debug("Speed profile written to " + csv);
  }

  if (result.track.empty()) {
    std::cerr << "[ERROR] No track points were generated\n";
    return 1;
  }

  GpxWriter::Options opts;
  opts.include_cadence = params.include_cadence;
  GpxWriter(opts).writeFile(result.track, params.output_file);
  std::cout << "GPX file has been saved as " << params.output_file << " ("
            << result.track.size() << " points, seed " << result.seed << ")"
            << std::endl;
  return 0;
}

static int run_server(const json &settings) {
  const auto server_cfg = settings.value("server", json::object());
  int port = server_cfg.value("port", 8080);
  log_debug("Starting server on port " + std::to_string(port));

  SynthesisParams defaults =
      SynthesisParams::from_json(settings.value("synthesis", json::object()));
  defaults.validate();
  auto ors = OrsRouteClient::Config::from_json(
      settings.value("ors", json::object()));
  HttpHandler handler(defaults, ors, server_cfg.value("rate_limit", 5));

  // ---------------------- HTTP server setup -------------------------------
  httplib::Server server;
  server.set_payload_max_length(1024ull * 1024ull * 16ull); // 16MB
  server.set_read_timeout(60, 0);
  server.set_write_timeout(60, 0);
  server.set_default_headers({{"Access-Control-Allow-Origin", "*"}});

  // ---------------------- Register POST endpoints -------------------------
  for (const auto &ep : server_cfg.value(
           "post_endpoints", json::array({"/generate", "/generate-single"}))) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Post(path, [action, &handler](const auto &req, auto &res) {
      try {
        handler.callPostHandler(action, req, res);
      } catch (const std::exception &e) {
        std::cerr << "[POST] EXCEPTION: " << e.what() << "\n";
        res.status = 500;
        res.set_content(std::string("exception: ") + e.what(), "text/plain");
      }
    });
  }

  // ---------------------- Register GET endpoints --------------------------
  for (const auto &ep :
       server_cfg.value("get_endpoints", json::array({"/health"}))) {
    std::string path = ep.get<std::string>();
    std::string action =
        (!path.empty() && path[0] == '/') ? path.substr(1) : path;
    server.Get(path, [action, &handler](const auto &req, auto &res) {
      handler.callGetHandler(action, req, res);
    });
  }

  // ---------------------- Start server ------------------------------------
  if (!server.listen("0.0.0.0", port)) {
    std::cerr << "[ERROR] Cannot listen on port " << port << "\n";
    return 1;
  }
  return 0;
}

int main(int argc, char **argv) {
  install_bt_handlers();

  std::string config_path = "config/settings.json";
  std::vector<std::string> positional;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      std::cout << "usage: tracksynth [--config settings.json] "
                   "[route.json [out.gpx]]\n";
      return 0;
    } else {
      positional.push_back(arg);
    }
  }

  // ---------------------- Load configuration ------------------------------
  std::ifstream cfg(config_path);
  if (!cfg) {
    std::cerr << "[ERROR] Cannot open " << config_path << "\n";
    return 1;
  }
  json settings;
  try {
    cfg >> settings;
  } catch (const json::parse_error &e) {
    std::cerr << "[ERROR] " << config_path << ": " << e.what() << "\n";
    return 1;
  }
  log_verbose() =
      settings.value("logging", json::object()).value("verbose", true);

  try {
    if (!positional.empty()) {
      return run_file_mode(settings, positional[0],
                           positional.size() > 1 ? positional[1] : "");
    }
    return run_server(settings);
  } catch (const std::exception &e) {
    std::cerr << "[ERROR] " << e.what() << "\n";
    return 1;
  }
}
