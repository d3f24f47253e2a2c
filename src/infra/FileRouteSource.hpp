#pragma once
#include "core/RouteSource.hpp"
#include <string>
#include <utility>

// Reads a route JSON document (see RouteDocument) from disk.
class FileRouteSource final : public RouteSource {
public:
  explicit FileRouteSource(std::string path) : path_(std::move(path)) {}
  std::vector<Waypoint> fetch() override;

private:
  std::string path_;
};
