#pragma once
#include "models/CoreTypes.hpp"
#include <ostream>
#include <string>
#include <utility>

// Serializes a Track as GPX 1.1 with Garmin TrackPointExtension v1 heart rate
// and cadence, the layout fitness-platform importers accept.
class GpxWriter {
public:
  struct Options {
    bool include_cadence = true;
    std::string creator = "Garmin Connect";
    std::string link_href = "connect.garmin.com";
    std::string link_text = "Garmin Connect";
  };

  GpxWriter() = default;
  explicit GpxWriter(Options o) : opts_(std::move(o)) {}

  void write(const Track &track, std::ostream &os) const;
  std::string toString(const Track &track) const;
  // Throws std::runtime_error if the file cannot be written.
  void writeFile(const Track &track, const std::string &path) const;

private:
  Options opts_;
};
