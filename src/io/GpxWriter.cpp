#include "io/GpxWriter.hpp"
#include "io/TimeFormat.hpp"
#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>

static std::string xml_escape(const std::string &s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    switch (c) {
    case '&':
      out += "&amp;";
      break;
    case '<':
      out += "&lt;";
      break;
    case '>':
      out += "&gt;";
      break;
    case '"':
      out += "&quot;";
      break;
    default:
      out += c;
    }
  }
  return out;
}

void GpxWriter::write(const Track &track, std::ostream &os) const {
  os << R"(<?xml version='1.0' encoding='UTF-8'?>)" << "\n";
  os << R"(<gpx xmlns="http://www.topografix.com/GPX/1/1")"
     << R"( xmlns:ns3="http://www.garmin.com/xmlschemas/TrackPointExtension/v1")"
     << R"( xmlns:ns2="http://www.garmin.com/xmlschemas/GpxExtensions/v3")"
     << R"( xmlns:xsi="http://www.w3.org/2001/XMLSchema-instance")"
     << R"( version="1.1" creator=")" << xml_escape(opts_.creator) << "\""
     << R"( xsi:schemaLocation="http://www.topografix.com/GPX/1/1 http://www.topografix.com/GPX/1/1/gpx.xsd)"
     << R"( http://www.garmin.com/xmlschemas/GpxExtensions/v3 http://www.garmin.com/xmlschemas/GpxExtensionsv3.xsd)"
     << R"( http://www.garmin.com/xmlschemas/TrackPointExtension/v1 http://www.garmin.com/xmlschemas/TrackPointExtensionv1.xsd">)"
     << "\n";

  // metadata time = first point's timestamp
  os << "  <metadata>\n";
  os << "    <link href=\"" << xml_escape(opts_.link_href) << "\">\n";
  os << "      <text>" << xml_escape(opts_.link_text) << "</text>\n";
  os << "    </link>\n";
  if (!track.empty())
    os << "    <time>" << formatIsoUtc(track.samples.front().timestamp)
       << "</time>\n";
  os << "  </metadata>\n";

  os << "  <trk>\n";
  os << "    <name>" << xml_escape(track.name) << "</name>\n";
  os << "    <type>" << xml_escape(track.activity_type) << "</type>\n";
  os << "    <trkseg>\n";

  std::ostringstream coord;
  std::ostringstream ele;
  coord.setf(std::ios::fixed);
  coord << std::setprecision(7);
  ele.setf(std::ios::fixed);
  ele << std::setprecision(1);
  for (const auto &s : track.samples) {
    coord.str("");
    coord << "lat=\"" << s.point.lat << "\" lon=\"" << s.point.lon << "\"";
    ele.str("");
    ele << s.point.ele;
    os << "      <trkpt " << coord.str() << ">\n";
    os << "        <ele>" << ele.str() << "</ele>\n";
    os << "        <time>" << formatIsoUtc(s.timestamp) << "</time>\n";
    os << "        <extensions>\n";
    os << "          <ns3:TrackPointExtension>\n";
    os << "            <ns3:hr>" << s.physio.hr << "</ns3:hr>\n";
    if (opts_.include_cadence)
      os << "            <ns3:cad>" << s.physio.cadence << "</ns3:cad>\n";
    os << "          </ns3:TrackPointExtension>\n";
    os << "        </extensions>\n";
    os << "      </trkpt>\n";
  }

  os << "    </trkseg>\n";
  os << "  </trk>\n";
  os << "</gpx>\n";
}

std::string GpxWriter::toString(const Track &track) const {
  std::ostringstream os;
  write(track, os);
  return os.str();
}

void GpxWriter::writeFile(const Track &track, const std::string &path) const {
  std::ofstream out(path);
  if (!out)
    throw std::runtime_error("Cannot open " + path + " for writing");
  write(track, out);
  out.close();
  if (!out)
    throw std::runtime_error("Failed to write " + path);
}
