#include "io/TimeFormat.hpp"
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string formatIsoUtc(const TimePoint &tp) {
  const std::time_t secs = std::chrono::system_clock::to_time_t(tp);
  std::tm utc{};
  if (!gmtime_r(&secs, &utc))
    throw std::runtime_error("gmtime_r failed");
  std::ostringstream os;
  os << std::put_time(&utc, "%Y-%m-%dT%H:%M:%S") << 'Z';
  return os.str();
}

TimePoint parseIsoUtc(const std::string &iso) {
  std::tm utc{};
  std::istringstream in(iso);
  in >> std::get_time(&utc, "%Y-%m-%dT%H:%M:%S");
  if (in.fail())
    throw std::runtime_error("bad ISO-8601 timestamp: '" + iso + "'");
  char c = 0;
  if (in >> c && c != 'Z')
    throw std::runtime_error("bad ISO-8601 timestamp: '" + iso + "'");
  const std::time_t secs = timegm(&utc);
  if (secs == static_cast<std::time_t>(-1))
    throw std::runtime_error("timestamp out of range: '" + iso + "'");
  return std::chrono::system_clock::from_time_t(secs);
}
