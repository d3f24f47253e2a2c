#pragma once
#include <iostream>
#include <string>

// Bracket-tagged console logging. Debug lines can be silenced from
// config ("logging": {"verbose": false}); errors and warnings always print.
inline bool &log_verbose() {
  static bool verbose = true;
  return verbose;
}

inline void log_debug(const std::string &msg) {
  if (log_verbose())
    std::cout << "[DEBUG] " << msg << std::endl;
}

inline void log_warn(const std::string &tag, const std::string &msg) {
  std::cerr << "[" << tag << "] " << msg << "\n";
}

inline void log_error(const std::string &msg) {
  std::cerr << "[ERROR] " << msg << "\n";
}
