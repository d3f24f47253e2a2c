#pragma once
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <limits>
#include <stdexcept>
#include <string>
#include <vector>

// Optional diagnostics for a generated speed profile. Nothing in the synthesis
// path calls these; the CLI file mode does when "diagnostics" asks for it.

struct SeriesStats {
  std::size_t n = 0;
  double min = std::numeric_limits<double>::quiet_NaN();
  double max = std::numeric_limits<double>::quiet_NaN();
  double mean = std::numeric_limits<double>::quiet_NaN();
  std::size_t below = 0; // samples under the reference floor
};

inline SeriesStats series_stats(const std::vector<double> &y,
                                double floor_ref = -1.0) {
  SeriesStats st;
  st.n = y.size();
  double sum = 0.0;
  std::size_t nfinite = 0;
  double lo = std::numeric_limits<double>::infinity();
  double hi = -std::numeric_limits<double>::infinity();
  for (double v : y) {
    if (!std::isfinite(v))
      continue;
    lo = std::min(lo, v);
    hi = std::max(hi, v);
    sum += v;
    nfinite++;
    if (floor_ref >= 0.0 && v < floor_ref)
      st.below++;
  }
  if (nfinite) {
    st.min = lo;
    st.max = hi;
    st.mean = sum / nfinite;
  }
  return st;
}

inline void print_profile_stats(const std::string &name,
                                const std::vector<double> &y, double avg,
                                double floor_ref, std::ostream &os = std::cout) {
  const auto st = series_stats(y, floor_ref);
  os << "  [" << name << "] points=" << st.n << std::fixed
     << std::setprecision(3) << "  min=" << st.min << "  max=" << st.max
     << "  mean=" << st.mean << "  avg_ref=" << avg << "  floor=" << floor_ref
     << "  below_floor=" << st.below << "\n";
}

// t,speed,avg,floor rows for plotting elsewhere
inline void dump_profile_csv(const std::string &path,
                             const std::vector<double> &y, double avg,
                             double floor_ref) {
  std::ofstream out(path);
  if (!out)
    throw std::runtime_error("Cannot open " + path + " for writing");
  out << "t,speed_mps,avg_mps,floor_mps\n";
  out << std::setprecision(6);
  for (std::size_t t = 0; t < y.size(); ++t)
    out << t << "," << y[t] << "," << avg << "," << floor_ref << "\n";
}
