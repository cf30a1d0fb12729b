#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

namespace rdjson_bench {

using clock_type = std::chrono::steady_clock;

// Results are folded in here so the optimizer cannot drop a timed pass.
inline volatile std::size_t g_sink = 0;

inline void keep(std::size_t v) { g_sink = g_sink + v; }

struct timing {
  double best_seconds{0.0};
  double median_seconds{0.0};
  std::size_t bytes_per_round{0};

  double mib_per_sec() const {
    if (median_seconds <= 0.0) return 0.0;
    return static_cast<double>(bytes_per_round) / (1024.0 * 1024.0) / median_seconds;
  }
};

// Runs `pass` `passes` times per round and keeps per-round wall time.
// `pass` returns the number of bytes it consumed or produced.
template <class Pass>
timing measure(std::size_t rounds, std::size_t passes, Pass&& pass) {
  std::vector<double> secs;
  secs.reserve(rounds);
  std::size_t bytes = 0;
  for (std::size_t r = 0; r < rounds; ++r) {
    bytes = 0;
    const auto t0 = clock_type::now();
    for (std::size_t p = 0; p < passes; ++p) bytes += pass();
    const auto t1 = clock_type::now();
    secs.push_back(std::chrono::duration<double>(t1 - t0).count());
  }

  timing t;
  t.bytes_per_round = bytes;
  if (secs.empty()) return t;
  std::sort(secs.begin(), secs.end());
  t.best_seconds = secs.front();
  t.median_seconds = secs[secs.size() / 2];
  return t;
}

inline void print_header() {
  std::cout << std::left << std::setw(16) << "shape" << std::setw(18) << "operation" << std::right
            << std::setw(12) << "MiB/s" << std::setw(14) << "median s" << std::setw(14) << "best s" << "\n";
}

inline void print_row(const std::string& shape, const char* op, const timing& t) {
  std::cout << std::left << std::setw(16) << shape << std::setw(18) << op << std::right << std::fixed
            << std::setprecision(1) << std::setw(12) << t.mib_per_sec() << std::setprecision(5) << std::setw(14)
            << t.median_seconds << std::setw(14) << t.best_seconds << "\n";
  std::cout.unsetf(std::ios::floatfield);
}

inline void print_skipped(const std::string& shape, const char* op, const char* why) {
  std::cout << std::left << std::setw(16) << shape << std::setw(18) << op << std::right << std::setw(12) << "-"
            << "  (" << why << ")\n";
}

inline bool read_file(const std::string& path, std::string& out) {
  std::ifstream in(path, std::ios::binary);
  if (!in) return false;
  std::ostringstream ss;
  ss << in.rdbuf();
  out = ss.str();
  return true;
}

} // namespace rdjson_bench
