/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides definitions for:
 *          - Global log mutex and the runtime debug switch
 *
 *          - TimingCollector methods
 */

#include "clipforge/logging.hpp"

#include <cstdlib>

#include <fmt/color.h>
#include <fmt/core.h>

namespace clipforge {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

bool debug_enabled() {
  static const bool enabled = [] {
    const char *val = std::getenv("CLIPFORGE_DEBUG");
    return val && val[0] != '\0' && val[0] != '0';
  }();
  return enabled;
}

// **----- TIMING COLLECTOR -----**

std::vector<TimingEntry> &TimingCollector::entries() {
  thread_local std::vector<TimingEntry> local;
  return local;
}

void TimingCollector::record(const std::string &name, long us) {
  entries().push_back({name, us});
}

std::string TimingCollector::summary() {
  std::string out;
  for (const auto &e : entries()) {
    if (!out.empty())
      out += ", ";
    out += fmt::format("{} {:.2f}s", e.name, e.microseconds / 1000000.0);
  }
  return out;
}

void TimingCollector::print_summary() {
  const auto &list = entries();
  if (list.empty())
    return;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  for (const auto &e : list) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds, seconds);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() { entries().clear(); }

} // namespace clipforge
