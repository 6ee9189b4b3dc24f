/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - LOG_DEBUG, additionally gated at runtime by CLIPFORGE_DEBUG
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - TimingCollector for per-job stage timings
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately to ensure visibility in Docker container logs.
 *
 */

#ifndef CLIPFORGE_LOGGING_HPP
#define CLIPFORGE_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace clipforge {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/// true when CLIPFORGE_DEBUG is set to a non-zero value (read once)
bool debug_enabled();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clipforge::log_mutex);                    \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clipforge::log_mutex);                    \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clipforge::log_mutex);                    \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (clipforge::debug_enabled()) {                                          \
      std::lock_guard<std::mutex> lock(clipforge::log_mutex);                  \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clipforge::log_mutex);                    \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(clipforge::log_mutex);                    \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 * @note Stores the phase name and duration in microseconds.
 */
struct TimingEntry {
  std::string name;  //< Function or phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Per-thread collector for timing measurements.
 * @note Each worker thread runs one job at a time, so entries are kept
 *       thread-local and never mix between concurrently running jobs.
 */
class TimingCollector {
public:
  /**
   * @brief Record a timing measurement for the calling thread.
   * @param name Function or phase name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief One-line summary ("download 1.20s, transcribe 30.02s").
   */
  static std::string summary();

  /**
   * @brief Print the calling thread's timings as a formatted table.
   */
  static void print_summary();

  /**
   * @brief Clear the calling thread's timings.
   * @note Called between jobs.
   */
  static void clear();

private:
  static std::vector<TimingEntry> &entries();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    clipforge::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace clipforge

#endif // CLIPFORGE_LOGGING_HPP
