/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime gated LOG_DEBUG for verbose runs
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector printed as a summary table
 *
 * @note All logs go to stderr through fmt::print so stdout stays free for
 *       the JSON report. Output is flushed after every line.
 */

#ifndef KEYSCAN_LOGGING_HPP
#define KEYSCAN_LOGGING_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace keyscan {

// **----- LOGGING CONFIGURATION -----**

#ifndef KEYSCAN_ENABLE_LOGGING
#define KEYSCAN_ENABLE_LOGGING 1
#endif

#ifndef KEYSCAN_ENABLE_TIMING
#define KEYSCAN_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/// Runtime switch for LOG_DEBUG (defined in logging.cpp)
extern std::atomic<bool> log_verbose;

/// Enable or disable LOG_DEBUG output.
void set_verbose(bool on);

// **----- LOGGING MACROS -----**

#if KEYSCAN_ENABLE_LOGGING
#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyscan::log_mutex);                      \
    fmt::print(stderr, "[INFO] " format_str "\n", ##__VA_ARGS__);              \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (keyscan::log_verbose.load(std::memory_order_relaxed)) {                \
      std::lock_guard<std::mutex> lock(keyscan::log_mutex);                    \
      fmt::print(stderr, fg(fmt::color::gray), "[DEBUG] " format_str "\n",     \
                 ##__VA_ARGS__);                                               \
      std::fflush(stderr);                                                     \
    }                                                                          \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyscan::log_mutex);                      \
    fmt::print(stderr, fg(fmt::color::yellow), "[WARN] " format_str "\n",      \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyscan::log_mutex);                      \
    fmt::print(stderr, fg(fmt::color::red), "[ERROR] " format_str "\n",        \
               ##__VA_ARGS__);                                                 \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyscan::log_mutex);                      \
    fmt::print(stderr, fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);  \
    std::fflush(stderr);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(keyscan::log_mutex);                      \
    fmt::print(stderr, fg(fmt::color::green), format_str "\n", ##__VA_ARGS__); \
    std::fflush(stderr);                                                       \
  } while (0)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_DEBUG(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief TimingEntry: A single timing measurement.
 */
struct TimingEntry {
  std::string name;  //< Phase name
  long microseconds; //< Duration in microseconds
};

/**
 * @class TimingCollector
 * @brief Thread-safe collector of phase timings.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /**
   * @brief Print all collected timings as a formatted table on stderr.
   */
  static void print_summary();
};

// **----- TIMING MACROS -----**

#if KEYSCAN_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    keyscan::TimingCollector::record(#name, timer_duration_##name);            \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace keyscan

#endif // KEYSCAN_LOGGING_HPP
