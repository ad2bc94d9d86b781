/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides definitions for:
 *          - Global log mutex and verbose switch
 *
 *          - TimingCollector static members and methods
 */

#include "keyscan/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace keyscan {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;
std::atomic<bool> log_verbose{false};

void set_verbose(bool on) { log_verbose.store(on, std::memory_order_relaxed); }

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print(stderr, "\n");
  fmt::print(stderr, fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print(stderr, "{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print(stderr, "{:-<30} {:-<20}\n", "", "");

  for (const auto &e : entries) {
    double seconds = e.microseconds / 1000000.0;
    fmt::print(stderr, "{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds,
               seconds);
  }
  fmt::print(stderr, fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stderr);
}

} // namespace keyscan
