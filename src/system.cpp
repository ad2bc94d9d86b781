/**
 * @file system.cpp
 * @brief CPU limit detection and time formatting implementation
 */

#include "keyscan/system.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <string>
#include <thread>

#include <fmt/core.h>

namespace keyscan {

// **---- Internal Helpers ----**

namespace {

/// Helper to read a number from a file
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f ? val : -1;
}

/// Helper to count CPUs from a cpuset file
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  auto cpus = parse_cpuset_string(line);
  return cpus.empty() ? -1 : static_cast<int>(cpus.size());
}

/// CPUs from a cgroup quota, or -1 when unlimited or absent
int quota_limit() {
  /// Cgroup v2 (unified hierarchy): "<quota|max> <period>"
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    std::string quota_str, period_str;
    if (f >> quota_str >> period_str && quota_str != "max") {
      long quota = std::strtol(quota_str.c_str(), nullptr, 10);
      long period = std::strtol(period_str.c_str(), nullptr, 10);
      if (quota > 0 && period > 0)
        return static_cast<int>((quota + period - 1) / period);
    }
  }

  /// Cgroup v1
  long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
  long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
  if (quota > 0 && period > 0)
    return static_cast<int>((quota + period - 1) / period);

  return -1;
}

} // anonymous namespace

std::vector<int> parse_cpuset_string(const std::string &line) {
  std::vector<int> cpus;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t end = line.find(',', pos);
    if (end == std::string::npos)
      end = line.size();
    std::string item = line.substr(pos, end - pos);
    pos = end + 1;

    if (item.empty() || item.find_first_not_of("0123456789-\n ") !=
                            std::string::npos)
      return {};

    try {
      size_t dash = item.find('-');
      if (dash == std::string::npos) {
        /// Single CPU
        cpus.push_back(std::stoi(item));
      } else {
        /// Range like "0-3"
        int first = std::stoi(item.substr(0, dash));
        int last = std::stoi(item.substr(dash + 1));
        for (int cpu = first; cpu <= last; ++cpu)
          cpus.push_back(cpu);
      }
    } catch (const std::exception &) {
      return {};
    }
  }
  return cpus;
}

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = quota_limit();

  /// Cpuset counts the cores actually allowed
  int cpuset_count = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
  if (cpuset_count <= 0)
    cpuset_count = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");

  if (limit <= 0)
    limit = cpuset_count;
  else if (cpuset_count > 0)
    limit = std::min(limit, cpuset_count);

  /// Fallback to hardware_concurrency
  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  /// Sanity checks
  if (limit <= 0)
    limit = 4;
  if (limit > 256)
    limit = 256;

  return limit;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (!(seconds > 0))
    seconds = 0;
  long total_ms = std::lround(seconds * 1000.0);
  long h = total_ms / 3600000;
  long m = (total_ms / 60000) % 60;
  long s = (total_ms / 1000) % 60;
  long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

} // namespace keyscan
