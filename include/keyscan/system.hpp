/**
 * @file system.hpp
 * @brief CPU limit detection and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection, used as the default worker
 *            pool size
 *
 *          - Time formatting for log lines and exporter arguments
 */

#ifndef KEYSCAN_SYSTEM_HPP
#define KEYSCAN_SYSTEM_HPP

#include <string>
#include <vector>

namespace keyscan {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note In containers, std::thread::hardware_concurrency() returns the
 *       HOST's total cores, not the cgroup limit. This function reads:
 *
 *        - Cgroup v2: `/sys/fs/cgroup/cpu.max`
 *
 *        - Cgroup v1: `/sys/fs/cgroup/cpu/cpu.cfs_quota_us` and
 *          `cpu.cfs_period_us`
 *
 *        - Cpuset: `cpuset.cpus.effective` / `cpuset.cpus`
 *
 * @return Detected CPU limit, or hardware_concurrency() as fallback
 */
int detect_cpu_limit();

/**
 * @brief Parse a cpuset list such as "0-3,6,8-9".
 * @return CPU ids in list order; empty on malformed input
 */
std::vector<int> parse_cpuset_string(const std::string &line);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS.mmm.
 * @note Accepted by ffmpeg's -ss option.
 */
std::string format_time(double seconds);

} // namespace keyscan

#endif // KEYSCAN_SYSTEM_HPP
