/**
 * @file report.hpp
 * @brief Run report and system information as JSON
 *
 * @details RunReport collects what one pipeline run did and how long each
 *          phase took. to_json() follows the nlohmann::json ADL convention,
 *          so `nlohmann::json j = report;` works.
 */

#ifndef KEYSCAN_REPORT_HPP
#define KEYSCAN_REPORT_HPP

#include <cstddef>
#include <string>

#include <nlohmann/json.hpp>

namespace keyscan {

struct RunReport {
  std::string test_name;
  std::string video_file; //< File name only, no directory
  double total_time_ms = 0;
  double frame_extraction_time_ms = 0;
  double keyframe_analysis_time_ms = 0;
  size_t total_frames = 0;
  size_t keyframes_extracted = 0;
  double keyframe_ratio = 0;   //< Keyframes per 100 frames
  double processing_fps = 0;   //< Frames per second of total wall time
  double threshold = 0;
  std::string optimization_type;
  bool simd_enabled = false;
  std::string simd_tier;       //< Kernel actually dispatched
  size_t threads_used = 0;
  size_t keyframes_saved = 0;
  double max_rss_mb = 0;       //< Peak resident set size of the process
  std::string timestamp;       //< Local time, YYYY-MM-DD HH:MM:SS
};

void to_json(nlohmann::json &j, const RunReport &r);

/// "SIMD+Parallel(block:N)" or "Standard Parallel".
std::string optimization_label(bool use_simd, size_t block_size);

/// Fill the derived fields (ratio, fps) from counts and total time.
void finalize_report(RunReport &r);

/// Current local time as YYYY-MM-DD HH:MM:SS.
std::string local_timestamp();

/// Current local time as YYYYmmdd_HHMMSS, for file names.
std::string file_timestamp();

/**
 * @brief Write j, pretty-printed, to <dir>/<stem>_<file_timestamp()>.json.
 * @note Creates dir (and parents) when missing.
 * @return Path of the written file
 * @throw Error (IO) if the directory or the file cannot be written
 */
std::string write_json_file(const nlohmann::json &j, const std::string &dir,
                            const std::string &stem);

/// Peak resident set size of this process in MB.
double peak_rss_mb();

/// Per-feature SIMD support map.
nlohmann::json cpu_features_json();

/**
 * @brief Thread count, SIMD support and version.
 * @param threads Pool size the caller would use
 */
nlohmann::json system_info_json(size_t threads);

} // namespace keyscan

#endif // KEYSCAN_REPORT_HPP
