/**
 * @file report.cpp
 * @brief Report serialization and system information
 */

#include "keyscan/report.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>

#include <sys/resource.h>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "keyscan/cpu_features.hpp"
#include "keyscan/error.hpp"
#include "keyscan/types.hpp"

namespace keyscan {

void to_json(nlohmann::json &j, const RunReport &r) {
  j = nlohmann::json{
      {"test_name", r.test_name},
      {"video_file", r.video_file},
      {"total_time_ms", r.total_time_ms},
      {"frame_extraction_time_ms", r.frame_extraction_time_ms},
      {"keyframe_analysis_time_ms", r.keyframe_analysis_time_ms},
      {"total_frames", r.total_frames},
      {"keyframes_extracted", r.keyframes_extracted},
      {"keyframe_ratio", r.keyframe_ratio},
      {"processing_fps", r.processing_fps},
      {"threshold", r.threshold},
      {"optimization_type", r.optimization_type},
      {"simd_enabled", r.simd_enabled},
      {"simd_tier", r.simd_tier},
      {"threads_used", r.threads_used},
      {"keyframes_saved", r.keyframes_saved},
      {"max_rss_mb", r.max_rss_mb},
      {"timestamp", r.timestamp},
  };
}

std::string optimization_label(bool use_simd, size_t block_size) {
  return use_simd ? fmt::format("SIMD+Parallel(block:{})", block_size)
                  : std::string("Standard Parallel");
}

void finalize_report(RunReport &r) {
  r.keyframe_ratio =
      r.total_frames > 0
          ? static_cast<double>(r.keyframes_extracted) / r.total_frames * 100.0
          : 0.0;
  r.processing_fps = r.total_time_ms > 0
                         ? r.total_frames / (r.total_time_ms / 1000.0)
                         : 0.0;
}

std::string local_timestamp() {
  std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return fmt::format("{:%Y-%m-%d %H:%M:%S}", fmt::localtime(now));
}

std::string file_timestamp() {
  std::time_t now =
      std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
  return fmt::format("{:%Y%m%d_%H%M%S}", fmt::localtime(now));
}

std::string write_json_file(const nlohmann::json &j, const std::string &dir,
                            const std::string &stem) {
  namespace fs = std::filesystem;

  const std::string text = j.dump(2);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    throw Error(ErrorKind::IO, fmt::format("cannot create directory {}: {}",
                                           dir, ec.message()));
  }

  fs::path path = fs::path(dir) / fmt::format("{}_{}.json", stem,
                                              file_timestamp());
  std::ofstream out(path);
  if (!out)
    throw Error(ErrorKind::IO, fmt::format("cannot open {}", path.string()));
  out << text << '\n';
  out.close();
  if (!out)
    throw Error(ErrorKind::IO, fmt::format("cannot write {}", path.string()));
  return path.string();
}

double peak_rss_mb() {
  struct rusage ru {};
  if (getrusage(RUSAGE_SELF, &ru) != 0)
    return 0.0;
  /// Linux reports ru_maxrss in KB
  return ru.ru_maxrss / 1024.0;
}

nlohmann::json cpu_features_json() {
  const CpuFeatures &f = cpu_features();
  return nlohmann::json{
      {"avx2", f.avx2},     {"sse2", f.sse2}, {"sse4_1", f.sse4_1},
      {"sse4_2", f.sse4_2}, {"fma", f.fma},
  };
}

nlohmann::json system_info_json(size_t threads) {
  const CpuFeatures &f = cpu_features();
  return nlohmann::json{
      {"threads", threads},
      {"avx2_supported", f.avx2},
      {"sse2_supported", f.sse2},
      {"sse4_1_supported", f.sse4_1},
      {"sse4_2_supported", f.sse4_2},
      {"fma_supported", f.fma},
      {"simd_tier", simd_tier_name(best_simd_tier())},
      {"version", KEYSCAN_VERSION},
  };
}

} // namespace keyscan
