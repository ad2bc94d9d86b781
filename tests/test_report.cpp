#include <gtest/gtest.h>

#include <string>

#include <nlohmann/json.hpp>

#include "keyscan/report.hpp"
#include "keyscan/types.hpp"

using namespace keyscan;

TEST(RunReport, SerializesEveryField) {
  RunReport r;
  r.test_name = "bench";
  r.video_file = "clip.mp4";
  r.total_time_ms = 2000;
  r.total_frames = 120;
  r.keyframes_extracted = 6;
  r.threshold = 2.0;
  r.optimization_type = optimization_label(true, 8192);
  r.simd_enabled = true;
  r.simd_tier = "avx2";
  r.threads_used = 8;
  r.timestamp = "2026-01-02 03:04:05";
  finalize_report(r);

  nlohmann::json j = r;
  EXPECT_EQ(j["test_name"].get<std::string>(), "bench");
  EXPECT_EQ(j["video_file"].get<std::string>(), "clip.mp4");
  EXPECT_EQ(j["total_frames"].get<size_t>(), 120u);
  EXPECT_EQ(j["keyframes_extracted"].get<size_t>(), 6u);
  EXPECT_DOUBLE_EQ(j["keyframe_ratio"].get<double>(), 5.0);
  EXPECT_DOUBLE_EQ(j["processing_fps"].get<double>(), 60.0);
  EXPECT_EQ(j["optimization_type"].get<std::string>(),
            "SIMD+Parallel(block:8192)");
  EXPECT_TRUE(j["simd_enabled"].get<bool>());
  EXPECT_EQ(j["threads_used"].get<size_t>(), 8u);
  EXPECT_EQ(j["timestamp"].get<std::string>(), "2026-01-02 03:04:05");

  for (const char *key :
       {"total_time_ms", "frame_extraction_time_ms",
        "keyframe_analysis_time_ms", "threshold", "simd_tier",
        "keyframes_saved", "max_rss_mb"}) {
    EXPECT_TRUE(j.contains(key)) << key;
  }
}

TEST(RunReport, OptimizationLabel) {
  EXPECT_EQ(optimization_label(true, 4096), "SIMD+Parallel(block:4096)");
  EXPECT_EQ(optimization_label(false, 4096), "Standard Parallel");
}

TEST(RunReport, FinalizeWithNothingProcessed) {
  RunReport r;
  finalize_report(r);
  EXPECT_EQ(r.keyframe_ratio, 0.0);
  EXPECT_EQ(r.processing_fps, 0.0);
}

TEST(RunReport, TimestampFormat) {
  std::string ts = local_timestamp();
  ASSERT_EQ(ts.size(), 19u);
  EXPECT_EQ(ts[4], '-');
  EXPECT_EQ(ts[7], '-');
  EXPECT_EQ(ts[10], ' ');
  EXPECT_EQ(ts[13], ':');
  EXPECT_EQ(ts[16], ':');
}

TEST(RunReport, PeakRssIsPositive) { EXPECT_GT(peak_rss_mb(), 0.0); }

TEST(SystemInfo, Fields) {
  auto info = system_info_json(6);
  EXPECT_EQ(info["threads"].get<size_t>(), 6u);
  EXPECT_EQ(info["version"].get<std::string>(), KEYSCAN_VERSION);
  EXPECT_TRUE(info["avx2_supported"].is_boolean());
  EXPECT_TRUE(info["sse2_supported"].is_boolean());
  EXPECT_TRUE(info["simd_tier"].is_string());

  auto features = cpu_features_json();
  for (const char *key : {"avx2", "sse2", "sse4_1", "sse4_2", "fma"})
    EXPECT_TRUE(features[key].is_boolean()) << key;
}
