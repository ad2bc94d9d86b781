#include <gtest/gtest.h>

#include <filesystem>
#include <string>
#include <unistd.h>
#include <vector>

#include "keyscan/error.hpp"
#include "keyscan/keyframe_exporter.hpp"

using namespace keyscan;
namespace fs = std::filesystem;

TEST(KeyframeExporter, IndexToSeconds) {
  EXPECT_DOUBLE_EQ(index_to_seconds(0, 30.0), 0.0);
  EXPECT_DOUBLE_EQ(index_to_seconds(45, 30.0), 1.5);
  EXPECT_DOUBLE_EQ(index_to_seconds(25, 25.0), 1.0);
  EXPECT_THROW(index_to_seconds(1, 0.0), Error);
  EXPECT_THROW(index_to_seconds(1, -24.0), Error);
}

TEST(KeyframeExporter, StillNamesAreOneBasedAndPadded) {
  EXPECT_EQ(KeyframeExporter::still_name(0), "keyframe_001.jpg");
  EXPECT_EQ(KeyframeExporter::still_name(41), "keyframe_042.jpg");
  EXPECT_EQ(KeyframeExporter::still_name(999), "keyframe_1000.jpg");
}

TEST(KeyframeExporter, ShellQuote) {
  EXPECT_EQ(shell_quote("plain"), "'plain'");
  EXPECT_EQ(shell_quote("with space"), "'with space'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(shell_quote(""), "''");
}

TEST(KeyframeExporter, BuildCommandSeeksToFrameTime) {
  KeyframeExporter exporter("ffmpeg", 30.0);
  std::string cmd =
      exporter.build_command("in put.mp4", 90, "out/keyframe_001.jpg");
  EXPECT_EQ(cmd, "'ffmpeg' -hide_banner -loglevel error -ss 00:00:03.000 "
                 "-i 'in put.mp4' -frames:v 1 -q:v 2 -y "
                 "'out/keyframe_001.jpg'");
}

TEST(KeyframeExporter, BuildCommandCarriesInputArgs) {
  KeyframeExporter exporter("/opt/ffmpeg", 25.0,
                            "-f rawvideo -pix_fmt gray -video_size 4x2");
  std::string cmd = exporter.build_command("clip.gray", 5, "k.jpg");
  EXPECT_EQ(cmd, "'/opt/ffmpeg' -hide_banner -loglevel error "
                 "-f rawvideo -pix_fmt gray -video_size 4x2 "
                 "-ss 00:00:00.200 -i 'clip.gray' -frames:v 1 -q:v 2 -y "
                 "'k.jpg'");
}

TEST(KeyframeExporter, RejectsNonPositiveFrameRate) {
  EXPECT_THROW(KeyframeExporter("ffmpeg", 0.0), Error);
}

TEST(KeyframeExporter, NothingToExport) {
  KeyframeExporter exporter("ffmpeg", 30.0);
  fs::path dir = fs::temp_directory_path() /
                 ("keyscan_export_none_" + std::to_string(::getpid()));
  EXPECT_EQ(exporter.export_keyframes("x.mp4", {}, dir.string(), 50), 0u);
  EXPECT_EQ(exporter.export_keyframes("x.mp4", {1, 2}, dir.string(), 0), 0u);
  EXPECT_FALSE(fs::exists(dir));
}

TEST(KeyframeExporter, FailedInvocationsAreNotCounted) {
  /// `false` exits non-zero for any arguments
  KeyframeExporter exporter("false", 30.0);
  fs::path dir = fs::temp_directory_path() /
                 ("keyscan_export_fail_" + std::to_string(::getpid()));
  EXPECT_EQ(exporter.export_keyframes("x.mp4", {3, 9, 27}, dir.string(), 2),
            0u);
  EXPECT_TRUE(fs::is_directory(dir));
  fs::remove_all(dir);
}

TEST(KeyframeExporter, SuccessfulInvocationsAreCountedUpToLimit) {
  KeyframeExporter exporter("true", 30.0);
  fs::path dir = fs::temp_directory_path() /
                 ("keyscan_export_ok_" + std::to_string(::getpid()));
  EXPECT_EQ(exporter.export_keyframes("x.mp4", {3, 9, 27}, dir.string(), 2),
            2u);
  fs::remove_all(dir);
}
