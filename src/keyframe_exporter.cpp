/**
 * @file keyframe_exporter.cpp
 * @brief Keyframe still export through the ffmpeg binary
 */

#include "keyscan/keyframe_exporter.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <system_error>
#include <utility>

#include <sys/wait.h>

#include <fmt/core.h>

#include "keyscan/error.hpp"
#include "keyscan/logging.hpp"
#include "keyscan/system.hpp"

namespace keyscan {

namespace fs = std::filesystem;

double index_to_seconds(size_t index, double fps) {
  if (!(fps > 0.0)) {
    throw Error(ErrorKind::Configuration,
                fmt::format("frame rate must be positive, got {}", fps));
  }
  return static_cast<double>(index) / fps;
}

std::string shell_quote(const std::string &arg) {
  std::string out;
  out.reserve(arg.size() + 2);
  out += '\'';
  for (char c : arg) {
    if (c == '\'')
      out += "'\\''";
    else
      out += c;
  }
  out += '\'';
  return out;
}

KeyframeExporter::KeyframeExporter(std::string ffmpeg_path, double fps,
                                   std::string input_args)
    : ffmpeg_path_(std::move(ffmpeg_path)), fps_(fps),
      input_args_(std::move(input_args)) {
  /// Validates fps
  index_to_seconds(0, fps_);
}

std::string KeyframeExporter::still_name(size_t position) {
  return fmt::format("keyframe_{:03d}.jpg", position + 1);
}

std::string KeyframeExporter::build_command(const std::string &video,
                                            size_t index,
                                            const std::string &output) const {
  /// -ss before -i seeks on the demuxer, which is much faster for late
  /// frames
  return fmt::format("{} -hide_banner -loglevel error {}-ss {} -i {} "
                     "-frames:v 1 -q:v 2 -y {}",
                     shell_quote(ffmpeg_path_),
                     input_args_.empty() ? "" : input_args_ + " ",
                     format_time(index_to_seconds(index, fps_)),
                     shell_quote(video), shell_quote(output));
}

size_t KeyframeExporter::export_keyframes(const std::string &video,
                                          const std::vector<size_t> &indices,
                                          const std::string &out_dir,
                                          size_t max_save) const {
  if (indices.empty() || max_save == 0) {
    LOG_WARN("No keyframes to save");
    return 0;
  }

  std::error_code ec;
  fs::create_directories(out_dir, ec);
  if (ec) {
    throw Error(ErrorKind::IO, fmt::format("cannot create {}: {}", out_dir,
                                           ec.message()));
  }

  TIMER_START(export_keyframes);

  const size_t count = std::min(indices.size(), max_save);
  LOG_PHASE("Saving {} keyframes to {}...", count, out_dir);

  size_t saved = 0;
  for (size_t i = 0; i < count; ++i) {
    std::string output = (fs::path(out_dir) / still_name(i)).string();
    std::string cmd = build_command(video, indices[i], output);
    LOG_DEBUG("{}", cmd);

    int status = std::system(cmd.c_str());
    if (status == -1) {
      LOG_ERROR("Failed to launch {}", cmd);
      continue;
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
      LOG_WARN("Failed to save keyframe {} (ffmpeg exit code {})", indices[i],
               WIFEXITED(status) ? WEXITSTATUS(status) : -1);
      continue;
    }

    ++saved;
    if (saved % 10 == 0 || saved == count) {
      LOG_INFO("Saved: {}/{} keyframes", saved, count);
    }
  }

  TIMER_END(export_keyframes);
  LOG_SUCCESS("Keyframe saving complete: {}/{}", saved, count);
  return saved;
}

} // namespace keyscan
