/**
 * @file keyframe_exporter.hpp
 * @brief Writes one still image per keyframe using the ffmpeg binary
 *
 * @details The exporter only maps frame indices to time offsets and builds
 *          the ffmpeg command lines; image encoding happens in ffmpeg.
 *          Stills are named keyframe_001.jpg, keyframe_002.jpg, ... in
 *          keyframe order.
 *
 * @note The frame rate is an explicit input. Offsets are index / fps, so
 *       streams with variable frame timing map approximately.
 */

#ifndef KEYSCAN_KEYFRAME_EXPORTER_HPP
#define KEYSCAN_KEYFRAME_EXPORTER_HPP

#include <cstddef>
#include <string>
#include <vector>

namespace keyscan {

/**
 * @brief Time offset of a frame in seconds.
 * @throw Error (Configuration) if fps is not positive
 */
double index_to_seconds(size_t index, double fps);

/// Quote a string for /bin/sh (single quotes, embedded quotes escaped).
std::string shell_quote(const std::string &arg);

class KeyframeExporter {
public:
  /**
   * @param ffmpeg_path ffmpeg binary (looked up in PATH if not absolute)
   * @param fps Frame rate used for the index to time mapping
   * @param input_args ffmpeg options placed before -i (e.g. the rawvideo
   *        format of a headerless gray8 file); empty for container files
   * @throw Error (Configuration) if fps is not positive
   */
  KeyframeExporter(std::string ffmpeg_path, double fps,
                   std::string input_args = {});

  /// File name of the still at 0-based position in the keyframe list.
  static std::string still_name(size_t position);

  /// Shell command that writes frame `index` of `video` to `output`.
  std::string build_command(const std::string &video, size_t index,
                            const std::string &output) const;

  /**
   * @brief Export the first min(indices.size(), max_save) keyframes.
   * @return Number of stills written; failed stills are logged and skipped
   * @throw Error (IO) if out_dir cannot be created
   */
  size_t export_keyframes(const std::string &video,
                          const std::vector<size_t> &indices,
                          const std::string &out_dir, size_t max_save) const;

  double fps() const { return fps_; }

private:
  std::string ffmpeg_path_;
  double fps_;
  std::string input_args_;
};

} // namespace keyscan

#endif // KEYSCAN_KEYFRAME_EXPORTER_HPP
