/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          The CLI front end turns these into PipelineOptions; library
 *          callers pass options explicitly and never read the environment.
 *
 * @note A value that does not parse raises keyscan::Error with
 *       ErrorKind::Configuration naming the variable.
 */

#ifndef KEYSCAN_CONFIG_HPP
#define KEYSCAN_CONFIG_HPP

#include <cstddef>
#include <cstdlib>
#include <cstring>
#include <exception>
#include <string>

#include "error.hpp"
#include "types.hpp"

namespace keyscan {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 * @throw Error (Configuration) unless the whole value is a number
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  double parsed = 0;
  size_t pos = 0;
  try {
    parsed = std::stod(val, &pos);
  } catch (const std::exception &) {
    throw Error(ErrorKind::Configuration,
                std::string(name) + ": not a number: " + val);
  }
  if (pos != std::strlen(val)) {
    throw Error(ErrorKind::Configuration,
                std::string(name) + ": trailing characters: " + val);
  }
  return parsed;
}

/**
 * @brief Get a non-negative size value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed value or default
 * @throw Error (Configuration) unless the whole value is an integer >= 0
 */
inline size_t get_env_size(const char *name, size_t default_val) {
  const char *val = std::getenv(name);
  if (!val || !*val)
    return default_val;
  long long parsed = 0;
  size_t pos = 0;
  try {
    parsed = std::stoll(val, &pos);
  } catch (const std::exception &) {
    throw Error(ErrorKind::Configuration,
                std::string(name) + ": not an integer: " + val);
  }
  if (pos != std::strlen(val)) {
    throw Error(ErrorKind::Configuration,
                std::string(name) + ": trailing characters: " + val);
  }
  if (parsed < 0) {
    throw Error(ErrorKind::Configuration,
                std::string(name) + ": must not be negative: " + val);
  }
  return static_cast<size_t>(parsed);
}

/// Boolean flag: "0" is false, any other integer is true.
inline bool get_env_flag(const char *name, bool default_val) {
  return get_env_size(name, default_val ? 1 : 0) != 0;
}

inline std::string get_env_string(const char *name, const char *default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : std::string(default_val);
}

// **---- INPUT GEOMETRY ----**

/// Frame width for raw gray8 input (video input reports its own)
inline size_t frame_width() {
  static size_t val = get_env_size("FRAME_WIDTH", 0);
  return val;
}

/// Frame height for raw gray8 input
inline size_t frame_height() {
  static size_t val = get_env_size("FRAME_HEIGHT", 0);
  return val;
}

/**
 * @brief Frame rate used to map keyframe indices to timestamps.
 * @note 0 = take the rate reported by the video stream. Raw input has no
 *       container to read it from, so it must be set explicitly.
 */
inline double frame_rate() {
  static double val = get_env_double("FRAME_RATE", 0.0);
  return val;
}

// **---- DIFFERENCE ENGINE ----**

/// Logical pixels per block of parallel work
inline size_t block_size() {
  static size_t val = get_env_size("BLOCK_SIZE", DEFAULT_BLOCK_SIZE);
  return val;
}

/// Use the vectorized kernel when the CPU supports one
inline bool use_simd() {
  static bool val = get_env_flag("USE_SIMD", true);
  return val;
}

/**
 * @brief Worker pool size
 * @note 0 = auto-detect from the cgroup-aware CPU limit
 */
inline size_t threads() {
  static size_t val = get_env_size("THREADS", 0);
  return val;
}

/// Mean absolute difference a pair must strictly exceed to be a keyframe
inline double threshold() {
  static double val = get_env_double("THRESHOLD", DEFAULT_THRESHOLD);
  return val;
}

/// Maximum frames to ingest (0 = whole stream)
inline size_t max_frames() {
  static size_t val = get_env_size("MAX_FRAMES", 0);
  return val;
}

/**
 * @brief Frames held in memory per scoring window (at least 2)
 * @note Consecutive windows share one frame, so scores match a run over
 *       the whole sequence while peak memory stays at this many frames.
 */
inline size_t window_frames() {
  static size_t val = get_env_size("WINDOW_FRAMES", DEFAULT_WINDOW_FRAMES);
  return val;
}

// **---- EXPORT ----**

/// Maximum number of keyframe stills written (0 = export disabled)
inline size_t max_save() {
  static size_t val = get_env_size("MAX_SAVE", DEFAULT_MAX_SAVE);
  return val;
}

/// ffmpeg binary used by the keyframe exporter
inline const std::string &ffmpeg_path() {
  static std::string val = get_env_string("FFMPEG_PATH", "ffmpeg");
  return val;
}

/// Name recorded in the run report of a single run
inline const std::string &test_name() {
  static std::string val = get_env_string("TEST_NAME", "Single Processing");
  return val;
}

/// Enable LOG_DEBUG output
inline bool verbose() {
  static bool val = get_env_flag("VERBOSE", false);
  return val;
}

} // namespace Config
} // namespace keyscan

#endif // KEYSCAN_CONFIG_HPP
