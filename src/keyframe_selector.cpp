/**
 * @file keyframe_selector.cpp
 * @brief Keyframe selection implementation
 */

#include "keyscan/keyframe_selector.hpp"

#include <cmath>

#include <fmt/core.h>

#include "keyscan/error.hpp"
#include "keyscan/logging.hpp"

namespace keyscan {

std::vector<size_t> select_keyframes(const std::vector<double> &scores,
                                     double threshold) {
  if (std::isnan(threshold) || threshold < 0.0) {
    throw Error(ErrorKind::Configuration,
                fmt::format("threshold must be non-negative, got {}",
                            threshold));
  }

  std::vector<size_t> keyframes;
  for (size_t i = 0; i < scores.size(); ++i) {
    if (scores[i] > threshold)
      keyframes.push_back(i + 1);
  }

  LOG_DEBUG("{} of {} pairs above threshold {}", keyframes.size(),
            scores.size(), threshold);
  return keyframes;
}

} // namespace keyscan
