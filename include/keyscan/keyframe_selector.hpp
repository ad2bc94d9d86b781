/**
 * @file keyframe_selector.hpp
 * @brief Threshold per-pair scores into keyframe indices
 */

#ifndef KEYSCAN_KEYFRAME_SELECTOR_HPP
#define KEYSCAN_KEYFRAME_SELECTOR_HPP

#include <cstddef>
#include <vector>

namespace keyscan {

/**
 * @brief Indices i+1 of every pair i whose score is strictly above threshold.
 * @param scores Per-pair scores, pair i = (frame i, frame i+1)
 * @param threshold Non-negative cut-off; a score equal to it is not selected
 * @return Strictly increasing frame indices
 * @throw Error (Configuration) if threshold is negative or NaN
 */
std::vector<size_t> select_keyframes(const std::vector<double> &scores,
                                     double threshold);

} // namespace keyscan

#endif // KEYSCAN_KEYFRAME_SELECTOR_HPP
