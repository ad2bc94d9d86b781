/**
 * @file types.hpp
 * @brief Core constants and small shared types for keyscan
 *
 * @details Contains fundamental values used throughout the library:
 *          - Vector alignment and cache line constants
 *
 *          - Engine defaults (block size, threshold, export limits)
 *
 *          - The "incomparable" difference score sentinel
 *
 *          - PaddedAtomic for contended counters
 */

#ifndef KEYSCAN_TYPES_HPP
#define KEYSCAN_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <limits>

namespace keyscan {

// **----- CONSTANTS -----**

/**
 * @brief Alignment and padding unit of frame storage.
 * @note Matches the widest kernel chunk (AVX2, 32 bytes) so a frame can be
 *       streamed through vector loads without a partial tail.
 */
constexpr size_t VECTOR_ALIGNMENT = 32;

/// Most modern CPUs use 64-byte cache lines.
constexpr size_t CACHE_LINE_SIZE = 64;

/// Default number of logical pixels per block of parallel work.
constexpr size_t DEFAULT_BLOCK_SIZE = 8192;

/// Default keyframe threshold (mean absolute difference, 0..255 scale).
constexpr double DEFAULT_THRESHOLD = 2.0;

/// Default number of frames the pipeline scores per window.
constexpr size_t DEFAULT_WINDOW_FRAMES = 256;

/// Default number of stills written by the exporter.
constexpr size_t DEFAULT_MAX_SAVE = 50;

/// Frames ingested per benchmark run at most.
constexpr size_t BENCHMARK_MAX_FRAMES = 1000;

/**
 * @brief Score of a pair whose frames differ in width or height.
 * @note Larger than any real mean difference (at most 255), so the pair is
 *       selected by every threshold below DBL_MAX. A threshold of DBL_MAX
 *       itself selects nothing, since selection is strictly greater-than.
 */
constexpr double INCOMPARABLE_SCORE = std::numeric_limits<double>::max();

/// Version string reported by system info.
constexpr const char *KEYSCAN_VERSION = "0.1.0";

/// Round n up to the next multiple of VECTOR_ALIGNMENT.
constexpr size_t align_up(size_t n) {
  return (n + VECTOR_ALIGNMENT - 1) / VECTOR_ALIGNMENT * VECTOR_ALIGNMENT;
}

// **----- DATA STRUCTURES -----**

/**
 * @struct PaddedAtomic
 * @brief Cache-line aligned atomic to prevent false sharing.
 */
template <typename T> struct alignas(CACHE_LINE_SIZE) PaddedAtomic {
  std::atomic<T> value{0};

  PaddedAtomic() = default;
  explicit PaddedAtomic(T v) : value(v) {}

  T load(std::memory_order order = std::memory_order_seq_cst) const {
    return value.load(order);
  }
  void store(T v, std::memory_order order = std::memory_order_seq_cst) {
    value.store(v, order);
  }
  T fetch_add(T v, std::memory_order order = std::memory_order_seq_cst) {
    return value.fetch_add(v, order);
  }
};

} // namespace keyscan

#endif // KEYSCAN_TYPES_HPP
