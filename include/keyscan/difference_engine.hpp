/**
 * @file difference_engine.hpp
 * @brief Per-pair mean absolute difference over a frame sequence
 *
 * @details The DifferenceEngine turns an ordered frame sequence into one
 *          score per adjacent pair (frames[i], frames[i+1]).
 *
 * @attention WORK DECOMPOSITION:
 *
 * - The logical pixel range [0, width*height) of each pair is split into
 *   blocks of block_size pixels (the last block may be shorter)
 *
 * - Every (pair, block) is one unit of work on the WorkerPool and writes
 *   its SAD into a slot of its own
 *
 * - After the join each pair's slots are summed left to right and divided
 *   by the pixel count, so scores do not depend on pool size or completion
 *   order
 *
 * @note Pairs with different geometry score INCOMPARABLE_SCORE instead of
 *       failing the batch. Frames are only read.
 */

#ifndef KEYSCAN_DIFFERENCE_ENGINE_HPP
#define KEYSCAN_DIFFERENCE_ENGINE_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

#include "cpu_features.hpp"
#include "frame.hpp"
#include "types.hpp"
#include "worker_pool.hpp"

namespace keyscan {

struct EngineOptions {
  size_t block_size = DEFAULT_BLOCK_SIZE; //< Pixels per unit of work
  bool use_simd = true;                   //< false forces the scalar kernel
};

class DifferenceEngine {
public:
  /**
   * @param pool Execution context, borrowed for the engine's lifetime
   * @param options Block size and kernel selection
   * @throw Error (Configuration) if block_size is zero
   */
  DifferenceEngine(WorkerPool &pool, EngineOptions options = {});

  /**
   * @brief Scores of all adjacent pairs, in pair order.
   * @return Empty when fewer than two frames are given
   */
  std::vector<double> scores(const std::vector<FrameBuffer> &frames);

  /// Score of a single pair.
  double pair_score(const FrameBuffer &a, const FrameBuffer &b);

  /**
   * @brief Total SAD of one pair summed block by block.
   * @throw std::invalid_argument if the geometry differs
   */
  uint64_t pair_sad(const FrameBuffer &a, const FrameBuffer &b);

  const EngineOptions &options() const { return options_; }

  /// Kernel tier the engine dispatches to.
  SimdTier tier() const { return tier_; }

private:
  using FramePair = std::pair<const FrameBuffer *, const FrameBuffer *>;

  /// Per-pair SAD; nullopt for pairs whose geometry differs.
  std::vector<std::optional<uint64_t>>
  pair_totals(const std::vector<FramePair> &pairs);

  std::vector<double> to_scores(const std::vector<FramePair> &pairs);

  WorkerPool &pool_;
  EngineOptions options_;
  SimdTier tier_;
};

} // namespace keyscan

#endif // KEYSCAN_DIFFERENCE_ENGINE_HPP
