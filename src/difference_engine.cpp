/**
 * @file difference_engine.cpp
 * @brief DifferenceEngine implementation
 */

#include "keyscan/difference_engine.hpp"

#include <algorithm>
#include <stdexcept>

#include <fmt/core.h>

#include "keyscan/error.hpp"
#include "keyscan/logging.hpp"
#include "keyscan/sad_kernel.hpp"

namespace keyscan {

DifferenceEngine::DifferenceEngine(WorkerPool &pool, EngineOptions options)
    : pool_(pool), options_(options),
      tier_(options.use_simd ? best_simd_tier() : SimdTier::Scalar) {
  if (options_.block_size == 0) {
    throw Error(ErrorKind::Configuration, "block size must be positive");
  }
}

std::vector<double>
DifferenceEngine::scores(const std::vector<FrameBuffer> &frames) {
  if (frames.size() < 2)
    return {};

  std::vector<FramePair> pairs;
  pairs.reserve(frames.size() - 1);
  for (size_t i = 0; i + 1 < frames.size(); ++i) {
    pairs.emplace_back(&frames[i], &frames[i + 1]);
  }

  TIMER_START(difference_scores);
  auto result = to_scores(pairs);
  TIMER_END(difference_scores);
  return result;
}

double DifferenceEngine::pair_score(const FrameBuffer &a,
                                    const FrameBuffer &b) {
  return to_scores({{&a, &b}}).front();
}

uint64_t DifferenceEngine::pair_sad(const FrameBuffer &a,
                                    const FrameBuffer &b) {
  auto total = pair_totals({{&a, &b}}).front();
  if (!total) {
    throw std::invalid_argument(
        fmt::format("pair_sad: {}x{} vs {}x{}", a.width(), a.height(),
                    b.width(), b.height()));
  }
  return *total;
}

std::vector<double>
DifferenceEngine::to_scores(const std::vector<FramePair> &pairs) {
  auto totals = pair_totals(pairs);

  std::vector<double> result(pairs.size(), INCOMPARABLE_SCORE);
  for (size_t p = 0; p < pairs.size(); ++p) {
    if (totals[p]) {
      result[p] = static_cast<double>(*totals[p]) /
                  static_cast<double>(pairs[p].first->pixel_count());
    }
  }
  return result;
}

std::vector<std::optional<uint64_t>>
DifferenceEngine::pair_totals(const std::vector<FramePair> &pairs) {
  const size_t block = options_.block_size;

  // **---- Decompose pairs into blocks ----**

  /// Pair p owns flat blocks [first_block[p], first_block[p + 1]);
  /// incomparable pairs own none
  std::vector<size_t> first_block(pairs.size() + 1, 0);
  std::vector<std::optional<uint64_t>> totals(pairs.size());

  for (size_t p = 0; p < pairs.size(); ++p) {
    const FrameBuffer &a = *pairs[p].first;
    const FrameBuffer &b = *pairs[p].second;
    size_t blocks = 0;
    if (a.same_geometry(b)) {
      blocks = (a.pixel_count() + block - 1) / block;
      totals[p] = 0;
    } else {
      LOG_WARN("Frames {} and {} differ in size ({}x{} vs {}x{})", a.index(),
               b.index(), a.width(), a.height(), b.width(), b.height());
    }
    first_block[p + 1] = first_block[p] + blocks;
  }

  const size_t total_blocks = first_block.back();
  std::vector<uint64_t> block_sums(total_blocks, 0);
  const SadFn kernel = sad_kernel(tier_);

  LOG_DEBUG("Scoring {} pairs as {} blocks ({} kernel, {} threads)",
            pairs.size(), total_blocks, simd_tier_name(tier_), pool_.size());

  // **---- Parallel SAD ----**

  pool_.parallel_for(total_blocks, [&](size_t i) {
    /// Owning pair: last p with first_block[p] <= i
    size_t p = static_cast<size_t>(
        std::upper_bound(first_block.begin(), first_block.end(), i) -
        first_block.begin() - 1);
    const FrameBuffer &a = *pairs[p].first;
    const FrameBuffer &b = *pairs[p].second;
    size_t start = (i - first_block[p]) * block;
    size_t len = std::min(block, a.pixel_count() - start);
    block_sums[i] = kernel(a.data() + start, b.data() + start, len);
  });

  // **---- Reduce (left to right per pair) ----**

  for (size_t p = 0; p < pairs.size(); ++p) {
    if (!totals[p])
      continue;
    uint64_t sum = 0;
    for (size_t i = first_block[p]; i < first_block[p + 1]; ++i) {
      sum += block_sums[i];
    }
    totals[p] = sum;
  }

  return totals;
}

} // namespace keyscan
