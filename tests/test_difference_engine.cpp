#include <gtest/gtest.h>

#include <cstdint>
#include <cstdlib>
#include <stdexcept>
#include <vector>

#include "keyscan/difference_engine.hpp"
#include "keyscan/error.hpp"
#include "keyscan/keyframe_selector.hpp"
#include "keyscan/types.hpp"
#include "keyscan/worker_pool.hpp"
#include "test_helpers.hpp"

using namespace keyscan;

namespace {

double reference_score(const FrameBuffer &a, const FrameBuffer &b) {
  uint64_t sum = 0;
  for (size_t i = 0; i < a.pixel_count(); ++i)
    sum += static_cast<uint64_t>(
        std::abs(int(a.data()[i]) - int(b.data()[i])));
  return static_cast<double>(sum) / static_cast<double>(a.pixel_count());
}

} // namespace

TEST(DifferenceEngine, IdenticalFramesScoreZero) {
  WorkerPool pool(4);
  DifferenceEngine engine(pool);

  std::vector<FrameBuffer> frames;
  frames.push_back(test::random_frame(0, 64, 48, 5));
  frames.push_back(test::random_frame(1, 64, 48, 5));
  frames.push_back(test::random_frame(2, 64, 48, 5));

  auto scores = engine.scores(frames);
  ASSERT_EQ(scores.size(), 2u);
  EXPECT_EQ(scores[0], 0.0);
  EXPECT_EQ(scores[1], 0.0);
}

TEST(DifferenceEngine, MeanAbsoluteDifference) {
  WorkerPool pool(2);
  DifferenceEngine engine(pool, {100, true});

  std::vector<FrameBuffer> frames;
  frames.push_back(test::filled_frame(0, 2, 2, 0));
  frames.push_back(test::filled_frame(1, 2, 2, 0));
  frames.push_back(test::filled_frame(2, 2, 2, 255));

  auto scores = engine.scores(frames);
  ASSERT_EQ(scores.size(), 2u);
  EXPECT_DOUBLE_EQ(scores[0], 0.0);
  EXPECT_DOUBLE_EQ(scores[1], 255.0);
  EXPECT_EQ(select_keyframes(scores, 2.0), std::vector<size_t>{2});
}

TEST(DifferenceEngine, MatchesReferenceOnRandomFrames) {
  WorkerPool pool(3);
  DifferenceEngine engine(pool, {1000, true});

  auto frames = test::random_sequence(6, 101, 37, 40);
  auto scores = engine.scores(frames);
  ASSERT_EQ(scores.size(), 5u);
  for (size_t i = 0; i < scores.size(); ++i)
    EXPECT_DOUBLE_EQ(scores[i], reference_score(frames[i], frames[i + 1]));
}

TEST(DifferenceEngine, FewerThanTwoFramesGiveNoScores) {
  WorkerPool pool(2);
  DifferenceEngine engine(pool);

  std::vector<FrameBuffer> frames;
  EXPECT_TRUE(engine.scores(frames).empty());
  frames.push_back(test::filled_frame(0, 8, 8, 1));
  EXPECT_TRUE(engine.scores(frames).empty());
}

TEST(DifferenceEngine, MismatchedGeometryIsIncomparable) {
  WorkerPool pool(2);
  DifferenceEngine engine(pool);

  std::vector<FrameBuffer> frames;
  frames.push_back(test::filled_frame(0, 4, 4, 10));
  frames.push_back(test::filled_frame(1, 4, 4, 10));
  frames.push_back(test::filled_frame(2, 2, 8, 10));
  frames.push_back(test::filled_frame(3, 2, 8, 10));

  auto scores = engine.scores(frames);
  ASSERT_EQ(scores.size(), 3u);
  EXPECT_EQ(scores[0], 0.0);
  EXPECT_EQ(scores[1], INCOMPARABLE_SCORE);
  EXPECT_EQ(scores[2], 0.0);

  /// An incomparable pair is selected at any threshold below DBL_MAX
  EXPECT_EQ(select_keyframes(scores, 1e300), std::vector<size_t>{2});
  EXPECT_THROW(engine.pair_sad(frames[1], frames[2]), std::invalid_argument);
  EXPECT_EQ(engine.pair_score(frames[1], frames[2]), INCOMPARABLE_SCORE);
}

TEST(DifferenceEngine, ScoresIndependentOfPoolSize) {
  auto frames = test::random_sequence(9, 160, 90, 7);

  WorkerPool single(1);
  DifferenceEngine baseline_engine(single, {512, true});
  auto baseline = baseline_engine.scores(frames);

  for (size_t threads = 2; threads <= 8; ++threads) {
    WorkerPool pool(threads);
    DifferenceEngine engine(pool, {512, true});
    EXPECT_EQ(engine.scores(frames), baseline) << threads << " threads";
  }
}

TEST(DifferenceEngine, ScoresIndependentOfBlockSize) {
  auto frames = test::random_sequence(4, 200, 150, 21);
  WorkerPool pool(4);

  DifferenceEngine small(pool, {100, true});
  DifferenceEngine large(pool, {10000, true});
  DifferenceEngine whole(pool, {1 << 20, true});
  auto expected = small.scores(frames);
  EXPECT_EQ(large.scores(frames), expected);
  EXPECT_EQ(whole.scores(frames), expected);
}

TEST(DifferenceEngine, ScalarAndSimdAgree) {
  auto frames = test::random_sequence(5, 333, 77, 99);
  WorkerPool pool(4);

  DifferenceEngine simd(pool, {4096, true});
  DifferenceEngine scalar(pool, {4096, false});
  EXPECT_EQ(scalar.tier(), SimdTier::Scalar);
  EXPECT_FALSE(scalar.options().use_simd);
  EXPECT_EQ(simd.tier(), best_simd_tier());
  EXPECT_EQ(simd.scores(frames), scalar.scores(frames));
}

TEST(DifferenceEngine, RepeatedRunsAreIdentical) {
  auto frames = test::random_sequence(8, 128, 128, 3);
  WorkerPool pool(6);
  DifferenceEngine engine(pool, {300, true});

  auto first = engine.scores(frames);
  for (int i = 0; i < 5; ++i)
    EXPECT_EQ(engine.scores(frames), first);
}

TEST(DifferenceEngine, PairSadCountsAllPixels) {
  WorkerPool pool(2);
  DifferenceEngine engine(pool, {7, true});
  auto a = test::filled_frame(0, 13, 11, 3);
  auto b = test::filled_frame(1, 13, 11, 10);
  EXPECT_EQ(engine.pair_sad(a, b), 7u * 13 * 11);
  EXPECT_DOUBLE_EQ(engine.pair_score(a, b), 7.0);
}

TEST(DifferenceEngine, ZeroBlockSizeIsRejected) {
  WorkerPool pool(1);
  try {
    DifferenceEngine engine(pool, {0, true});
    FAIL() << "expected a configuration error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Configuration);
  }
}
