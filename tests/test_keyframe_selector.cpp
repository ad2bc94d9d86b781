#include <gtest/gtest.h>

#include <cmath>
#include <limits>
#include <vector>

#include "keyscan/error.hpp"
#include "keyscan/keyframe_selector.hpp"
#include "keyscan/types.hpp"

using namespace keyscan;

TEST(KeyframeSelector, StrictlyAboveThreshold) {
  std::vector<double> scores = {0.0, 2.0, 2.0000001, 5.0, 1.9};
  EXPECT_EQ(select_keyframes(scores, 2.0), (std::vector<size_t>{3, 4}));
}

TEST(KeyframeSelector, IndicesNameTheSecondFrameOfEachPair) {
  std::vector<double> scores = {10.0, 0.0, 10.0};
  EXPECT_EQ(select_keyframes(scores, 1.0), (std::vector<size_t>{1, 3}));
}

TEST(KeyframeSelector, EmptyScoresSelectNothing) {
  EXPECT_TRUE(select_keyframes({}, 2.0).empty());
}

TEST(KeyframeSelector, ZeroThresholdSelectsAnyChange) {
  std::vector<double> scores = {0.0, 0.25, 0.0};
  EXPECT_EQ(select_keyframes(scores, 0.0), std::vector<size_t>{2});
}

TEST(KeyframeSelector, IncomparablePairSelectedBelowMaxThreshold) {
  std::vector<double> scores = {INCOMPARABLE_SCORE};
  EXPECT_EQ(select_keyframes(scores, 1e308), std::vector<size_t>{1});
}

TEST(KeyframeSelector, MaxThresholdSelectsNothing) {
  std::vector<double> scores = {0.0, INCOMPARABLE_SCORE, 255.0};
  EXPECT_TRUE(
      select_keyframes(scores, std::numeric_limits<double>::max()).empty());
}

TEST(KeyframeSelector, OutputIsAscending) {
  std::vector<double> scores(100);
  for (size_t i = 0; i < scores.size(); ++i)
    scores[i] = (i % 3 == 0) ? 50.0 : 0.5;
  auto keys = select_keyframes(scores, 2.0);
  ASSERT_EQ(keys.size(), 34u);
  for (size_t i = 1; i < keys.size(); ++i)
    EXPECT_LT(keys[i - 1], keys[i]);
}

TEST(KeyframeSelector, InvalidThresholdRejected) {
  std::vector<double> scores = {1.0};
  try {
    select_keyframes(scores, -0.5);
    FAIL() << "expected a configuration error";
  } catch (const Error &e) {
    EXPECT_EQ(e.kind(), ErrorKind::Configuration);
  }
  EXPECT_THROW(
      select_keyframes(scores, std::numeric_limits<double>::quiet_NaN()),
      Error);
}
