/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for the keyscan test suite
 */

#ifndef KEYSCAN_TEST_HELPERS_HPP
#define KEYSCAN_TEST_HELPERS_HPP

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

#include "keyscan/frame.hpp"

namespace keyscan {
namespace test {

inline std::vector<uint8_t> random_bytes(size_t n, uint32_t seed) {
  std::mt19937 rng(seed);
  std::uniform_int_distribution<int> dist(0, 255);
  std::vector<uint8_t> out(n);
  for (auto &b : out)
    b = static_cast<uint8_t>(dist(rng));
  return out;
}

inline FrameBuffer filled_frame(size_t index, size_t width, size_t height,
                                uint8_t value) {
  std::vector<uint8_t> px(width * height, value);
  return FrameBuffer(index, width, height, px.data());
}

inline FrameBuffer random_frame(size_t index, size_t width, size_t height,
                                uint32_t seed) {
  auto px = random_bytes(width * height, seed);
  return FrameBuffer(index, width, height, px.data());
}

/// Frames of one geometry, each with random content
inline std::vector<FrameBuffer> random_sequence(size_t count, size_t width,
                                                size_t height, uint32_t seed) {
  std::vector<FrameBuffer> frames;
  frames.reserve(count);
  for (size_t i = 0; i < count; ++i)
    frames.push_back(
        random_frame(i, width, height, seed + static_cast<uint32_t>(i)));
  return frames;
}

} // namespace test
} // namespace keyscan

#endif // KEYSCAN_TEST_HELPERS_HPP
