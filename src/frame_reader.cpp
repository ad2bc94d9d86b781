/**
 * @file frame_reader.cpp
 * @brief StreamingFrameReader implementation
 */

#include "keyscan/frame_reader.hpp"

#include <algorithm>

#include <fmt/core.h>

#include "keyscan/error.hpp"
#include "keyscan/logging.hpp"

namespace keyscan {

StreamingFrameReader::StreamingFrameReader(ByteSource &source, size_t width,
                                           size_t height, size_t max_frames)
    : source_(source), width_(width), height_(height),
      frame_size_(width * height), max_frames_(max_frames) {
  if (frame_size_ == 0) {
    throw Error(ErrorKind::Configuration,
                fmt::format("frame size is zero ({}x{})", width, height));
  }
}

bool StreamingFrameReader::fill(uint8_t *dst) {
  size_t filled = 0;
  while (filled < frame_size_) {
    size_t got = source_.read(dst + filled, frame_size_ - filled);
    if (got == 0) {
      if (filled > 0) {
        LOG_DEBUG("Dropping partial frame {} ({} of {} bytes)", frames_read_,
                  filled, frame_size_);
      }
      return false;
    }
    filled += got;
  }
  return true;
}

std::optional<FrameBuffer> StreamingFrameReader::next() {
  if (finished_)
    return std::nullopt;

  if (max_frames_ > 0 && frames_read_ >= max_frames_) {
    finished_ = true;
    return std::nullopt;
  }

  /// Storage arrives zeroed, so the padding needs no extra pass
  FrameBuffer frame(frames_read_, width_, height_);
  if (!fill(frame.mutable_data())) {
    finished_ = true;
    return std::nullopt;
  }

  ++frames_read_;
  if (frames_read_ % 200 == 0) {
    LOG_DEBUG("Frames read: {}", frames_read_);
  }
  return frame;
}

std::vector<FrameBuffer> StreamingFrameReader::read_all() {
  std::vector<FrameBuffer> frames;
  if (max_frames_ > 0)
    frames.reserve(std::min<size_t>(max_frames_, 4096));
  while (auto frame = next()) {
    frames.push_back(std::move(*frame));
  }
  return frames;
}

} // namespace keyscan
