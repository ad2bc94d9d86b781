/**
 * @file frame_reader.hpp
 * @brief Bounded-memory ingestion of fixed-size frames from a byte stream
 *
 * @details StreamingFrameReader pulls exactly width*height bytes per frame
 *          from a ByteSource and hands out padded FrameBuffers with indices
 *          0, 1, 2, ...
 *
 * @attention TERMINATION:
 *
 * - A partial final frame is end of stream, not an error
 *
 * - The optional cap stops ingestion without touching the source again
 *
 * - Source failures propagate as Error (IO)
 *
 * @note The reader keeps no reference to frames it has returned.
 */

#ifndef KEYSCAN_FRAME_READER_HPP
#define KEYSCAN_FRAME_READER_HPP

#include <cstddef>
#include <optional>
#include <vector>

#include "byte_source.hpp"
#include "frame.hpp"

namespace keyscan {

class StreamingFrameReader {
public:
  /**
   * @param source Byte stream, borrowed for the reader's lifetime
   * @param width Frame width in pixels
   * @param height Frame height in pixels
   * @param max_frames Frame cap (0 = read until end of stream)
   * @throw Error (Configuration) if the frame size is zero
   */
  StreamingFrameReader(ByteSource &source, size_t width, size_t height,
                       size_t max_frames = 0);

  /**
   * @brief Read the next frame.
   * @return The frame, or std::nullopt at end of stream or once the cap
   *         is reached
   * @throw Error (IO) if the source fails
   */
  std::optional<FrameBuffer> next();

  /// Drain the stream into a vector (the caller then holds every frame).
  std::vector<FrameBuffer> read_all();

  size_t frames_read() const { return frames_read_; }
  bool finished() const { return finished_; }

private:
  /// Fill dst with exactly frame_size_ bytes; false on early end of stream.
  bool fill(uint8_t *dst);

  ByteSource &source_;
  size_t width_;
  size_t height_;
  size_t frame_size_;
  size_t max_frames_;
  size_t frames_read_ = 0;
  bool finished_ = false;
};

} // namespace keyscan

#endif // KEYSCAN_FRAME_READER_HPP
