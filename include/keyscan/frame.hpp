/**
 * @file frame.hpp
 * @brief Immutable grayscale frame buffer
 *
 * @details A FrameBuffer owns one frame's gray8 pixels:
 *
 *          - width*height meaningful bytes, one per pixel
 *
 *          - zero padding up to the next multiple of VECTOR_ALIGNMENT
 *
 *          - 32-byte aligned storage
 *
 * @note Frames are move-only and expose no mutating accessors. The
 *       StreamingFrameReader fills a frame in place before handing it out.
 */

#ifndef KEYSCAN_FRAME_HPP
#define KEYSCAN_FRAME_HPP

#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <memory>

#include "types.hpp"

namespace keyscan {

/// Releases storage obtained from posix_memalign.
struct AlignedFree {
  void operator()(uint8_t *p) const { std::free(p); }
};

using AlignedBytes = std::unique_ptr<uint8_t[], AlignedFree>;

/**
 * @brief Allocate zero-filled, VECTOR_ALIGNMENT aligned storage.
 * @param size Bytes to allocate (rounded up to the alignment unit)
 * @throw std::bad_alloc on failure
 */
AlignedBytes allocate_aligned(size_t size);

class FrameBuffer {
public:
  /**
   * @brief Copy width*height pixels into a new padded frame.
   * @throw Error (Configuration) if width or height is zero
   */
  FrameBuffer(size_t index, size_t width, size_t height,
              const uint8_t *pixels);

  FrameBuffer(const FrameBuffer &) = delete;
  FrameBuffer &operator=(const FrameBuffer &) = delete;
  FrameBuffer(FrameBuffer &&) noexcept = default;
  FrameBuffer &operator=(FrameBuffer &&) noexcept = default;

  size_t index() const { return index_; }
  size_t width() const { return width_; }
  size_t height() const { return height_; }

  /// Number of meaningful bytes (width * height).
  size_t pixel_count() const { return width_ * height_; }

  /// Storage length including zero padding.
  size_t padded_size() const { return align_up(pixel_count()); }

  const uint8_t *data() const { return bytes_.get(); }

  bool same_geometry(const FrameBuffer &other) const {
    return width_ == other.width_ && height_ == other.height_;
  }

private:
  friend class StreamingFrameReader;

  /// Zero-filled frame for in-place filling by the reader.
  FrameBuffer(size_t index, size_t width, size_t height);

  uint8_t *mutable_data() { return bytes_.get(); }

  size_t index_;
  size_t width_;
  size_t height_;
  AlignedBytes bytes_;
};

} // namespace keyscan

#endif // KEYSCAN_FRAME_HPP
