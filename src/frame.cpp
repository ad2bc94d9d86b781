/**
 * @file frame.cpp
 * @brief FrameBuffer implementation
 */

#include "keyscan/frame.hpp"

#include <cstring>
#include <new>

#include <fmt/core.h>

#include "keyscan/error.hpp"

namespace keyscan {

namespace {

void check_geometry(size_t width, size_t height) {
  if (width == 0 || height == 0) {
    throw Error(ErrorKind::Configuration,
                fmt::format("invalid frame geometry {}x{}", width, height));
  }
}

} // anonymous namespace

AlignedBytes allocate_aligned(size_t size) {
  size_t padded = align_up(size == 0 ? 1 : size);
  void *ptr = nullptr;
  if (posix_memalign(&ptr, VECTOR_ALIGNMENT, padded) != 0)
    throw std::bad_alloc();
  std::memset(ptr, 0, padded);
  return AlignedBytes(static_cast<uint8_t *>(ptr));
}

FrameBuffer::FrameBuffer(size_t index, size_t width, size_t height)
    : index_(index), width_(width), height_(height) {
  check_geometry(width, height);
  bytes_ = allocate_aligned(width * height);
}

FrameBuffer::FrameBuffer(size_t index, size_t width, size_t height,
                         const uint8_t *pixels)
    : FrameBuffer(index, width, height) {
  /// Padding stays zero from allocate_aligned
  std::memcpy(bytes_.get(), pixels, width * height);
}

} // namespace keyscan
