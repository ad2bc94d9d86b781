/**
 * @file byte_source.hpp
 * @brief Sources of raw concatenated gray8 frame bytes
 *
 * @details A ByteSource is an ordered, read-once stream with no framing.
 *          Implementations:
 *
 *          - FdByteSource: a POSIX descriptor (stdin, a pipe, a file)
 *
 *          - MemoryByteSource: a borrowed byte range
 *
 *          - MappedFileSource: a raw file mapped with MappedFile
 *
 *          - VideoByteSource (video_source.hpp): decoded luma planes
 */

#ifndef KEYSCAN_BYTE_SOURCE_HPP
#define KEYSCAN_BYTE_SOURCE_HPP

#include <cstddef>
#include <cstdint>
#include <string>

#include "memory_io.hpp"

namespace keyscan {

class ByteSource {
public:
  virtual ~ByteSource() = default;

  /**
   * @brief Read up to n bytes into buf.
   * @return Bytes read; 0 only at end of stream
   * @throw Error (IO) if the underlying source fails
   * @note May return fewer than n bytes before the end of the stream.
   */
  virtual size_t read(uint8_t *buf, size_t n) = 0;
};

/**
 * @class FdByteSource
 * @brief Reads from a POSIX file descriptor, retrying on EINTR.
 * @note The descriptor is borrowed unless owns_fd is set.
 */
class FdByteSource : public ByteSource {
public:
  explicit FdByteSource(int fd, bool owns_fd = false)
      : fd_(fd), owns_fd_(owns_fd) {}
  ~FdByteSource() override;

  FdByteSource(const FdByteSource &) = delete;
  FdByteSource &operator=(const FdByteSource &) = delete;

  size_t read(uint8_t *buf, size_t n) override;

private:
  int fd_;
  bool owns_fd_;
};

/**
 * @class MemoryByteSource
 * @brief Serves a borrowed byte range; the range must outlive the source.
 */
class MemoryByteSource : public ByteSource {
public:
  MemoryByteSource(const uint8_t *data, size_t size)
      : data_(data), size_(size) {}

  size_t read(uint8_t *buf, size_t n) override;

  size_t remaining() const { return size_ - pos_; }

private:
  const uint8_t *data_;
  size_t size_;
  size_t pos_ = 0;
};

/**
 * @class MappedFileSource
 * @brief Raw gray8 file served from a read-only mapping.
 */
class MappedFileSource : public ByteSource {
public:
  /// @throw Error (IO) if the file cannot be mapped
  explicit MappedFileSource(const std::string &path);

  size_t read(uint8_t *buf, size_t n) override { return cursor_.read(buf, n); }

  size_t size() const { return file_.size(); }

private:
  MappedFile file_;
  MemoryByteSource cursor_;
};

} // namespace keyscan

#endif // KEYSCAN_BYTE_SOURCE_HPP
