/**
 * @file memory_io.hpp
 * @brief Read-only memory mapping of input files
 *
 * @details MappedFile maps a whole file into RAM. It backs both the raw
 *          gray8 file source and the in-memory AVIO context of the video
 *          decoder, so neither touches the disk after mapping.
 */

#ifndef KEYSCAN_MEMORY_IO_HPP
#define KEYSCAN_MEMORY_IO_HPP

#include <cstddef>
#include <cstdint>
#include <string>

namespace keyscan {

/**
 * @class MappedFile
 * @brief RAII wrapper for memory-mapped files.
 * @note Handles automatic cleanup (munmap/close) on destruction.
 *       Supports move semantics but not copy. An empty file maps to a
 *       valid object with size() == 0 and no mapping.
 */
class MappedFile {
public:
  MappedFile() = default;
  ~MappedFile();

  MappedFile(const MappedFile &) = delete;
  MappedFile &operator=(const MappedFile &) = delete;

  MappedFile(MappedFile &&other) noexcept;
  MappedFile &operator=(MappedFile &&other) noexcept;

  /**
   * @brief Map an entire file read-only.
   * @param path Path to the file
   * @throw Error (IO) if the file cannot be opened, stat'ed or mapped
   */
  static MappedFile open(const std::string &path);

  const uint8_t *data() const { return data_; }
  size_t size() const { return size_; }

private:
  void reset() noexcept;

  uint8_t *data_ = nullptr;
  size_t size_ = 0;
  int fd_ = -1;
};

} // namespace keyscan

#endif // KEYSCAN_MEMORY_IO_HPP
