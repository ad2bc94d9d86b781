/**
 * @file memory_io.cpp
 * @brief MappedFile implementation
 */

#include "keyscan/memory_io.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

#include <fmt/core.h>

#include "keyscan/error.hpp"
#include "keyscan/logging.hpp"

namespace keyscan {

MappedFile::~MappedFile() { reset(); }

MappedFile::MappedFile(MappedFile &&other) noexcept
    : data_(other.data_), size_(other.size_), fd_(other.fd_) {
  other.data_ = nullptr;
  other.size_ = 0;
  other.fd_ = -1;
}

MappedFile &MappedFile::operator=(MappedFile &&other) noexcept {
  if (this != &other) {
    reset();
    data_ = other.data_;
    size_ = other.size_;
    fd_ = other.fd_;

    other.data_ = nullptr;
    other.size_ = 0;
    other.fd_ = -1;
  }
  return *this;
}

void MappedFile::reset() noexcept {
  if (data_) {
    munmap(data_, size_);
    data_ = nullptr;
  }
  if (fd_ != -1) {
    close(fd_);
    fd_ = -1;
  }
  size_ = 0;
}

MappedFile MappedFile::open(const std::string &path) {
  TIMER_START(map_file);

  MappedFile file;
  file.fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
  if (file.fd_ == -1) {
    throw Error(ErrorKind::IO, fmt::format("failed to open {}: {}", path,
                                           std::strerror(errno)));
  }

  struct stat sb;
  if (fstat(file.fd_, &sb) == -1) {
    throw Error(ErrorKind::IO, fmt::format("failed to stat {}: {}", path,
                                           std::strerror(errno)));
  }

  /// Nothing to map; readers see an immediate end of stream
  if (sb.st_size <= 0) {
    LOG_DEBUG("{} is empty", path);
    return file;
  }

  ///\note MAP_POPULATE reads the file into RAM now so frame ingestion does
  ///      not stall on page faults.
  void *addr =
      mmap(nullptr, sb.st_size, PROT_READ, MAP_PRIVATE | MAP_POPULATE,
           file.fd_, 0);
  if (addr == MAP_FAILED) {
    throw Error(ErrorKind::IO, fmt::format("failed to mmap {}: {}", path,
                                           std::strerror(errno)));
  }

  /// Frames are consumed front to back
  madvise(addr, sb.st_size, MADV_SEQUENTIAL);

  file.data_ = static_cast<uint8_t *>(addr);
  file.size_ = static_cast<size_t>(sb.st_size);

  TIMER_END(map_file);
  LOG_DEBUG("Mapped {} ({} bytes)", path, file.size_);
  return file;
}

} // namespace keyscan
