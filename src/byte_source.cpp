/**
 * @file byte_source.cpp
 * @brief Byte source implementations
 */

#include "keyscan/byte_source.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <unistd.h>

#include <fmt/core.h>

#include "keyscan/error.hpp"

namespace keyscan {

// **---- FdByteSource ----**

FdByteSource::~FdByteSource() {
  if (owns_fd_ && fd_ != -1)
    close(fd_);
}

size_t FdByteSource::read(uint8_t *buf, size_t n) {
  while (true) {
    ssize_t got = ::read(fd_, buf, n);
    if (got >= 0)
      return static_cast<size_t>(got);
    if (errno == EINTR)
      continue;
    throw Error(ErrorKind::IO, fmt::format("read from fd {} failed: {}", fd_,
                                           std::strerror(errno)));
  }
}

// **---- MemoryByteSource ----**

size_t MemoryByteSource::read(uint8_t *buf, size_t n) {
  size_t copy = std::min(n, size_ - pos_);
  if (copy == 0)
    return 0;
  std::memcpy(buf, data_ + pos_, copy);
  pos_ += copy;
  return copy;
}

// **---- MappedFileSource ----**

MappedFileSource::MappedFileSource(const std::string &path)
    : file_(MappedFile::open(path)), cursor_(file_.data(), file_.size()) {}

} // namespace keyscan
