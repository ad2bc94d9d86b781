/**
 * @file error.hpp
 * @brief Error type raised by keyscan
 *
 * @details Fatal conditions are reported as keyscan::Error, a
 *          std::runtime_error carrying an ErrorKind:
 *
 *          - Configuration: invalid geometry, zero block size, bad threshold
 *            or frame rate
 *
 *          - IO: the underlying byte source, decoder or file system failed
 *
 * @note End of stream, fewer than two frames and mismatched frame
 *       dimensions are not errors.
 */

#ifndef KEYSCAN_ERROR_HPP
#define KEYSCAN_ERROR_HPP

#include <stdexcept>
#include <string>

namespace keyscan {

enum class ErrorKind { Configuration, IO };

/// Human-readable name of an error kind.
inline const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::Configuration:
    return "configuration error";
  case ErrorKind::IO:
    return "I/O error";
  }
  return "error";
}

class Error : public std::runtime_error {
public:
  Error(ErrorKind kind, const std::string &what)
      : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace keyscan

#endif // KEYSCAN_ERROR_HPP
