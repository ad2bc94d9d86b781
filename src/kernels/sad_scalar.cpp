/**
 * @file sad_scalar.cpp
 * @brief Portable SAD kernel
 */

#include "keyscan/sad_kernel.hpp"

#include <cstdlib>

namespace keyscan {

uint64_t sad_scalar(const uint8_t *a, const uint8_t *b, size_t n) {
  uint64_t total = 0;
  for (size_t i = 0; i < n; ++i) {
    /// Widen before subtracting so the difference cannot wrap
    total += static_cast<uint64_t>(
        std::abs(static_cast<int>(a[i]) - static_cast<int>(b[i])));
  }
  return total;
}

} // namespace keyscan
