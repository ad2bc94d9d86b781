/**
 * @file sad_sse2.cpp
 * @brief SSE2 SAD kernel (16 bytes per step)
 *
 * @note Built with -msse2. Only reached after the dispatcher has seen SSE2
 *       in CPUID.
 */

#include "keyscan/sad_kernel.hpp"

#if KEYSCAN_X86_KERNELS

#include <emmintrin.h>

namespace keyscan {

uint64_t sad_sse2(const uint8_t *a, const uint8_t *b, size_t n) {
  const size_t chunks = n / 16;

  /// _mm_sad_epu8 leaves two 16-bit sums in the low bits of each 64-bit
  /// lane; adding lanes with _mm_add_epi64 cannot overflow for any n
  __m128i acc = _mm_setzero_si128();
  for (size_t i = 0; i < chunks; ++i) {
    __m128i va = _mm_loadu_si128(reinterpret_cast<const __m128i *>(a + i * 16));
    __m128i vb = _mm_loadu_si128(reinterpret_cast<const __m128i *>(b + i * 16));
    acc = _mm_add_epi64(acc, _mm_sad_epu8(va, vb));
  }

  alignas(16) uint64_t lanes[2];
  _mm_store_si128(reinterpret_cast<__m128i *>(lanes), acc);
  uint64_t total = lanes[0] + lanes[1];

  const size_t done = chunks * 16;
  return total + sad_scalar(a + done, b + done, n - done);
}

} // namespace keyscan

#endif // KEYSCAN_X86_KERNELS
