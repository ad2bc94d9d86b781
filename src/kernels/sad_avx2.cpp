/**
 * @file sad_avx2.cpp
 * @brief AVX2 SAD kernel (32 bytes per step)
 *
 * @note Built with -mavx2. Only reached after the dispatcher has seen AVX2
 *       in CPUID and YMM support in XCR0.
 */

#include "keyscan/sad_kernel.hpp"

#if KEYSCAN_X86_KERNELS

#include <immintrin.h>

namespace keyscan {

uint64_t sad_avx2(const uint8_t *a, const uint8_t *b, size_t n) {
  const size_t chunks = n / 32;

  __m256i acc = _mm256_setzero_si256();
  for (size_t i = 0; i < chunks; ++i) {
    __m256i va =
        _mm256_loadu_si256(reinterpret_cast<const __m256i *>(a + i * 32));
    __m256i vb =
        _mm256_loadu_si256(reinterpret_cast<const __m256i *>(b + i * 32));
    acc = _mm256_add_epi64(acc, _mm256_sad_epu8(va, vb));
  }

  /// Horizontal reduction of the four 64-bit lanes
  __m128i sum128 = _mm_add_epi64(_mm256_castsi256_si128(acc),
                                 _mm256_extracti128_si256(acc, 1));
  alignas(16) uint64_t lanes[2];
  _mm_store_si128(reinterpret_cast<__m128i *>(lanes), sum128);
  uint64_t total = lanes[0] + lanes[1];

  /// Clear upper YMM state before the scalar tail
  _mm256_zeroupper();

  const size_t done = chunks * 32;
  return total + sad_scalar(a + done, b + done, n - done);
}

} // namespace keyscan

#endif // KEYSCAN_X86_KERNELS
