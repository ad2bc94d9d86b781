/**
 * @file sad_kernel.hpp
 * @brief Sum of absolute differences over contiguous byte ranges
 *
 * @details Every variant returns sum(|int(a[i]) - int(b[i])|) for i in
 *          [0, n) as a 64-bit unsigned value:
 *
 *          - sad_scalar: portable reference
 *
 *          - sad_sse2: 16-byte chunks through _mm_sad_epu8
 *
 *          - sad_avx2: 32-byte chunks through _mm256_sad_epu8
 *
 *          Vector variants run their tail through the scalar path.
 *
 * @attention All variants return identical sums for identical inputs.
 *            Inputs need no particular alignment and are never written.
 */

#ifndef KEYSCAN_SAD_KERNEL_HPP
#define KEYSCAN_SAD_KERNEL_HPP

#include <cstddef>
#include <cstdint>

#include "cpu_features.hpp"

namespace keyscan {

using SadFn = uint64_t (*)(const uint8_t *a, const uint8_t *b, size_t n);

uint64_t sad_scalar(const uint8_t *a, const uint8_t *b, size_t n);

#if KEYSCAN_X86_KERNELS
/// Callers must check simd_tier_supported(SimdTier::SSE2) first.
uint64_t sad_sse2(const uint8_t *a, const uint8_t *b, size_t n);

/// Callers must check simd_tier_supported(SimdTier::AVX2) first.
uint64_t sad_avx2(const uint8_t *a, const uint8_t *b, size_t n);
#endif

/**
 * @brief Kernel for a tier.
 * @note A tier the CPU or build cannot run resolves to the best tier that
 *       can, so the returned kernel is always safe to call.
 */
SadFn sad_kernel(SimdTier tier);

/// Tier actually used by sad_kernel(tier).
SimdTier resolve_simd_tier(SimdTier tier);

/// SAD through the given tier.
inline uint64_t sad(SimdTier tier, const uint8_t *a, const uint8_t *b,
                    size_t n) {
  return sad_kernel(tier)(a, b, n);
}

/// SAD through the best tier of this process (resolved once).
uint64_t sad_best(const uint8_t *a, const uint8_t *b, size_t n);

} // namespace keyscan

#endif // KEYSCAN_SAD_KERNEL_HPP
