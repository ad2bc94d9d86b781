/**
 * @file sad_kernel.cpp
 * @brief Kernel dispatch by SIMD tier
 */

#include "keyscan/sad_kernel.hpp"

namespace keyscan {

SimdTier resolve_simd_tier(SimdTier tier) {
  if (simd_tier_supported(tier))
    return tier;
  SimdTier best = best_simd_tier();
  return (best < tier) ? best : SimdTier::Scalar;
}

SadFn sad_kernel(SimdTier tier) {
  switch (resolve_simd_tier(tier)) {
#if KEYSCAN_X86_KERNELS
  case SimdTier::AVX2:
    return &sad_avx2;
  case SimdTier::SSE2:
    return &sad_sse2;
#endif
  default:
    return &sad_scalar;
  }
}

uint64_t sad_best(const uint8_t *a, const uint8_t *b, size_t n) {
  static const SadFn best = sad_kernel(best_simd_tier());
  return best(a, b, n);
}

} // namespace keyscan
