/**
 * @file cpu_features.hpp
 * @brief Runtime detection of SIMD instruction tiers
 *
 * @details Queries the running processor once per process (CPUID, plus
 *          XGETBV for OS support of YMM state) and caches the result.
 *          Absence of every tier is a valid result; detection never fails.
 *
 * @note On non-x86 builds every flag is false and the best tier is Scalar.
 */

#ifndef KEYSCAN_CPU_FEATURES_HPP
#define KEYSCAN_CPU_FEATURES_HPP

namespace keyscan {

/// Kernel tiers, ordered from least to most capable.
enum class SimdTier { Scalar = 0, SSE2 = 1, AVX2 = 2 };

struct CpuFeatures {
  bool sse2 = false;
  bool sse4_1 = false;
  bool sse4_2 = false;
  bool avx2 = false;
  bool fma = false;
};

/// Cached feature record of the running CPU.
const CpuFeatures &cpu_features();

/// Run detection without the cache (exposed for tests).
CpuFeatures detect_cpu_features();

/// Most capable tier that is both available and compiled in.
SimdTier best_simd_tier();

/// True if the tier can run on this CPU with this build.
bool simd_tier_supported(SimdTier tier);

/// "avx2", "sse2" or "scalar".
const char *simd_tier_name(SimdTier tier);

} // namespace keyscan

#endif // KEYSCAN_CPU_FEATURES_HPP
