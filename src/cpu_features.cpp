/**
 * @file cpu_features.cpp
 * @brief CPUID based SIMD tier detection
 */

#include "keyscan/cpu_features.hpp"

#include <cstdint>

#if defined(__x86_64__) || defined(__i386__)
#include <cpuid.h>
#endif

#include "keyscan/logging.hpp"

#ifndef KEYSCAN_X86_KERNELS
#define KEYSCAN_X86_KERNELS 0
#endif

namespace keyscan {

namespace {

#if defined(__x86_64__) || defined(__i386__)
/// XCR0: which register states the OS saves on context switch.
uint64_t read_xcr0() {
  uint32_t eax, edx;
  __asm__ volatile("xgetbv" : "=a"(eax), "=d"(edx) : "c"(0));
  return (static_cast<uint64_t>(edx) << 32) | eax;
}
#endif

} // anonymous namespace

CpuFeatures detect_cpu_features() {
  CpuFeatures f;
#if defined(__x86_64__) || defined(__i386__)
  unsigned eax, ebx, ecx, edx;
  if (!__get_cpuid(1, &eax, &ebx, &ecx, &edx))
    return f;

  f.sse2 = (edx >> 26) & 1;
  f.sse4_1 = (ecx >> 19) & 1;
  f.sse4_2 = (ecx >> 20) & 1;

  /// AVX-class instructions need the OS to preserve XMM and YMM state
  bool osxsave = (ecx >> 27) & 1;
  bool avx = (ecx >> 28) & 1;
  bool ymm_enabled = osxsave && (read_xcr0() & 0x6) == 0x6;

  f.fma = ymm_enabled && avx && ((ecx >> 12) & 1);

  if (ymm_enabled && avx && __get_cpuid_count(7, 0, &eax, &ebx, &ecx, &edx)) {
    f.avx2 = (ebx >> 5) & 1;
  }
#endif
  return f;
}

const CpuFeatures &cpu_features() {
  static const CpuFeatures features = [] {
    CpuFeatures f = detect_cpu_features();
    LOG_DEBUG("CPU features: sse2={} sse4.1={} sse4.2={} avx2={} fma={}",
              f.sse2, f.sse4_1, f.sse4_2, f.avx2, f.fma);
    return f;
  }();
  return features;
}

bool simd_tier_supported(SimdTier tier) {
  switch (tier) {
  case SimdTier::Scalar:
    return true;
  case SimdTier::SSE2:
    return KEYSCAN_X86_KERNELS && cpu_features().sse2;
  case SimdTier::AVX2:
    return KEYSCAN_X86_KERNELS && cpu_features().avx2;
  }
  return false;
}

SimdTier best_simd_tier() {
  if (simd_tier_supported(SimdTier::AVX2))
    return SimdTier::AVX2;
  if (simd_tier_supported(SimdTier::SSE2))
    return SimdTier::SSE2;
  return SimdTier::Scalar;
}

const char *simd_tier_name(SimdTier tier) {
  switch (tier) {
  case SimdTier::AVX2:
    return "avx2";
  case SimdTier::SSE2:
    return "sse2";
  case SimdTier::Scalar:
    return "scalar";
  }
  return "scalar";
}

} // namespace keyscan
