#include "simd/simd_detect.h"
#include <cstdint>
#include <iostream>

#if defined(__x86_64__) || defined(__i386__)
#include <cpuid.h>

namespace {

// XCR0 tells whether the OS saves the wider register files on context switch.
uint64_t readXCR0() {
    uint32_t eax, edx;
    __asm__ volatile("xgetbv" : "=a"(eax), "=d"(edx) : "c"(0));
    return (static_cast<uint64_t>(edx) << 32) | eax;
}

struct CpuFeatures {
    bool sse2 = false;
    bool avx2 = false;
    bool avx512bw = false;
};

CpuFeatures queryCpu() {
    CpuFeatures features;
    uint32_t eax, ebx, ecx, edx;

    if (!__get_cpuid(1, &eax, &ebx, &ecx, &edx)) return features;
    features.sse2 = (edx & (1u << 26)) != 0;

    const bool osxsave = (ecx & (1u << 27)) != 0;
    if (!osxsave) return features;

    const uint64_t xcr0 = readXCR0();
    const bool ymm_enabled = (xcr0 & 0x6) == 0x6;
    const bool zmm_enabled = (xcr0 & 0xE6) == 0xE6;

    if (!__get_cpuid_count(7, 0, &eax, &ebx, &ecx, &edx)) return features;

    // Check for AVX2
    features.avx2 = ymm_enabled && (ebx & (1u << 5)) != 0;

    // Check for AVX512F + AVX512BW
    features.avx512bw = zmm_enabled && (ebx & (1u << 16)) != 0 && (ebx & (1u << 30)) != 0;
    return features;
}

}
#endif

SIMDType SIMDDetector::detectBestSIMD() {
#if defined(__x86_64__) || defined(__i386__)
    const CpuFeatures features = queryCpu();
    if (features.avx512bw) return SIMDType::AVX512;
    if (features.avx2) return SIMDType::AVX2;
    if (features.sse2) return SIMDType::SSE2;
#elif defined(__aarch64__)
    // Advanced SIMD is mandatory on AArch64
    return SIMDType::NEON;
#endif

    return SIMDType::SCALAR;
}

bool SIMDDetector::isSupported(SIMDType type) {
    switch (type) {
        case SIMDType::SCALAR:
            return true;
#if defined(__x86_64__) || defined(__i386__)
        case SIMDType::SSE2:
            return queryCpu().sse2;
        case SIMDType::AVX2:
            return queryCpu().avx2;
        case SIMDType::AVX512:
            return queryCpu().avx512bw;
#elif defined(__aarch64__)
        case SIMDType::NEON:
            return true;
#endif
        default:
            return false;
    }
}

const char* SIMDDetector::toString(SIMDType type) {
    switch (type) {
        case SIMDType::AVX512: return "AVX512";
        case SIMDType::AVX2:   return "AVX2";
        case SIMDType::SSE2:   return "SSE2";
        case SIMDType::NEON:   return "NEON";
        case SIMDType::SCALAR: return "SCALAR";
        case SIMDType::UNKNOWN:
        default:               return "UNKNOWN";
    }
}

void SIMDDetector::printBestSIMD() {
    std::cout << toString(detectBestSIMD()) << std::endl;
}
