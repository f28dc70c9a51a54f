#include "simd/simd_factory.h"
#include "simd/impl/avx2_impl.h"
#include "simd/impl/avx512_impl.h"
#include "simd/impl/neon_impl.h"
#include "simd/impl/sse_impl.h"
#include "simd/impl/scalar_impl.h"
#include "simd/simd_detect.h"

std::unique_ptr<SIMDInterface> createSIMDImplementation(SIMDType type) {
    switch (type) {
#if defined(__x86_64__) || defined(_M_X64)
        case SIMDType::AVX512:
            return std::make_unique<AVX512NewlineCounter>();
#endif
#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
        case SIMDType::AVX2:
            return std::make_unique<AVX2NewlineCounter>();
        case SIMDType::SSE2:
            return std::make_unique<SSENewlineCounter>();
#endif
#if defined(__aarch64__)
        case SIMDType::NEON:
            return std::make_unique<NEONNewlineCounter>();
#endif
        case SIMDType::SCALAR:
            return std::make_unique<ScalarNewlineCounter>();
        default:
            return nullptr;
    }
}

std::unique_ptr<SIMDInterface> createBestSIMDImplementation() {
    std::unique_ptr<SIMDInterface> impl = createSIMDImplementation(SIMDDetector::detectBestSIMD());
    if (!impl) {
        impl = std::make_unique<ScalarNewlineCounter>();
    }
    return impl;
}

const SIMDInterface& SIMDInterface::getInstance() {
    static const std::unique_ptr<SIMDInterface> instance = createBestSIMDImplementation();
    return *instance;
}
