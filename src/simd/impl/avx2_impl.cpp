#include "simd/impl/avx2_impl.h"
#include "simd/impl/simd_constants.h"

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#include <immintrin.h>

uint64_t AVX2NewlineCounter::countNewlines(const char* text, size_t textLen) const {
    size_t i = 0;
    uint64_t count = 0;
    const __m256i nl = _mm256_set1_epi8(simd_constants::CHAR_NEWLINE);

    // Two independent 32-byte compares per iteration keep both load ports busy
    while (i + 2 * simd_constants::AVX2_LANES <= textLen) {
        __m256i a = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(text + i));
        __m256i b = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(text + i + simd_constants::AVX2_LANES));

        uint32_t mask_a = static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(a, nl)));
        uint32_t mask_b = static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(b, nl)));

        count += static_cast<uint64_t>(__builtin_popcount(mask_a));
        count += static_cast<uint64_t>(__builtin_popcount(mask_b));
        i += 2 * simd_constants::AVX2_LANES;
    }

    if (i + simd_constants::AVX2_LANES <= textLen) {
        __m256i chunk = _mm256_loadu_si256(reinterpret_cast<const __m256i*>(text + i));
        uint32_t mask = static_cast<uint32_t>(_mm256_movemask_epi8(_mm256_cmpeq_epi8(chunk, nl)));
        count += static_cast<uint64_t>(__builtin_popcount(mask));
        i += simd_constants::AVX2_LANES;
    }

    count += countNewlinesScalar(text + i, textLen - i);
    return count;
}

size_t AVX2NewlineCounter::laneWidth() const {
    return simd_constants::AVX2_LANES;
}

#endif
