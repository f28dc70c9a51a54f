#include "simd/impl/avx512_impl.h"
#include "simd/impl/simd_constants.h"

#if defined(__x86_64__) || defined(_M_X64)
#include <immintrin.h>

uint64_t AVX512NewlineCounter::countNewlines(const char* text, size_t textLen) const {
    size_t i = 0;
    uint64_t count = 0;
    const __m512i nl = _mm512_set1_epi8(simd_constants::CHAR_NEWLINE);

    // Process 64 bytes at a time
    while (i + simd_constants::AVX512_LANES <= textLen) {
        __m512i chunk = _mm512_loadu_si512(reinterpret_cast<const void*>(text + i));
        __mmask64 nl_mask = _mm512_cmpeq_epi8_mask(chunk, nl);
        count += static_cast<uint64_t>(__builtin_popcountll(nl_mask));
        i += simd_constants::AVX512_LANES;
    }

    // Masked load for the tail (rest < 64): lanes past textLen are never touched
    size_t rest = textLen - i;
    if (rest > 0) {
        __mmask64 live = (1ULL << rest) - 1;
        __m512i chunk = _mm512_maskz_loadu_epi8(live, text + i);
        __mmask64 nl_mask = _mm512_mask_cmpeq_epi8_mask(live, chunk, nl);
        count += static_cast<uint64_t>(__builtin_popcountll(nl_mask));
    }

    return count;
}

size_t AVX512NewlineCounter::laneWidth() const {
    return simd_constants::AVX512_LANES;
}

#endif
