#include "simd/impl/sse_impl.h"
#include "simd/impl/simd_constants.h"

#if defined(__x86_64__) || defined(_M_X64) || defined(__i386__) || defined(_M_IX86)
#include <emmintrin.h>

uint64_t SSENewlineCounter::countNewlines(const char* text, size_t textLen) const {
    size_t i = 0;
    uint64_t count = 0;
    const __m128i nl = _mm_set1_epi8(simd_constants::CHAR_NEWLINE);

    // Process 16 bytes at a time
    while (i + simd_constants::SSE_LANES <= textLen) {
        __m128i chunk = _mm_loadu_si128(reinterpret_cast<const __m128i*>(text + i));
        uint32_t mask = static_cast<uint32_t>(_mm_movemask_epi8(_mm_cmpeq_epi8(chunk, nl)));
        count += static_cast<uint64_t>(__builtin_popcount(mask));
        i += simd_constants::SSE_LANES;
    }

    // Process remaining characters one by one
    count += countNewlinesScalar(text + i, textLen - i);
    return count;
}

size_t SSENewlineCounter::laneWidth() const {
    return simd_constants::SSE_LANES;
}

#endif
