#include "simd/impl/neon_impl.h"
#include "simd/impl/simd_constants.h"

#if defined(__aarch64__)
#include <arm_neon.h>

uint64_t NEONNewlineCounter::countNewlines(const char* text, size_t textLen) const {
    size_t i = 0;
    uint64_t count = 0;
    const uint8x16_t nl = vdupq_n_u8(static_cast<uint8_t>(simd_constants::CHAR_NEWLINE));

    // Process 16 bytes at a time (NEON processes 128-bit vectors)
    while (i + simd_constants::NEON_LANES <= textLen) {
        uint8x16_t chunk = vld1q_u8(reinterpret_cast<const uint8_t*>(text + i));

        // 0xFF per match, shifted down to 1 and summed across lanes (at most 16)
        uint8x16_t ones = vshrq_n_u8(vceqq_u8(chunk, nl), 7);
        count += vaddvq_u8(ones);
        i += simd_constants::NEON_LANES;
    }

    count += countNewlinesScalar(text + i, textLen - i);
    return count;
}

size_t NEONNewlineCounter::laneWidth() const {
    return simd_constants::NEON_LANES;
}

#endif
