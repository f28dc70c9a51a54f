#include "simd/impl/scalar_impl.h"
#include "simd/impl/simd_constants.h"
#include <cstring>
#include <cstdint>

uint64_t countNewlinesScalar(const char* text, size_t textLen) {
    uint64_t count = 0;
    for (size_t i = 0; i < textLen; i++) {
        if (text[i] == simd_constants::CHAR_NEWLINE) count++;
    }
    return count;
}

uint64_t ScalarNewlineCounter::countNewlines(const char* text, size_t textLen) const {
    using namespace simd_constants;

    const char* ptr = text;
    const char* end = text + textLen;
    uint64_t count = 0;

    const uint64_t newlines = SWAR_ONES * static_cast<unsigned char>(CHAR_NEWLINE);
    const uint64_t low_bits = ~SWAR_HIGH_BITS;

    // Process 8 bytes at a time
    while (ptr + SCALAR_WORD_BYTES <= end) {
        uint64_t chunk;
        memcpy(&chunk, ptr, sizeof(chunk)); // Avoid unaligned access issues

        // Bytes equal to '\n' become zero; flag exactly those with their high bit.
        // (x & 0x7F) + 0x7F never carries into the neighbouring byte.
        uint64_t x = chunk ^ newlines;
        uint64_t nonzero = ((x & low_bits) + low_bits) | x;
        uint64_t zero_mask = ~nonzero & SWAR_HIGH_BITS;

        count += static_cast<uint64_t>(__builtin_popcountll(zero_mask));
        ptr += SCALAR_WORD_BYTES;
    }

    count += countNewlinesScalar(ptr, static_cast<size_t>(end - ptr));
    return count;
}

size_t ScalarNewlineCounter::laneWidth() const {
    return simd_constants::SCALAR_WORD_BYTES;
}
