#pragma once

#include <cstddef>
#include <cstdint>

struct DecodeResult {
    char32_t codepoint;  // decoded value, or Utf8Decoder::kReplacementCodepoint
    size_t length;       // bytes consumed, always >= 1
    bool incomplete;     // slice ended inside an otherwise valid sequence
};

/**
 * Single-step UTF-8 decoder with replacement-on-error semantics.
 *
 * Malformed input never fails: every ill-formed subsequence becomes one
 * replacement unit. The unit covers the lead byte plus the continuation bytes
 * that were still acceptable at their position, so the first byte that broke
 * the sequence is re-examined as the start of the next unit.
 *
 * Overlong forms and UTF-16 surrogates are rejected at the second byte by
 * narrowing its accepted range (E0 A0..BF, ED 80..9F, F0 90..BF, F4 80..8F);
 * C0, C1 and F5..FF can never start a sequence.
 */
class Utf8Decoder {
public:
    static constexpr char32_t kReplacementCodepoint = 0xFFFD;
    static constexpr size_t kMaxSequenceLength = 4;

    // `len` must be >= 1.
    static DecodeResult decode(const uint8_t* data, size_t len);

    // Total length announced by a lead byte, 0 when it cannot start a sequence.
    static size_t sequenceLength(uint8_t lead);

    static bool isContinuation(uint8_t byte) {
        return (byte & 0xC0) == 0x80;
    }
};
