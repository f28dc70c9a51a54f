#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

/**
 * Line/word/byte/char tallies. Element-wise addition with the all-zero value
 * as identity, so partial results can be summed in any order.
 */
struct Counts {
    uint64_t lines = 0;
    uint64_t words = 0;
    uint64_t bytes = 0;
    uint64_t chars = 0;

    Counts& operator+=(const Counts& other) {
        lines += other.lines;
        words += other.words;
        bytes += other.bytes;
        chars += other.chars;
        return *this;
    }

    friend Counts operator+(Counts lhs, const Counts& rhs) {
        lhs += rhs;
        return lhs;
    }

    friend bool operator==(const Counts& a, const Counts& b) {
        return a.lines == b.lines && a.words == b.words &&
               a.bytes == b.bytes && a.chars == b.chars;
    }

    friend bool operator!=(const Counts& a, const Counts& b) {
        return !(a == b);
    }
};

enum class CountMode : uint8_t {
    BytesOnly,
    LinesOnly,
    LinesBytes,
    Full
};

/**
 * Boundary state threaded between successive chunks of one stream.
 *
 * `pending` holds the start of a multibyte sequence cut off by the chunk
 * edge (Unicode mode only); those bytes are already included in
 * counts.bytes, but their character has not been classified yet.
 */
struct CountState {
    Counts counts;
    bool in_word = false;
    std::array<uint8_t, 3> pending{};
    uint8_t pending_len = 0;
};
