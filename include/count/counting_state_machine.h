#pragma once

#include <cstddef>
#include <cstdint>

#include "count/counts.h"
#include "text/whitespace_classifier.h"

class CountingStateMachine {
public:
    // Global config - route newline counting through the SIMD dispatcher or not
    static bool UseSIMD;

    /**
     * Feeds one chunk and returns the state to pass as `prior` for the next
     * chunk of the same stream. Splitting a stream at any offset, including
     * inside a UTF-8 sequence, yields the same totals as one call over the
     * whole stream, once finish() has run on both.
     *
     * Throws std::invalid_argument for a CountMode outside the enum.
     */
    static CountState countChunk(const char* buf, size_t len, CountState prior,
                                 CountMode mode, WhitespaceMode wsMode);

    // Resolves a truncated trailing sequence as one replacement unit.
    static CountState finish(CountState state, WhitespaceMode wsMode);

    // Fresh state, one chunk, finish.
    static Counts countBuffer(const char* buf, size_t len, CountMode mode, WhitespaceMode wsMode);

    static uint64_t countNewlines(const char* buf, size_t len);

private:
    static CountState countBytesMode(const uint8_t* buf, size_t len, CountState state,
                                     WhitespaceMode wsMode);
    static CountState countUnicodeMode(const uint8_t* buf, size_t len, CountState state);

    // Counts one decoded unit that is not a newline.
    static void step(CountState& state, bool isSpace) {
        if (isSpace) {
            state.in_word = false;
        } else if (!state.in_word) {
            state.in_word = true;
            state.counts.words++;
        }
    }
};
