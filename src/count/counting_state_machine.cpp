#include "count/counting_state_machine.h"
#include "simd/simd_interface.h"
#include "text/utf8_decoder.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

bool CountingStateMachine::UseSIMD = true;

uint64_t CountingStateMachine::countNewlines(const char* buf, size_t len) {
    if (!UseSIMD) return countNewlinesScalar(buf, len);
    return SIMDInterface::getInstance().countNewlines(buf, len);
}

CountState CountingStateMachine::countChunk(const char* buf, size_t len, CountState prior,
                                            CountMode mode, WhitespaceMode wsMode) {
    CountState state = prior;
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(buf);

    switch (mode) {
        case CountMode::BytesOnly:
            state.counts.bytes += len;
            return state;

        case CountMode::LinesOnly:
        case CountMode::LinesBytes:
            // No word tracking on this path; in_word passes through untouched
            state.counts.lines += countNewlines(buf, len);
            state.counts.bytes += len;
            return state;

        case CountMode::Full:
            if (wsMode == WhitespaceMode::Unicode) {
                return countUnicodeMode(bytes, len, state);
            }
            return countBytesMode(bytes, len, state, wsMode);
    }

    throw std::invalid_argument("invalid CountMode " + std::to_string(static_cast<int>(mode)));
}

CountState CountingStateMachine::countBytesMode(const uint8_t* buf, size_t len, CountState state,
                                                WhitespaceMode wsMode) {
    state.counts.bytes += len;
    state.counts.chars += len;

    const bool c_locale = (wsMode == WhitespaceMode::CLocale);
    uint64_t lines = 0;
    for (size_t i = 0; i < len; i++) {
        const uint8_t byte = buf[i];
        lines += (byte == '\n');
        step(state, c_locale ? WhitespaceClassifier::isCLocaleWhitespace(byte)
                             : WhitespaceClassifier::isAsciiWhitespace(byte));
    }
    state.counts.lines += lines;
    return state;
}

CountState CountingStateMachine::countUnicodeMode(const uint8_t* buf, size_t len, CountState state) {
    state.counts.bytes += len;
    size_t i = 0;

    // Complete a sequence left open by the previous chunk
    if (state.pending_len > 0) {
        uint8_t joined[Utf8Decoder::kMaxSequenceLength];
        const size_t held = state.pending_len;
        const size_t take = std::min(len, Utf8Decoder::sequenceLength(state.pending[0]) - held);
        std::memcpy(joined, state.pending.data(), held);
        std::memcpy(joined + held, buf, take);

        const DecodeResult r = Utf8Decoder::decode(joined, held + take);
        if (r.incomplete) {
            // Still short: this chunk was entirely continuation bytes
            std::memcpy(state.pending.data(), joined, held + take);
            state.pending_len = static_cast<uint8_t>(held + take);
            return state;
        }

        // pending is a valid prefix, so the decoder always consumes all of it
        state.pending_len = 0;
        state.counts.chars++;
        step(state, WhitespaceClassifier::isUnicodeWhitespace(r.codepoint));
        i = r.length - held;
    }

    while (i < len) {
        const uint8_t byte = buf[i];

        // ASCII fast path (most common case)
        if (byte < 0x80) {
            state.counts.chars++;
            state.counts.lines += (byte == '\n');
            step(state, WhitespaceClassifier::isAsciiWhitespace(byte));
            i++;
            continue;
        }

        const DecodeResult r = Utf8Decoder::decode(buf + i, len - i);
        if (r.incomplete) {
            // Chunk edge inside a sequence: classify it once the rest arrives
            std::memcpy(state.pending.data(), buf + i, r.length);
            state.pending_len = static_cast<uint8_t>(r.length);
            break;
        }

        state.counts.chars++;
        step(state, WhitespaceClassifier::isUnicodeWhitespace(r.codepoint));
        i += r.length;
    }

    return state;
}

CountState CountingStateMachine::finish(CountState state, WhitespaceMode wsMode) {
    if (state.pending_len == 0) return state;

    // A valid-but-truncated prefix is one malformed unit
    state.pending_len = 0;
    state.counts.chars++;
    step(state, WhitespaceClassifier::isWhitespace(Utf8Decoder::kReplacementCodepoint, wsMode));
    return state;
}

Counts CountingStateMachine::countBuffer(const char* buf, size_t len, CountMode mode,
                                         WhitespaceMode wsMode) {
    return finish(countChunk(buf, len, CountState{}, mode, wsMode), wsMode).counts;
}
