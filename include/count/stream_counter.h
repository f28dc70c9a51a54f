#pragma once

#include <cstddef>

#include "count/counting_state_machine.h"

// Accumulates the chunks of one stream; every backend drives one per file.
class StreamCounter {
public:
    StreamCounter(CountMode mode, WhitespaceMode wsMode)
        : mode_(mode), ws_mode_(wsMode) {}

    void consume(const char* data, size_t len) {
        state_ = CountingStateMachine::countChunk(data, len, state_, mode_, ws_mode_);
    }

    Counts finish() {
        state_ = CountingStateMachine::finish(state_, ws_mode_);
        return state_.counts;
    }

    const CountState& state() const { return state_; }

private:
    CountMode mode_;
    WhitespaceMode ws_mode_;
    CountState state_;
};
