#pragma once

#include "simd/simd_interface.h"

// Needs AVX512BW for byte compares into a 64-bit mask.
class AVX512NewlineCounter : public SIMDInterface {
public:
    uint64_t countNewlines(const char* text, size_t textLen) const override;
    size_t laneWidth() const override;
    const char* name() const override { return "avx512bw"; }
};
