#pragma once

#include "simd/simd_interface.h"

// Scalar fallback implementation (no SIMD)
class ScalarNewlineCounter : public SIMDInterface {
public:
    uint64_t countNewlines(const char* text, size_t textLen) const override;
    size_t laneWidth() const override;
    const char* name() const override { return "scalar"; }
};
