#pragma once

#include <cstddef>
#include "simd/simd_interface.h"

class AVX2NewlineCounter : public SIMDInterface {
    public:
        uint64_t countNewlines(const char* text, size_t textLen) const override;
        size_t laneWidth() const override;
        const char* name() const override { return "avx2"; }
    };
