#pragma once

#include <memory>
#include "simd/simd_interface.h"
#include "simd/simd_detect.h"

std::unique_ptr<SIMDInterface> createBestSIMDImplementation();

// Returns nullptr when `type` is not built for this architecture.
std::unique_ptr<SIMDInterface> createSIMDImplementation(SIMDType type);
