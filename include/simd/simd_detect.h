#pragma once

#include <cstdint>

enum class SIMDType {
    AVX512,
    AVX2,
    SSE2,
    NEON,  // For ARM
    SCALAR,
    UNKNOWN
};

class SIMDDetector {
public:
    static SIMDType detectBestSIMD();

    // True when the running CPU (and OS register state) can execute `type`.
    static bool isSupported(SIMDType type);

    static const char* toString(SIMDType type);
    static void printBestSIMD();
};
