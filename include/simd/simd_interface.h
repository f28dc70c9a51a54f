#pragma once
#include <cstddef>
#include <cstdint>

class SIMDInterface {
public:
    virtual ~SIMDInterface() = default;

    // Number of '\n' bytes in text[0, textLen).
    virtual uint64_t countNewlines(const char* text, size_t textLen) const = 0;

    // Bytes compared per vector step; the tail shorter than this is scanned byte by byte.
    virtual size_t laneWidth() const = 0;
    virtual const char* name() const = 0;

    static const SIMDInterface& getInstance();
};

// Reference implementation every vector path must agree with.
uint64_t countNewlinesScalar(const char* text, size_t textLen);
