#pragma once

#include <cstddef>

// Page-aligned, fixed-size read buffer owned by a single backend.
class ReadBuffer {
public:
    static constexpr size_t DEFAULT_BUFFER_SIZE = 128 * 1024;
    static constexpr size_t ALIGNMENT = 4096;

    explicit ReadBuffer(size_t buffer_size = DEFAULT_BUFFER_SIZE);

    ~ReadBuffer();

    // No copy or move
    ReadBuffer(const ReadBuffer&) = delete;
    ReadBuffer& operator=(const ReadBuffer&) = delete;
    ReadBuffer(ReadBuffer&&) = delete;
    ReadBuffer& operator=(ReadBuffer&&) = delete;

    char* data() { return buffer; }
    const char* data() const { return buffer; }
    size_t size() const { return buffer_size; }

private:
    size_t buffer_size;
    char* buffer;
};
