#include "io/read_buffer.h"

#include <cstdlib>
#include <new>

namespace {

size_t roundUp(size_t value, size_t alignment) {
    return (value + alignment - 1) / alignment * alignment;
}

}

ReadBuffer::ReadBuffer(size_t buffer_size)
    : buffer_size(buffer_size == 0 ? DEFAULT_BUFFER_SIZE : buffer_size),
      buffer(nullptr) {
    // aligned_alloc wants a size that is a multiple of the alignment
    buffer = static_cast<char*>(std::aligned_alloc(ALIGNMENT, roundUp(this->buffer_size, ALIGNMENT)));
    if (buffer == nullptr) {
        throw std::bad_alloc();
    }
}

ReadBuffer::~ReadBuffer() {
    std::free(buffer);
}
