#pragma once

#include <cstddef>
#include <memory>

#include "io/io_backend.h"
#include "io/read_buffer.h"

class BackendFactory {
public:
    // Global config - false makes every request behave as if the ring failed
    // to initialize
    static bool AllowUring;

    // Auto and Uring both try io_uring first and silently fall back to the
    // blocking backend when the ring cannot be set up.
    static std::unique_ptr<IOBackend> create(BackendKind kind,
                                             size_t bufferSize = ReadBuffer::DEFAULT_BUFFER_SIZE);

    // Builds and discards a ring to see whether this process may use one.
    static bool uringAvailable();

    // Name of the backend create(kind) would hand out.
    static const char* describe(BackendKind kind);

    // Forgets the cached probe result; the next request probes again.
    static void resetUringProbe();
};
