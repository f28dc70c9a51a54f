#pragma once

#include "io/posix_backend.h"

// Plain blocking read(2) loop. Always available.
class SyncBackend : public PosixBackend {
public:
    explicit SyncBackend(size_t bufferSize = ReadBuffer::DEFAULT_BUFFER_SIZE)
        : PosixBackend(bufferSize) {}

    const char* name() const override { return "sync"; }

protected:
    int readAll(int fd, const struct stat& st, StreamCounter& counter) override;
};
