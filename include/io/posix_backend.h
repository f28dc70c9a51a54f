#pragma once

#include <sys/stat.h>
#include <sys/types.h>

#include "count/stream_counter.h"
#include "io/io_backend.h"
#include "io/read_buffer.h"

/**
 * Shared open/stat/dispatch logic for descriptor-based backends. Subclasses
 * only decide how bytes are pulled from an open descriptor.
 */
class PosixBackend : public IOBackend {
public:
    // Regular files at least this large get a sequential read-ahead hint.
    static constexpr off_t SEQUENTIAL_HINT_BYTES = 1 << 20;

    explicit PosixBackend(size_t bufferSize);

    FileResult openAndCount(const std::string& path, CountMode mode, WhitespaceMode wsMode) override;
    FileResult countStream(int fd, const std::string& label, CountMode mode, WhitespaceMode wsMode) override;

    // BytesOnly may be answered from st_size only for regular files whose
    // descriptor is also seekable.
    static bool trustSizeMetadata(int fd, const struct stat& st);

protected:
    // Reads `fd` to EOF into `counter`. Returns 0 or an errno value.
    virtual int readAll(int fd, const struct stat& st, StreamCounter& counter) = 0;

    // read(2) loop from the current position; works on pipes and terminals.
    int readBlocking(int fd, StreamCounter& counter);

    // pread(2) loop starting at `offset`; leaves the file position alone.
    int readBlockingFrom(int fd, off_t offset, StreamCounter& counter);

private:
    ReadBuffer buffer_;
};
