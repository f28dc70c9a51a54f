#pragma once

#include <string>

#include "count/counts.h"
#include "io/file_result.h"
#include "text/whitespace_classifier.h"

enum class BackendKind {
    Auto,   // io_uring when it initializes, otherwise Sync
    Sync,
    Uring
};

/**
 * Capability interface for "open this path and count it". Each instance owns
 * its own buffers (and ring, if any) and is used by one thread at a time.
 */
class IOBackend {
public:
    virtual ~IOBackend() = default;

    // Open failures and read errors come back in FileResult::error.
    virtual FileResult openAndCount(const std::string& path, CountMode mode, WhitespaceMode wsMode) = 0;

    // Counts an already-open, possibly unseekable descriptor (stdin) to EOF.
    // The descriptor is neither closed nor rewound.
    virtual FileResult countStream(int fd, const std::string& label, CountMode mode, WhitespaceMode wsMode) = 0;

    virtual const char* name() const = 0;
};
