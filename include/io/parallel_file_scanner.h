#pragma once

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "count/counts.h"
#include "io/file_result.h"
#include "io/io_backend.h"
#include "io/read_buffer.h"
#include "text/whitespace_classifier.h"

struct ScanRequest {
    std::vector<std::string> paths;  // "-" reads standard input
    CountMode mode = CountMode::Full;
};

struct ScanResponse {
    std::vector<FileResult> perFile;  // same order and length as ScanRequest::paths
    Counts total;                     // successful results only
    bool anyError = false;
};

struct ScanOptions {
    size_t workers = 0;  // 0: hardware concurrency
    size_t bufferSize = ReadBuffer::DEFAULT_BUFFER_SIZE;
    BackendKind backend = BackendKind::Auto;
    std::optional<WhitespaceMode> whitespaceMode;  // unset: from LocaleResolver
    int stdinFd = 0;
};

/**
 * Counts a batch of inputs. A single input runs on the calling thread; larger
 * batches go to a bounded pool where every worker owns one backend and pulls
 * the next input index from a shared cursor. Results land in the slot of the
 * input's position, independent of completion order.
 *
 * Standard input is consumed at most once per scan: the first "-" receives
 * its counts, later "-" entries get zero counts with duplicateStdin set.
 * A failing input never stops the rest of the batch.
 */
class ParallelFileScanner {
public:
    static constexpr const char* STDIN_PATH = "-";

    using BackendProvider = std::function<std::unique_ptr<IOBackend>()>;

    explicit ParallelFileScanner(ScanOptions options = ScanOptions());
    ParallelFileScanner(ScanOptions options, BackendProvider provider);

    // Throws std::invalid_argument for an out-of-range request.mode.
    ScanResponse scan(const ScanRequest& request) const;

    size_t workerCount(size_t jobs) const;
    WhitespaceMode whitespaceMode() const;

private:
    ScanOptions options_;
    BackendProvider provider_;
};
