#pragma once

#include <algorithm>
#include <atomic>
#include <map>
#include <string>

#include "count/stream_counter.h"
#include "io/io_backend.h"

// In-memory IOBackend: paths map to contents or to a forced error kind.
class MemoryBackend : public IOBackend {
public:
    struct Store {
        std::map<std::string, std::string> files;
        std::map<std::string, FileErrorKind> errors;
        std::string stdinData;
        std::atomic<int> opened{0};
        std::atomic<int> stdinReads{0};
    };

    explicit MemoryBackend(Store& store, size_t chunkSize = 3)
        : store_(store), chunk_size_(chunkSize) {}

    FileResult openAndCount(const std::string& path, CountMode mode, WhitespaceMode wsMode) override {
        store_.opened++;
        auto err = store_.errors.find(path);
        if (err != store_.errors.end()) {
            return FileResult::failure(path, err->second);
        }
        auto file = store_.files.find(path);
        if (file == store_.files.end()) {
            return FileResult::failure(path, FileErrorKind::NotFound);
        }
        return FileResult::success(feed(file->second, mode, wsMode));
    }

    FileResult countStream(int, const std::string&, CountMode mode, WhitespaceMode wsMode) override {
        store_.stdinReads++;
        return FileResult::success(feed(store_.stdinData, mode, wsMode));
    }

    const char* name() const override { return "memory"; }

private:
    Counts feed(const std::string& data, CountMode mode, WhitespaceMode wsMode) {
        StreamCounter counter(mode, wsMode);
        for (size_t pos = 0; pos < data.size(); pos += chunk_size_) {
            const size_t n = std::min(chunk_size_, data.size() - pos);
            counter.consume(data.data() + pos, n);
        }
        return counter.finish();
    }

    Store& store_;
    size_t chunk_size_;
};
