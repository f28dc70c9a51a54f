#include "io/parallel_file_scanner.h"
#include "count/mode_selector.h"
#include "io/backend_factory.h"
#include "text/locale_resolver.h"

#include <algorithm>
#include <atomic>
#include <exception>
#include <system_error>
#include <thread>
#include <utility>

ParallelFileScanner::ParallelFileScanner(ScanOptions options)
    : options_(options) {
    const BackendKind kind = options_.backend;
    const size_t buffer_size = options_.bufferSize;
    provider_ = [kind, buffer_size]() { return BackendFactory::create(kind, buffer_size); };
}

ParallelFileScanner::ParallelFileScanner(ScanOptions options, BackendProvider provider)
    : options_(options), provider_(std::move(provider)) {}

size_t ParallelFileScanner::workerCount(size_t jobs) const {
    size_t workers = options_.workers;
    if (workers == 0) {
        workers = std::max<size_t>(1, std::thread::hardware_concurrency());
    }
    return std::max<size_t>(1, std::min(workers, jobs));
}

WhitespaceMode ParallelFileScanner::whitespaceMode() const {
    if (options_.whitespaceMode) return *options_.whitespaceMode;
    return whitespaceModeFor(LocaleResolver::resolveMode());
}

ScanResponse ParallelFileScanner::scan(const ScanRequest& request) const {
    ModeSelector::validate(request.mode);

    const std::vector<std::string>& paths = request.paths;
    const CountMode mode = request.mode;
    const WhitespaceMode ws_mode = whitespaceMode();

    ScanResponse response;
    response.perFile.resize(paths.size());

    // Backend for work done on the calling thread, created on first use.
    // Failures are isolated per input exactly as in the pool below.
    std::unique_ptr<IOBackend> local;
    auto countLocally = [&](size_t idx, bool fromStdin) {
        try {
            if (!local) local = provider_();
            response.perFile[idx] = fromStdin
                ? local->countStream(options_.stdinFd, paths[idx], mode, ws_mode)
                : local->openAndCount(paths[idx], mode, ws_mode);
        } catch (const std::exception&) {
            response.perFile[idx] = FileResult::failure(paths[idx], FileErrorKind::IOError);
        }
    };

    // stdin first, on this thread, exactly once
    std::vector<size_t> jobs;
    jobs.reserve(paths.size());
    bool stdin_read = false;
    for (size_t i = 0; i < paths.size(); i++) {
        if (paths[i] != STDIN_PATH) {
            jobs.push_back(i);
            continue;
        }
        if (stdin_read) {
            response.perFile[i].duplicateStdin = true;
            continue;
        }
        countLocally(i, true);
        stdin_read = true;
    }

    const size_t workers = workerCount(jobs.size());
    if (jobs.size() <= 1 || workers == 1) {
        for (size_t idx : jobs) {
            countLocally(idx, false);
        }
    } else {
        std::atomic<size_t> cursor{0};
        std::vector<FileResult>& results = response.perFile;

        auto worker = [&]() {
            std::unique_ptr<IOBackend> backend;
            size_t k;
            while ((k = cursor.fetch_add(1, std::memory_order_relaxed)) < jobs.size()) {
                const size_t idx = jobs[k];
                try {
                    if (!backend) backend = provider_();
                    results[idx] = backend->openAndCount(paths[idx], mode, ws_mode);
                } catch (const std::exception&) {
                    // e.g. bad_alloc for the read buffers: reported against this input
                    results[idx] = FileResult::failure(paths[idx], FileErrorKind::IOError);
                }
            }
        };

        std::vector<std::thread> threads;
        threads.reserve(workers);
        for (size_t t = 0; t < workers; t++) {
            try {
                threads.emplace_back(worker);
            } catch (const std::system_error&) {
                break;  // run with the threads we got
            }
        }
        if (threads.empty()) {
            worker();
        }
        for (auto& thread : threads) {
            thread.join();
        }
    }

    for (const FileResult& result : response.perFile) {
        if (result.error) {
            response.anyError = true;
        } else {
            response.total += result.counts;
        }
    }

    return response;
}
