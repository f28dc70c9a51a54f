#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include "count/mode_selector.h"
#include "io/backend_factory.h"
#include "io/parallel_file_scanner.h"
#include "simd/simd_detect.h"
#include "simd/simd_interface.h"
#include "text/locale_resolver.h"

namespace {

struct Options {
    bool show_lines = false;
    bool show_words = false;
    bool show_bytes = false;
    bool show_chars = false;
    bool time_it = false;
    bool verbose = false;

    bool anySelected() const {
        return show_lines || show_words || show_bytes || show_chars;
    }
};

void printUsage() {
    std::cerr << "Usage: turbo_wc [-c|-m] [-lwtv] [file ...]" << std::endl;
}

void printCounts(const Counts& counts, const char* name, const Options& opts) {
    if (opts.show_lines) std::cout << std::setw(8) << counts.lines << ' ';
    if (opts.show_words) std::cout << std::setw(7) << counts.words << ' ';
    if (opts.show_chars) {
        std::cout << std::setw(7) << counts.chars;
    } else if (opts.show_bytes) {
        std::cout << std::setw(7) << counts.bytes;
    }
    if (name != nullptr) {
        std::cout << ' ' << name;
    }
    std::cout << '\n';
}

}

int main(int argc, char* argv[]) {
    Options opts;
    std::vector<std::string> paths;

    for (int i = 1; i < argc; i++) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "--") == 0) {
            for (int j = i + 1; j < argc; j++) paths.emplace_back(argv[j]);
            break;
        }
        if (arg[0] != '-' || arg[1] == '\0') {
            paths.emplace_back(arg);
            continue;
        }
        for (const char* ch = arg + 1; *ch != '\0'; ch++) {
            switch (*ch) {
                case 'l': opts.show_lines = true; break;
                case 'w': opts.show_words = true; break;
                case 'c': opts.show_bytes = true; opts.show_chars = false; break;
                case 'm': opts.show_chars = true; opts.show_bytes = false; break;
                case 't': opts.time_it = true; break;
                case 'v': opts.verbose = true; break;
                default:
                    std::cerr << "turbo_wc: invalid option -- '" << *ch << "'" << std::endl;
                    printUsage();
                    return 1;
            }
        }
    }

    if (!opts.anySelected()) {
        opts.show_lines = true;
        opts.show_words = true;
        opts.show_bytes = true;
    }

    const bool read_stdin_only = paths.empty();
    if (read_stdin_only) {
        paths.emplace_back(ParallelFileScanner::STDIN_PATH);
    }

    ScanRequest request;
    request.paths = paths;
    request.mode = ModeSelector::selectMode(opts.show_lines, opts.show_words,
                                            opts.show_bytes, opts.show_chars);

    ScanOptions scan_options;
    ParallelFileScanner scanner(scan_options);

    if (opts.verbose) {
        std::cerr << "simd: " << SIMDInterface::getInstance().name()
                  << " (cpu " << SIMDDetector::toString(SIMDDetector::detectBestSIMD()) << ")\n"
                  << "io: " << BackendFactory::describe(scan_options.backend) << "\n"
                  << "mode: " << ModeSelector::toString(request.mode) << "\n"
                  << "locale: "
                  << (LocaleResolver::resolveMode() == LocaleMode::Unicode ? "utf-8" : "c")
                  << "\n"
                  << "workers: " << scanner.workerCount(paths.size()) << std::endl;
    }

    const auto start = std::chrono::steady_clock::now();
    const ScanResponse response = scanner.scan(request);
    const auto elapsed = std::chrono::steady_clock::now() - start;

    size_t file_count = 0;
    for (size_t i = 0; i < paths.size(); i++) {
        const FileResult& result = response.perFile[i];
        if (result.duplicateStdin) continue;
        if (result.error) {
            std::cerr << "turbo_wc: " << result.error->path << ": "
                      << describeFileError(result.error->kind) << std::endl;
            continue;
        }
        printCounts(result.counts, read_stdin_only ? nullptr : paths[i].c_str(), opts);
        file_count++;
    }

    if (file_count > 1) {
        printCounts(response.total, "total", opts);
    }

    if (opts.time_it) {
        const double ms = std::chrono::duration<double, std::milli>(elapsed).count();
        std::cout << "Time: " << std::fixed << std::setprecision(3) << ms
                  << "ms, Files: " << file_count << '\n';
    }

    std::cout.flush();
    return response.anyError ? 1 : 0;
}
