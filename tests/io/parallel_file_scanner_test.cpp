#include "io/parallel_file_scanner.h"
#include "io/memory_backend.h"
#include <gtest/gtest.h>
#include <fstream>
#include <new>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

class ParallelFileScannerTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/turbo_wc_scan_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir = tmpl;
    }

    void TearDown() override {
        for (const auto& path : created) {
            ::unlink(path.c_str());
        }
        ::rmdir(dir.c_str());
    }

    std::string writeFile(const std::string& name, const std::string& content) {
        const std::string path = dir + "/" + name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        created.push_back(path);
        return path;
    }

    ScanOptions options(size_t workers) {
        ScanOptions opts;
        opts.workers = workers;
        opts.backend = BackendKind::Sync;
        opts.whitespaceMode = WhitespaceMode::Unicode;
        return opts;
    }

    ParallelFileScanner memoryScanner(MemoryBackend::Store& store, size_t workers) {
        return ParallelFileScanner(options(workers), [&store]() {
            return std::unique_ptr<IOBackend>(new MemoryBackend(store));
        });
    }

    std::string dir;
    std::vector<std::string> created;
};

TEST_F(ParallelFileScannerTest, PartialFailureKeepsGoing) {
    const std::string a = writeFile("a.txt", "hello world\n");
    const std::string b = writeFile("b.txt", "one\ntwo\nthree\n");
    const std::string missing = dir + "/missing.txt";

    for (size_t workers : {1u, 4u}) {
        ParallelFileScanner scanner(options(workers));
        const ScanResponse response = scanner.scan({{a, missing, b}, CountMode::Full});

        ASSERT_EQ(response.perFile.size(), 3u);
        EXPECT_TRUE(response.perFile[0].ok());
        ASSERT_FALSE(response.perFile[1].ok());
        EXPECT_EQ(response.perFile[1].error->kind, FileErrorKind::NotFound);
        EXPECT_EQ(response.perFile[1].error->path, missing);
        EXPECT_TRUE(response.perFile[2].ok());

        EXPECT_TRUE(response.anyError);
        EXPECT_EQ(response.total.lines, 4u);
        EXPECT_EQ(response.total.words, 5u);
        EXPECT_EQ(response.total.bytes, 26u);
    }
}

TEST_F(ParallelFileScannerTest, ResultsFollowInputOrder) {
    MemoryBackend::Store store;
    std::vector<std::string> paths;
    for (int i = 0; i < 200; i++) {
        const std::string name = "f" + std::to_string(i);
        store.files[name] = std::string(static_cast<size_t>(i), '\n');
        paths.push_back(name);
    }

    ParallelFileScanner scanner = memoryScanner(store, 8);
    const ScanResponse response = scanner.scan({paths, CountMode::LinesOnly});

    ASSERT_EQ(response.perFile.size(), paths.size());
    for (size_t i = 0; i < paths.size(); i++) {
        EXPECT_EQ(response.perFile[i].counts.lines, i) << "slot " << i;
    }
    EXPECT_EQ(response.total.lines, 199u * 200u / 2);
    EXPECT_FALSE(response.anyError);
    EXPECT_EQ(store.opened.load(), 200);
}

TEST_F(ParallelFileScannerTest, TotalSkipsInjectedErrors) {
    MemoryBackend::Store store;
    store.files["ok"] = "x y z\n";
    store.errors["denied"] = FileErrorKind::AccessDenied;
    store.errors["io"] = FileErrorKind::IOError;

    ParallelFileScanner scanner = memoryScanner(store, 3);
    const ScanResponse response = scanner.scan({{"denied", "ok", "io"}, CountMode::Full});

    EXPECT_EQ(response.perFile[0].error->kind, FileErrorKind::AccessDenied);
    EXPECT_EQ(response.perFile[2].error->kind, FileErrorKind::IOError);
    EXPECT_EQ(response.perFile[0].counts, Counts{});
    EXPECT_EQ(response.total, response.perFile[1].counts);
    EXPECT_EQ(response.total.words, 3u);
    EXPECT_TRUE(response.anyError);
}

TEST_F(ParallelFileScannerTest, StdinReadOnce) {
    MemoryBackend::Store store;
    store.stdinData = "from stdin\n";
    store.files["file"] = "abc\n";

    ParallelFileScanner scanner = memoryScanner(store, 2);
    const ScanResponse response = scanner.scan({{"-", "file", "-"}, CountMode::Full});

    EXPECT_EQ(store.stdinReads.load(), 1);
    EXPECT_EQ(response.perFile[0].counts.words, 2u);
    EXPECT_FALSE(response.perFile[0].duplicateStdin);
    EXPECT_TRUE(response.perFile[2].duplicateStdin);
    EXPECT_TRUE(response.perFile[2].ok());
    EXPECT_EQ(response.perFile[2].counts, Counts{});
    EXPECT_EQ(response.total.lines, 2u);
}

TEST_F(ParallelFileScannerTest, StdinFromDescriptor) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const std::string payload = "piped input here\n";
    ASSERT_EQ(::write(fds[1], payload.data(), payload.size()), static_cast<ssize_t>(payload.size()));
    ::close(fds[1]);

    ScanOptions opts = options(1);
    opts.stdinFd = fds[0];
    ParallelFileScanner scanner(opts);
    const ScanResponse response = scanner.scan({{"-"}, CountMode::Full});
    ::close(fds[0]);

    ASSERT_TRUE(response.perFile[0].ok());
    EXPECT_EQ(response.total.words, 3u);
    EXPECT_EQ(response.total.bytes, payload.size());
}

// A backend that cannot be built fails its inputs, never the whole scan
TEST_F(ParallelFileScannerTest, BackendCreationFailureIsPerFile) {
    for (size_t workers : {1u, 4u}) {
        ParallelFileScanner scanner(options(workers), []() -> std::unique_ptr<IOBackend> {
            throw std::bad_alloc();
        });
        const ScanRequest request{{"a", "-", "b"}, CountMode::Full};
        ScanResponse response;
        ASSERT_NO_THROW(response = scanner.scan(request));

        ASSERT_EQ(response.perFile.size(), 3u);
        for (size_t i = 0; i < response.perFile.size(); i++) {
            ASSERT_FALSE(response.perFile[i].ok()) << "slot " << i << " workers " << workers;
            EXPECT_EQ(response.perFile[i].error->kind, FileErrorKind::IOError);
        }
        EXPECT_EQ(response.perFile[1].error->path, "-");
        EXPECT_TRUE(response.anyError);
        EXPECT_EQ(response.total, Counts{});
    }
}

TEST_F(ParallelFileScannerTest, EmptyRequest) {
    ParallelFileScanner scanner(options(4));
    const ScanResponse response = scanner.scan({{}, CountMode::Full});
    EXPECT_TRUE(response.perFile.empty());
    EXPECT_EQ(response.total, Counts{});
    EXPECT_FALSE(response.anyError);
}

TEST_F(ParallelFileScannerTest, WorkerCountBounded) {
    ParallelFileScanner scanner(options(4));
    EXPECT_EQ(scanner.workerCount(1), 1u);
    EXPECT_EQ(scanner.workerCount(3), 3u);
    EXPECT_EQ(scanner.workerCount(100), 4u);
    EXPECT_EQ(scanner.workerCount(0), 1u);
    EXPECT_GE(ParallelFileScanner(options(0)).workerCount(100), 1u);
}

TEST_F(ParallelFileScannerTest, InvalidModeThrows) {
    ParallelFileScanner scanner(options(1));
    EXPECT_THROW(scanner.scan({{"x"}, static_cast<CountMode>(7)}), std::invalid_argument);
}
