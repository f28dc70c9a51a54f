#include "io/backend_factory.h"
#include "io/sync_backend.h"
#include "count/counting_state_machine.h"
#include "count/mode_selector.h"
#if defined(__linux__)
#include "io/uring_backend.h"
#endif
#include <gtest/gtest.h>
#include <cerrno>
#include <cstdlib>
#include <fcntl.h>
#include <fstream>
#include <memory>
#include <string>
#include <sys/stat.h>
#include <thread>
#include <unistd.h>
#include <vector>

#if defined(__linux__)
// Ring whose submit or completion path starts failing after a number of
// healthy rounds.
class FaultyRing : public UringBackend {
public:
    enum class Fault { SubmitFails, ReadUnsupported };

    static std::unique_ptr<FaultyRing> create(size_t bufferSize, unsigned healthyRounds, Fault fault) {
        std::unique_ptr<FaultyRing> ring(new FaultyRing(bufferSize, healthyRounds, fault));
        if (!ring->setup()) return nullptr;
        return ring;
    }

    unsigned submitCalls() const { return submit_calls_; }

protected:
    int submit(unsigned count) override {
        submit_calls_++;
        if (fault_ == Fault::SubmitFails && submit_calls_ > healthy_rounds_) return EIO;
        return UringBackend::submit(count);
    }

    int waitCompletion(uint64_t& userData, int32_t& res) override {
        const int err = UringBackend::waitCompletion(userData, res);
        // Third slot of the round refuses READ_FIXED; the first two still land
        if (err == 0 && fault_ == Fault::ReadUnsupported && submit_calls_ > healthy_rounds_ && userData == 2) {
            res = -EINVAL;
        }
        return err;
    }

private:
    FaultyRing(size_t bufferSize, unsigned healthyRounds, Fault fault)
        : UringBackend(bufferSize), healthy_rounds_(healthyRounds), fault_(fault) {}

    unsigned healthy_rounds_;
    Fault fault_;
    unsigned submit_calls_ = 0;
};
#endif

class BackendTest : public ::testing::Test {
protected:
    void SetUp() override {
        char tmpl[] = "/tmp/turbo_wc_backend_XXXXXX";
        ASSERT_NE(mkdtemp(tmpl), nullptr);
        dir = tmpl;
    }

    void TearDown() override {
        BackendFactory::AllowUring = true;
        BackendFactory::resetUringProbe();
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

    std::string sample(size_t repeat) {
        std::string text;
        for (size_t i = 0; i < repeat; i++) {
            text += "line ";
            text += std::to_string(i);
            text += " caf\xC3\xA9\xE2\x80\x83na\xC3\xAFve \xF0\x9F\x98\x80\n";
        }
        return text;
    }

    std::string dir;
    std::vector<std::string> created;
};

TEST_F(BackendTest, SyncCountsFile) {
    const std::string path = writeFile("hello.txt", "hello world\n");
    SyncBackend backend;
    const FileResult result = backend.openAndCount(path, CountMode::Full, WhitespaceMode::Unicode);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.counts.lines, 1u);
    EXPECT_EQ(result.counts.words, 2u);
    EXPECT_EQ(result.counts.bytes, 12u);
    EXPECT_EQ(result.counts.chars, 12u);
}

// Tiny buffers put chunk edges inside nearly every multibyte sequence
TEST_F(BackendTest, SmallBuffersMatchWholeBuffer) {
    const std::string text = sample(200);
    const std::string path = writeFile("sample.txt", text);
    const Counts expected = CountingStateMachine::countBuffer(text.data(), text.size(), CountMode::Full,
                                                              WhitespaceMode::Unicode);
    for (size_t size : {1u, 2u, 3u, 5u, 4096u}) {
        SyncBackend backend(size);
        const FileResult result = backend.openAndCount(path, CountMode::Full, WhitespaceMode::Unicode);
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(result.counts, expected) << "buffer size " << size;
    }
}

TEST_F(BackendTest, UringMatchesSync) {
    if (!BackendFactory::uringAvailable()) {
        GTEST_SKIP() << "io_uring not available";
    }
    // Larger than QUEUE_DEPTH buffers so several rounds run
    const std::string text = sample(20000);
    const std::string path = writeFile("big.txt", text);

    auto ring = BackendFactory::create(BackendKind::Uring, 4096);
    ASSERT_STREQ(ring->name(), "io_uring");
    SyncBackend sync;

    for (CountMode mode : {CountMode::LinesOnly, CountMode::LinesBytes, CountMode::Full}) {
        const FileResult a = ring->openAndCount(path, mode, WhitespaceMode::Unicode);
        const FileResult b = sync.openAndCount(path, mode, WhitespaceMode::Unicode);
        ASSERT_TRUE(a.ok());
        ASSERT_TRUE(b.ok());
        EXPECT_EQ(a.counts, b.counts);
    }
    EXPECT_EQ(ring->openAndCount(path, CountMode::Full, WhitespaceMode::Unicode).counts.bytes, text.size());
}

TEST_F(BackendTest, SyncKindAlwaysSync) {
    EXPECT_STREQ(BackendFactory::create(BackendKind::Sync)->name(), "sync");
    EXPECT_STREQ(BackendFactory::describe(BackendKind::Sync), "sync");
    EXPECT_STREQ(BackendFactory::create(BackendKind::Auto)->name(), BackendFactory::describe(BackendKind::Auto));
}

TEST_F(BackendTest, RingInitFailureFallsBackToSync) {
    BackendFactory::AllowUring = false;
    BackendFactory::resetUringProbe();

    const std::string path = writeFile("fallback.txt", "ring or not\n");
    for (BackendKind kind : {BackendKind::Uring, BackendKind::Auto}) {
        auto backend = BackendFactory::create(kind, 4096);
        ASSERT_TRUE(backend != nullptr);
        EXPECT_STREQ(backend->name(), "sync");

        const FileResult result = backend->openAndCount(path, CountMode::Full, WhitespaceMode::Unicode);
        ASSERT_TRUE(result.ok());
        EXPECT_EQ(result.counts.words, 3u);
        EXPECT_EQ(result.counts.bytes, 12u);
    }
    EXPECT_FALSE(BackendFactory::uringAvailable());
    EXPECT_STREQ(BackendFactory::describe(BackendKind::Auto), "sync");
}

#if defined(__linux__)
TEST_F(BackendTest, SubmitFailureResumesAtOffset) {
    const std::string text = sample(5000);
    const std::string path = writeFile("submit.txt", text);
    auto ring = FaultyRing::create(4096, 3, FaultyRing::Fault::SubmitFails);
    if (!ring) {
        GTEST_SKIP() << "io_uring not available";
    }
    ASSERT_GT(text.size(), 8 * UringBackend::QUEUE_DEPTH * 4096u);

    SyncBackend sync;
    const Counts expected = sync.openAndCount(path, CountMode::Full, WhitespaceMode::Unicode).counts;

    const FileResult first = ring->openAndCount(path, CountMode::Full, WhitespaceMode::Unicode);
    ASSERT_TRUE(first.ok());
    EXPECT_EQ(first.counts, expected);
    EXPECT_EQ(first.counts.bytes, text.size());
    EXPECT_EQ(ring->submitCalls(), 4u);

    // Broken ring: later files never touch it again
    const FileResult second = ring->openAndCount(path, CountMode::LinesBytes, WhitespaceMode::Unicode);
    ASSERT_TRUE(second.ok());
    EXPECT_EQ(second.counts.lines, expected.lines);
    EXPECT_EQ(second.counts.bytes, expected.bytes);
    EXPECT_EQ(ring->submitCalls(), 4u);
}

TEST_F(BackendTest, UnsupportedReadResumesAtOffset) {
    const std::string text = sample(5000);
    const std::string path = writeFile("unsupported.txt", text);
    auto ring = FaultyRing::create(4096, 2, FaultyRing::Fault::ReadUnsupported);
    if (!ring) {
        GTEST_SKIP() << "io_uring not available";
    }

    SyncBackend sync;
    for (CountMode mode : {CountMode::Full, CountMode::LinesBytes}) {
        const FileResult a = ring->openAndCount(path, mode, WhitespaceMode::Unicode);
        const FileResult b = sync.openAndCount(path, mode, WhitespaceMode::Unicode);
        ASSERT_TRUE(a.ok());
        EXPECT_EQ(a.counts, b.counts) << ModeSelector::toString(mode);
        EXPECT_EQ(a.counts.bytes, text.size());
    }
}
#endif

TEST_F(BackendTest, OpenErrors) {
    SyncBackend backend;

    const FileResult missing = backend.openAndCount(dir + "/nope.txt", CountMode::Full, WhitespaceMode::Unicode);
    ASSERT_FALSE(missing.ok());
    EXPECT_EQ(missing.error->kind, FileErrorKind::NotFound);
    EXPECT_EQ(missing.error->path, dir + "/nope.txt");
    EXPECT_EQ(missing.counts, Counts{});

    const FileResult directory = backend.openAndCount(dir, CountMode::Full, WhitespaceMode::Unicode);
    ASSERT_FALSE(directory.ok());
    EXPECT_EQ(directory.error->kind, FileErrorKind::IsDirectory);

    const FileResult longName = backend.openAndCount(dir + "/" + std::string(300, 'x'), CountMode::Full,
                                                     WhitespaceMode::Unicode);
    ASSERT_FALSE(longName.ok());
    EXPECT_EQ(longName.error->kind, FileErrorKind::NameTooLong);
}

TEST_F(BackendTest, BytesOnlyFromMetadata) {
    const std::string text = sample(50);
    const std::string path = writeFile("meta.txt", text);
    SyncBackend backend;
    const FileResult result = backend.openAndCount(path, CountMode::BytesOnly, WhitespaceMode::Unicode);
    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.counts.bytes, text.size());
    EXPECT_EQ(result.counts.lines, 0u);
}

// A FIFO reports st_size 0, so its bytes must actually be read
TEST_F(BackendTest, FifoIsReadNotStatted) {
    const std::string path = dir + "/fifo";
    ASSERT_EQ(::mkfifo(path.c_str(), 0600), 0);
    created.push_back(path);

    const std::string payload = "one two\nthree\n";
    std::thread writer([&]() {
        const int fd = ::open(path.c_str(), O_WRONLY);
        if (fd < 0) return;
        const ssize_t written = ::write(fd, payload.data(), payload.size());
        (void)written;
        ::close(fd);
    });

    SyncBackend backend;
    const FileResult result = backend.openAndCount(path, CountMode::BytesOnly, WhitespaceMode::Unicode);
    writer.join();

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.counts.bytes, payload.size());
}

TEST_F(BackendTest, CountStreamFromPipe) {
    int fds[2];
    ASSERT_EQ(::pipe(fds), 0);
    const std::string payload = "a b c\n\xC2\xA0" "d\n";
    ASSERT_EQ(::write(fds[1], payload.data(), payload.size()), static_cast<ssize_t>(payload.size()));
    ::close(fds[1]);

    SyncBackend backend(2);
    const FileResult result = backend.countStream(fds[0], "-", CountMode::Full, WhitespaceMode::Unicode);
    ::close(fds[0]);

    ASSERT_TRUE(result.ok());
    EXPECT_EQ(result.counts.lines, 2u);
    EXPECT_EQ(result.counts.words, 4u);
    EXPECT_EQ(result.counts.bytes, payload.size());
    EXPECT_EQ(result.counts.chars, payload.size() - 1);
}

TEST_F(BackendTest, ErrnoMapping) {
    EXPECT_EQ(fileErrorKindFromErrno(ENOENT), FileErrorKind::NotFound);
    EXPECT_EQ(fileErrorKindFromErrno(EACCES), FileErrorKind::AccessDenied);
    EXPECT_EQ(fileErrorKindFromErrno(EISDIR), FileErrorKind::IsDirectory);
    EXPECT_EQ(fileErrorKindFromErrno(ENAMETOOLONG), FileErrorKind::NameTooLong);
    EXPECT_EQ(fileErrorKindFromErrno(EIO), FileErrorKind::IOError);
    EXPECT_STREQ(describeFileError(FileErrorKind::NotFound), "No such file or directory");
}
