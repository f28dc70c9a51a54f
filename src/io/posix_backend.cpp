#include "io/posix_backend.h"
#include "count/mode_selector.h"

#include <cerrno>
#include <fcntl.h>
#include <unistd.h>

namespace {

// Closes the descriptor on every return path.
class FdGuard {
public:
    explicit FdGuard(int fd) : fd_(fd) {}
    ~FdGuard() {
        if (fd_ >= 0) ::close(fd_);
    }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;

private:
    int fd_;
};

}

PosixBackend::PosixBackend(size_t bufferSize) : buffer_(bufferSize) {}

bool PosixBackend::trustSizeMetadata(int fd, const struct stat& st) {
    if (!ModeSelector::canUseSizeMetadata(st)) return false;
    return ::lseek(fd, 0, SEEK_CUR) != static_cast<off_t>(-1);
}

FileResult PosixBackend::openAndCount(const std::string& path, CountMode mode, WhitespaceMode wsMode) {
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return FileResult::failure(path, fileErrorKindFromErrno(errno));
    }
    FdGuard guard(fd);

    struct stat st;
    if (::fstat(fd, &st) != 0) {
        return FileResult::failure(path, fileErrorKindFromErrno(errno));
    }
    if (S_ISDIR(st.st_mode)) {
        return FileResult::failure(path, FileErrorKind::IsDirectory);
    }

    // Fast path: bytes only on a confirmed regular file - no reads at all
    if (mode == CountMode::BytesOnly && trustSizeMetadata(fd, st)) {
        Counts counts;
        counts.bytes = static_cast<uint64_t>(st.st_size);
        return FileResult::success(counts);
    }

#ifdef POSIX_FADV_SEQUENTIAL
    if (S_ISREG(st.st_mode) && st.st_size >= SEQUENTIAL_HINT_BYTES) {
        // Advisory only; a refusal changes nothing about the result
        (void)::posix_fadvise(fd, 0, 0, POSIX_FADV_SEQUENTIAL);
    }
#endif

    StreamCounter counter(mode, wsMode);
    const int err = readAll(fd, st, counter);
    if (err != 0) {
        return FileResult::failure(path, fileErrorKindFromErrno(err));
    }
    return FileResult::success(counter.finish());
}

FileResult PosixBackend::countStream(int fd, const std::string& label, CountMode mode, WhitespaceMode wsMode) {
    StreamCounter counter(mode, wsMode);
    const int err = readBlocking(fd, counter);
    if (err != 0) {
        return FileResult::failure(label, fileErrorKindFromErrno(err));
    }
    return FileResult::success(counter.finish());
}

int PosixBackend::readBlocking(int fd, StreamCounter& counter) {
    while (true) {
        const ssize_t n = ::read(fd, buffer_.data(), buffer_.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        if (n == 0) return 0;
        counter.consume(buffer_.data(), static_cast<size_t>(n));
    }
}

int PosixBackend::readBlockingFrom(int fd, off_t offset, StreamCounter& counter) {
    while (true) {
        const ssize_t n = ::pread(fd, buffer_.data(), buffer_.size(), offset);
        if (n < 0) {
            if (errno == EINTR) continue;
            return errno;
        }
        if (n == 0) return 0;
        counter.consume(buffer_.data(), static_cast<size_t>(n));
        offset += n;
    }
}
