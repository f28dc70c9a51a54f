#include "io/uring_backend.h"

#include <algorithm>
#include <array>
#include <cerrno>
#include <cstring>
#include <linux/io_uring.h>
#include <sys/mman.h>
#include <sys/syscall.h>
#include <sys/uio.h>
#include <unistd.h>

namespace {

int uringSetup(unsigned entries, io_uring_params* params) {
    return static_cast<int>(::syscall(__NR_io_uring_setup, entries, params));
}

int uringEnter(int fd, unsigned toSubmit, unsigned minComplete, unsigned flags) {
    return static_cast<int>(::syscall(__NR_io_uring_enter, fd, toSubmit, minComplete, flags, nullptr, 0));
}

int uringRegister(int fd, unsigned opcode, const void* arg, unsigned count) {
    return static_cast<int>(::syscall(__NR_io_uring_register, fd, opcode, arg, count));
}

template <typename T>
T* ringField(void* base, uint32_t offset) {
    return reinterpret_cast<T*>(static_cast<char*>(base) + offset);
}

// Kernels without READ_FIXED support for this file type answer with these.
bool isUnsupported(int err) {
    return err == EINVAL || err == EOPNOTSUPP || err == ENOSYS;
}

}

UringBackend::UringBackend(size_t bufferSize)
    : PosixBackend(bufferSize),
      slot_size_(bufferSize == 0 ? ReadBuffer::DEFAULT_BUFFER_SIZE : bufferSize) {}

UringBackend::~UringBackend() {
    teardown();
}

std::unique_ptr<UringBackend> UringBackend::create(size_t bufferSize) {
    std::unique_ptr<UringBackend> backend(new UringBackend(bufferSize));
    if (!backend->setup()) {
        return nullptr;
    }
    return backend;
}

bool UringBackend::setup() {
    io_uring_params params;
    std::memset(&params, 0, sizeof(params));

    ring_fd_ = uringSetup(QUEUE_DEPTH, &params);
    if (ring_fd_ < 0) {
        ring_fd_ = -1;
        return false;
    }

    sq_ring_size_ = params.sq_off.array + params.sq_entries * sizeof(unsigned);
    cq_ring_size_ = params.cq_off.cqes + params.cq_entries * sizeof(io_uring_cqe);
    const bool single_mmap = (params.features & IORING_FEAT_SINGLE_MMAP) != 0;
    if (single_mmap) {
        sq_ring_size_ = std::max(sq_ring_size_, cq_ring_size_);
        cq_ring_size_ = sq_ring_size_;
    }

    sq_ring_ = ::mmap(nullptr, sq_ring_size_, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_POPULATE,
                      ring_fd_, IORING_OFF_SQ_RING);
    if (sq_ring_ == MAP_FAILED) {
        sq_ring_ = nullptr;
        return false;
    }

    if (single_mmap) {
        cq_ring_ = sq_ring_;
    } else {
        cq_ring_ = ::mmap(nullptr, cq_ring_size_, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_POPULATE,
                          ring_fd_, IORING_OFF_CQ_RING);
        if (cq_ring_ == MAP_FAILED) {
            cq_ring_ = nullptr;
            return false;
        }
    }

    sqes_size_ = params.sq_entries * sizeof(io_uring_sqe);
    void* sqes = ::mmap(nullptr, sqes_size_, PROT_READ | PROT_WRITE, MAP_SHARED | MAP_POPULATE,
                        ring_fd_, IORING_OFF_SQES);
    if (sqes == MAP_FAILED) {
        return false;
    }
    sqes_ = static_cast<io_uring_sqe*>(sqes);

    sq_tail_ = ringField<unsigned>(sq_ring_, params.sq_off.tail);
    sq_mask_ = ringField<unsigned>(sq_ring_, params.sq_off.ring_mask);
    sq_array_ = ringField<unsigned>(sq_ring_, params.sq_off.array);
    cq_head_ = ringField<unsigned>(cq_ring_, params.cq_off.head);
    cq_tail_ = ringField<unsigned>(cq_ring_, params.cq_off.tail);
    cq_mask_ = ringField<unsigned>(cq_ring_, params.cq_off.ring_mask);
    cqes_ = ringField<io_uring_cqe>(cq_ring_, params.cq_off.cqes);

    // Pre-register one buffer per in-flight read
    std::array<iovec, QUEUE_DEPTH> iovecs;
    slots_.reserve(QUEUE_DEPTH);
    for (unsigned i = 0; i < QUEUE_DEPTH; i++) {
        slots_.push_back(std::make_unique<ReadBuffer>(slot_size_));
        iovecs[i].iov_base = slots_[i]->data();
        iovecs[i].iov_len = slot_size_;
    }
    if (uringRegister(ring_fd_, IORING_REGISTER_BUFFERS, iovecs.data(), QUEUE_DEPTH) < 0) {
        return false;
    }

    return true;
}

void UringBackend::teardown() {
    if (sqes_ != nullptr) ::munmap(sqes_, sqes_size_);
    if (cq_ring_ != nullptr && cq_ring_ != sq_ring_) ::munmap(cq_ring_, cq_ring_size_);
    if (sq_ring_ != nullptr) ::munmap(sq_ring_, sq_ring_size_);
    // Closing the ring also drops the buffer registration
    if (ring_fd_ >= 0) ::close(ring_fd_);

    sqes_ = nullptr;
    cq_ring_ = nullptr;
    sq_ring_ = nullptr;
    ring_fd_ = -1;
}

void UringBackend::queueRead(int fd, unsigned slot, uint64_t offset) {
    // Only this thread produces SQEs, so the tail needs no acquire
    const unsigned tail = *sq_tail_;
    const unsigned index = tail & *sq_mask_;

    io_uring_sqe* sqe = &sqes_[index];
    std::memset(sqe, 0, sizeof(*sqe));
    sqe->opcode = IORING_OP_READ_FIXED;
    sqe->fd = fd;
    sqe->addr = reinterpret_cast<uint64_t>(slots_[slot]->data());
    sqe->len = static_cast<uint32_t>(slot_size_);
    sqe->off = offset;
    sqe->buf_index = static_cast<uint16_t>(slot);
    sqe->user_data = slot;

    sq_array_[index] = index;
    __atomic_store_n(sq_tail_, tail + 1, __ATOMIC_RELEASE);
}

int UringBackend::submit(unsigned count) {
    while (count > 0) {
        const int ret = uringEnter(ring_fd_, count, 0, 0);
        if (ret < 0) {
            if (errno == EINTR || errno == EAGAIN) continue;
            return errno;
        }
        count -= static_cast<unsigned>(ret);
    }
    return 0;
}

int UringBackend::waitCompletion(uint64_t& userData, int32_t& res) {
    while (true) {
        const unsigned head = *cq_head_;
        const unsigned tail = __atomic_load_n(cq_tail_, __ATOMIC_ACQUIRE);
        if (head != tail) {
            const io_uring_cqe& cqe = cqes_[head & *cq_mask_];
            userData = cqe.user_data;
            res = cqe.res;
            __atomic_store_n(cq_head_, head + 1, __ATOMIC_RELEASE);
            return 0;
        }

        const int ret = uringEnter(ring_fd_, 0, 1, IORING_ENTER_GETEVENTS);
        if (ret < 0 && errno != EINTR) {
            return errno;
        }
    }
}

int UringBackend::readAll(int fd, const struct stat& st, StreamCounter& counter) {
    // Pipes, FIFOs and devices have no offsets to batch against
    if (!S_ISREG(st.st_mode) || broken_) {
        return readBlocking(fd, counter);
    }

    // `offset` always equals the bytes already handed to the counter, so any
    // ring failure can resume with pread from there without loss or overlap.
    uint64_t offset = 0;
    std::array<int32_t, QUEUE_DEPTH> results;

    while (true) {
        for (unsigned slot = 0; slot < QUEUE_DEPTH; slot++) {
            queueRead(fd, slot, offset + static_cast<uint64_t>(slot) * slot_size_);
        }

        if (submit(QUEUE_DEPTH) != 0) {
            broken_ = true;
            return readBlockingFrom(fd, static_cast<off_t>(offset), counter);
        }

        // Every queued read must be reaped before the buffers are reused
        results.fill(0);
        for (unsigned reaped = 0; reaped < QUEUE_DEPTH; reaped++) {
            uint64_t slot = 0;
            int32_t res = 0;
            if (waitCompletion(slot, res) != 0 || slot >= QUEUE_DEPTH) {
                broken_ = true;
                return readBlockingFrom(fd, static_cast<off_t>(offset), counter);
            }
            results[slot] = res;
        }

        // Feed completions in file order; a short read ends the round
        for (unsigned slot = 0; slot < QUEUE_DEPTH; slot++) {
            const int32_t res = results[slot];
            if (res < 0) {
                if (isUnsupported(-res)) {
                    return readBlockingFrom(fd, static_cast<off_t>(offset), counter);
                }
                return -res;
            }
            if (res == 0) return 0;

            counter.consume(slots_[slot]->data(), static_cast<size_t>(res));
            offset += static_cast<uint64_t>(res);

            if (static_cast<size_t>(res) < slot_size_) break;
        }
    }
}
