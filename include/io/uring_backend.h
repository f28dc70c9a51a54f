#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

#include "io/posix_backend.h"
#include "io/read_buffer.h"

struct io_uring_sqe;
struct io_uring_cqe;

/**
 * Batched reads through an io_uring instance with pre-registered buffers.
 *
 * Each round queues QUEUE_DEPTH fixed-buffer reads at consecutive offsets
 * and feeds the completions to the counter in offset order. Only regular
 * files go through the ring; anything else uses the inherited read loop.
 *
 * create() returns nullptr when the kernel refuses the ring or the buffer
 * registration (old kernel, seccomp, RLIMIT_MEMLOCK).
 */
class UringBackend : public PosixBackend {
public:
    static constexpr unsigned QUEUE_DEPTH = 4;

    static std::unique_ptr<UringBackend> create(size_t bufferSize = ReadBuffer::DEFAULT_BUFFER_SIZE);

    ~UringBackend() override;

    UringBackend(const UringBackend&) = delete;
    UringBackend& operator=(const UringBackend&) = delete;

    const char* name() const override { return "io_uring"; }

protected:
    explicit UringBackend(size_t bufferSize);

    bool setup();

    int readAll(int fd, const struct stat& st, StreamCounter& counter) override;

    // Both return 0 or an errno value. A failure of either one switches this
    // backend to the blocking loop for the rest of its life.
    virtual int submit(unsigned count);
    virtual int waitCompletion(uint64_t& userData, int32_t& res);

private:
    void teardown();

    void queueRead(int fd, unsigned slot, uint64_t offset);

    int ring_fd_ = -1;
    // Set after a submit/wait failure; later files use the blocking loop.
    bool broken_ = false;

    void* sq_ring_ = nullptr;
    size_t sq_ring_size_ = 0;
    void* cq_ring_ = nullptr;
    size_t cq_ring_size_ = 0;
    io_uring_sqe* sqes_ = nullptr;
    size_t sqes_size_ = 0;

    unsigned* sq_tail_ = nullptr;
    unsigned* sq_mask_ = nullptr;
    unsigned* sq_array_ = nullptr;
    unsigned* cq_head_ = nullptr;
    unsigned* cq_tail_ = nullptr;
    unsigned* cq_mask_ = nullptr;
    io_uring_cqe* cqes_ = nullptr;

    size_t slot_size_;
    std::vector<std::unique_ptr<ReadBuffer>> slots_;
};
