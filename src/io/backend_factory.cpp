#include "io/backend_factory.h"
#include "io/sync_backend.h"

#include <atomic>

#if defined(__linux__)
#include "io/uring_backend.h"
#endif

namespace {

enum UringState : int { UNPROBED, AVAILABLE, UNAVAILABLE };

// Once a ring fails to come up, later workers skip straight to the fallback.
std::atomic<int> uring_state{UNPROBED};

#if defined(__linux__)
std::unique_ptr<UringBackend> tryCreateRing(size_t bufferSize) {
    if (!BackendFactory::AllowUring) return nullptr;
    return UringBackend::create(bufferSize);
}
#endif

}

bool BackendFactory::AllowUring = true;

std::unique_ptr<IOBackend> BackendFactory::create(BackendKind kind, size_t bufferSize) {
    if (kind == BackendKind::Sync) {
        return std::make_unique<SyncBackend>(bufferSize);
    }

#if defined(__linux__)
    if (uring_state.load(std::memory_order_relaxed) != UNAVAILABLE) {
        if (std::unique_ptr<UringBackend> ring = tryCreateRing(bufferSize)) {
            uring_state.store(AVAILABLE, std::memory_order_relaxed);
            return ring;
        }
        uring_state.store(UNAVAILABLE, std::memory_order_relaxed);
    }
#endif
    return std::make_unique<SyncBackend>(bufferSize);
}

bool BackendFactory::uringAvailable() {
#if defined(__linux__)
    const int state = uring_state.load(std::memory_order_relaxed);
    if (state != UNPROBED) return state == AVAILABLE;

    const bool ok = tryCreateRing(4096) != nullptr;
    uring_state.store(ok ? AVAILABLE : UNAVAILABLE, std::memory_order_relaxed);
    return ok;
#else
    return false;
#endif
}

const char* BackendFactory::describe(BackendKind kind) {
    if (kind == BackendKind::Sync) return "sync";
    return uringAvailable() ? "io_uring" : "sync";
}

void BackendFactory::resetUringProbe() {
    uring_state.store(UNPROBED, std::memory_order_relaxed);
}
