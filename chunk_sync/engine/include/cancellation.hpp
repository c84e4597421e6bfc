#pragma once

#include <atomic>

namespace chunksync::engine {

// Cooperative stop flag. request() only touches a lock-free atomic, so it may
// be called from a signal handler.
class CancellationToken {
public:
    void request() { requested_.store(true); }
    void reset() { requested_.store(false); }
    bool requested() const { return requested_.load(); }

    // Throws CancelledError once a stop was requested.
    void throw_if_requested() const;

private:
    std::atomic<bool> requested_{false};
};

// Token toggled by the CLI's SIGINT/SIGTERM handlers.
CancellationToken& process_cancellation();

}  // namespace chunksync::engine
