#pragma once

#include "cancellation.hpp"
#include "job_scheduler.hpp"
#include "logger.hpp"
#include "sync_state_store.hpp"

#include <filesystem>
#include <string>

namespace chunksync::engine {

struct ChangeCheck {
    std::string fingerprint;
    std::string previous;
    bool unchanged = false;
};

// Decides whether a source tree differs from what was last produced. The
// state store is optional; without one push never short-circuits.
class ChangeDetector {
public:
    ChangeDetector(SyncStateStore* state, JobScheduler& scheduler, Logger& logger);

    // Compares against <out_dir>/source.fingerprint.
    ChangeCheck against_directory(const std::filesystem::path& source,
                                  const std::filesystem::path& out_dir,
                                  const CancellationToken& cancel = process_cancellation());

    // Compares against the last successful push to remote_prefix.
    ChangeCheck against_remote(const std::filesystem::path& source,
                               const std::string& remote_prefix,
                               const CancellationToken& cancel = process_cancellation());

    void record_success(const std::filesystem::path& source,
                        const std::string& remote_prefix,
                        const std::string& fingerprint,
                        std::uint64_t artifact_count,
                        std::uint64_t total_bytes);

private:
    static std::string state_key(const std::filesystem::path& source);

    SyncStateStore* state_;
    JobScheduler& scheduler_;
    Logger& logger_;
};

}  // namespace chunksync::engine
