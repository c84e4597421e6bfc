#pragma once

#include "blob_store.hpp"
#include "cancellation.hpp"
#include "config_loader.hpp"
#include "job_scheduler.hpp"
#include "logger.hpp"
#include "manifest.hpp"
#include "sync_state_store.hpp"

#include <cstdint>
#include <filesystem>
#include <string>

namespace chunksync::engine {

struct ChunkSummary {
    bool skipped = false;
    std::size_t chunks = 0;
    std::size_t bundle_entries = 0;
    std::uint64_t source_bytes = 0;
    std::uint64_t artifact_bytes = 0;
    std::string fingerprint;
};

struct RestoreSummary {
    std::size_t artifacts = 0;
    std::size_t entries = 0;
    std::uint64_t bytes = 0;
    std::size_t executables_fixed = 0;
};

struct TransferSummary {
    std::size_t objects = 0;
    std::uint64_t bytes = 0;
};

struct PushSummary {
    bool skipped = false;
    std::string fingerprint;
    ChunkSummary chunk;
    TransferSummary upload;
};

// Drives the chunk / transfer / restore pipelines. Every call blocks until its
// phases are complete and reports failure by throwing a SyncError.
class ReplicationEngine {
public:
    ReplicationEngine(EngineConfig config,
                      Logger& logger,
                      BlobStore& store,
                      SyncStateStore* state = nullptr,
                      const CancellationToken& cancel = process_cancellation());

    ChunkSummary chunk(const std::filesystem::path& source_dir, const std::filesystem::path& out_dir);
    RestoreSummary restore(const std::filesystem::path& chunk_dir, const std::filesystem::path& dest_dir);
    TransferSummary upload(const std::filesystem::path& chunk_dir, const BlobRef& prefix);
    TransferSummary download(const BlobRef& prefix, const std::filesystem::path& chunk_dir);
    VerificationReport verify(const std::filesystem::path& chunk_dir);

    // chunk + upload, skipped when the source matches the last push to prefix.
    PushSummary push(const std::filesystem::path& source_dir, const BlobRef& prefix);
    // download + restore through a temporary chunk directory.
    RestoreSummary pull(const BlobRef& prefix, const std::filesystem::path& dest_dir);

    const EngineConfig& config() const { return config_; }
    JobScheduler& scheduler() { return scheduler_; }

private:
    ChunkSummary build_artifacts(const std::filesystem::path& source_dir,
                                 const std::filesystem::path& out_dir,
                                 const std::string& fingerprint);
    void clear_artifacts(const std::filesystem::path& dir);
    void run_batch(const std::string& phase);

    EngineConfig config_;
    Logger& logger_;
    BlobStore& store_;
    SyncStateStore* state_;
    const CancellationToken& cancel_;
    JobScheduler scheduler_;
};

}  // namespace chunksync::engine
