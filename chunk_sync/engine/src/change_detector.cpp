#include "change_detector.hpp"

#include "artifact_layout.hpp"
#include "manifest.hpp"

#include <system_error>

namespace chunksync::engine {

ChangeDetector::ChangeDetector(SyncStateStore* state, JobScheduler& scheduler, Logger& logger)
    : state_(state), scheduler_(scheduler), logger_(logger) {}

std::string ChangeDetector::state_key(const std::filesystem::path& source) {
    std::error_code ec;
    auto canonical = std::filesystem::weakly_canonical(source, ec);
    return (ec ? source : canonical).generic_string();
}

ChangeCheck ChangeDetector::against_directory(const std::filesystem::path& source,
                                              const std::filesystem::path& out_dir,
                                              const CancellationToken& cancel) {
    ChangeCheck check;
    check.fingerprint = compute_fingerprint(source, scheduler_, logger_, cancel);
    if (auto previous = read_fingerprint(out_dir / layout::kFingerprintName)) {
        check.previous = std::move(*previous);
    }
    // A fingerprint without its manifest means an interrupted run.
    std::error_code ec;
    const bool manifest_present = std::filesystem::is_regular_file(out_dir / layout::kManifestName, ec);
    check.unchanged = manifest_present && check.previous == check.fingerprint;
    if (check.unchanged) {
        logger_.info("Source unchanged since last chunking of " + out_dir.string());
    }
    return check;
}

ChangeCheck ChangeDetector::against_remote(const std::filesystem::path& source,
                                           const std::string& remote_prefix,
                                           const CancellationToken& cancel) {
    ChangeCheck check;
    check.fingerprint = compute_fingerprint(source, scheduler_, logger_, cancel);
    if (state_ == nullptr) {
        return check;
    }
    if (const auto record = state_->find(state_key(source), remote_prefix)) {
        check.previous = record->fingerprint;
        check.unchanged = record->fingerprint == check.fingerprint;
        if (check.unchanged) {
            logger_.info("Source unchanged since push to " + remote_prefix + " at " + record->updated_at);
        }
    }
    return check;
}

void ChangeDetector::record_success(const std::filesystem::path& source,
                                   const std::string& remote_prefix,
                                   const std::string& fingerprint,
                                   std::uint64_t artifact_count,
                                   std::uint64_t total_bytes) {
    if (state_ == nullptr) {
        return;
    }
    state_->upsert(SyncRecord{state_key(source), remote_prefix, fingerprint, artifact_count, total_bytes, {}});
}

}  // namespace chunksync::engine
