#pragma once

#include "cancellation.hpp"
#include "errors.hpp"
#include "job_scheduler.hpp"
#include "logger.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace chunksync::engine {

struct ManifestEntry {
    std::string name;
    std::string digest;

    bool operator==(const ManifestEntry&) const = default;
};

struct Manifest {
    std::vector<ManifestEntry> entries;
    std::string fingerprint;

    const ManifestEntry* find(const std::string& name) const;
};

struct ManifestFailure {
    std::string name;
    IntegrityFailure kind;
    std::string detail;
};

struct VerificationReport {
    std::size_t verified = 0;
    std::vector<ManifestFailure> failures;

    bool ok() const { return failures.empty(); }
    // Throws IntegrityError for the first failure.
    void throw_if_failed() const;
};

// Artifact file names in a chunk directory: chunks by index, then the bundle.
std::vector<std::string> list_artifacts(const std::filesystem::path& chunk_dir);

// Digests every artifact in chunk_dir in parallel.
Manifest generate_manifest(const std::filesystem::path& chunk_dir, JobScheduler& scheduler, Logger& logger);

// Writes manifest.sha256 and, when set, source.fingerprint.
void write_manifest(const Manifest& manifest, const std::filesystem::path& chunk_dir);

// Throws IntegrityError(kMissingManifest) when manifest.sha256 is absent or
// malformed. The fingerprint is optional.
Manifest read_manifest(const std::filesystem::path& chunk_dir);

// Checks every entry against the artifact on disk and reports artifacts
// present in chunk_dir but not listed. Every failure is logged.
VerificationReport verify_manifest(const std::filesystem::path& chunk_dir,
                                   const Manifest& manifest,
                                   JobScheduler& scheduler,
                                   Logger& logger);

std::optional<std::string> read_fingerprint(const std::filesystem::path& file);
void write_fingerprint(const std::filesystem::path& file, const std::string& fingerprint);

// SHA-256 over the sorted "<digest>  <relative path>" lines of every regular
// file and symlink under root. Files are hashed in parallel.
std::string compute_fingerprint(const std::filesystem::path& root,
                                JobScheduler& scheduler,
                                Logger& logger,
                                const CancellationToken& cancel = process_cancellation());

}  // namespace chunksync::engine
