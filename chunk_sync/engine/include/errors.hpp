#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace chunksync::engine {

class SyncError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Source tree missing or unreadable.
class PlanningError : public SyncError {
public:
    using SyncError::SyncError;
};

// Archive could not be written. The partial output has already been removed.
class BuildError : public SyncError {
public:
    using SyncError::SyncError;
};

// Opaque failure reported by the blob store.
class TransferError : public SyncError {
public:
    using SyncError::SyncError;
};

enum class IntegrityFailure {
    kEmptyArtifact,
    kInvalidHeader,
    kDigestMismatch,
    kMissingArtifact,
    kUnlistedArtifact,
    kMissingManifest,
};

const char* to_string(IntegrityFailure failure);

class IntegrityError : public SyncError {
public:
    IntegrityError(IntegrityFailure kind, std::string artifact, const std::string& message)
        : SyncError(message), kind_(kind), artifact_(std::move(artifact)) {}

    IntegrityFailure kind() const { return kind_; }
    const std::string& artifact() const { return artifact_; }

private:
    IntegrityFailure kind_;
    std::string artifact_;
};

// Decoding failed after the integrity checks passed.
class ExtractionError : public SyncError {
public:
    using SyncError::SyncError;
};

class CancelledError : public SyncError {
public:
    CancelledError() : SyncError("Operation cancelled") {}
};

}  // namespace chunksync::engine
