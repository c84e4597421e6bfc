#include "errors.hpp"

namespace chunksync::engine {

const char* to_string(IntegrityFailure failure) {
    switch (failure) {
        case IntegrityFailure::kEmptyArtifact:
            return "empty artifact";
        case IntegrityFailure::kInvalidHeader:
            return "invalid header";
        case IntegrityFailure::kDigestMismatch:
            return "digest mismatch";
        case IntegrityFailure::kMissingArtifact:
            return "missing artifact";
        case IntegrityFailure::kUnlistedArtifact:
            return "unlisted artifact";
        case IntegrityFailure::kMissingManifest:
            return "missing manifest";
        default:
            return "integrity failure";
    }
}

}  // namespace chunksync::engine
