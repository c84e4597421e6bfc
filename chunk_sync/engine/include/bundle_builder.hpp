#pragma once

#include "archive_builder.hpp"
#include "chunk_planner.hpp"
#include "logger.hpp"

#include <filesystem>

namespace chunksync::engine {

struct BundleStats {
    std::filesystem::path path;
    std::size_t entries = 0;
    std::uint64_t input_bytes = 0;
    std::uint64_t archive_bytes = 0;

    bool placeholder() const { return entries == 0; }
};

// Zips every top-level entry of tree.root except the large subtrees. When
// nothing qualifies a zero-byte placeholder is written instead. Throws
// BuildError and removes the partial output on failure.
BundleStats build_bundle(const SourceTree& tree,
                         const std::filesystem::path& output,
                         int compression_level,
                         Logger& logger,
                         const CancellationToken& cancel = process_cancellation());

// False when the bundle is absent or a zero-byte placeholder; both mean
// there is nothing to extract. Throws IntegrityError on a bad zip header.
bool validate_bundle(const std::filesystem::path& bundle, Logger& logger);

ExtractStats extract_bundle(const std::filesystem::path& bundle,
                            const std::filesystem::path& dest_dir,
                            Logger& logger,
                            const CancellationToken& cancel = process_cancellation());

}  // namespace chunksync::engine
