#pragma once

#include "cancellation.hpp"
#include "chunk_planner.hpp"
#include "logger.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunksync::engine {

struct ArchiveStats {
    std::filesystem::path path;
    std::size_t entries = 0;
    std::size_t skipped = 0;
    std::uint64_t input_bytes = 0;
    std::uint64_t archive_bytes = 0;
};

struct ExtractStats {
    std::size_t entries = 0;
    std::uint64_t bytes = 0;
    std::size_t executables_fixed = 0;
};

// Writes chunk.files as a gzip-compressed tar with paths relative to
// base_dir. Files that disappeared since planning are skipped with a
// warning. Throws BuildError; the partial output never survives a failure.
ArchiveStats build_chunk_archive(const Chunk& chunk,
                                 const std::filesystem::path& base_dir,
                                 const std::filesystem::path& output,
                                 int compression_level,
                                 Logger& logger,
                                 const CancellationToken& cancel = process_cancellation());

// Structural checks done before any byte reaches the destination: the file
// exists, is non-empty and starts with a gzip member header. Throws
// IntegrityError and logs size plus leading bytes.
void validate_chunk_archive(const std::filesystem::path& archive, Logger& logger);

// Validates then unpacks one chunk archive into dest_dir, which is created
// when missing. Decode failures throw ExtractionError.
ExtractStats extract_chunk_archive(const std::filesystem::path& archive,
                                   const std::filesystem::path& dest_dir,
                                   Logger& logger,
                                   const CancellationToken& cancel = process_cancellation());

// First bytes of a file as spaced hex, for diagnostics.
std::string leading_bytes_hex(const std::filesystem::path& path, std::size_t count = 16);

// True when a path relative to the extraction root lies under a "bin" directory.
bool in_bin_directory(const std::filesystem::path& relative);

// Adds the executable bits to path. Failures are logged and ignored.
bool mark_executable(const std::filesystem::path& path, Logger& logger);

// Rejects absolute paths and ".." components in archive member names.
std::filesystem::path safe_member_path(const std::string& name);

// Throws ExtractionError when any existing component of dest_dir / relative is a symlink,
// so an earlier member cannot redirect later writes outside dest_dir.
void reject_symlinked_components(const std::filesystem::path& dest_dir, const std::filesystem::path& relative);

}  // namespace chunksync::engine
