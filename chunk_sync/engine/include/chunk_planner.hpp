#pragma once

#include "logger.hpp"

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace chunksync::engine {

struct SourceFile {
    std::filesystem::path path;
    std::uint64_t size;
};

struct Chunk {
    std::size_t index;
    std::vector<std::filesystem::path> files;
    std::uint64_t total_bytes;
    std::uint64_t bound;

    // A single file larger than the bound, packed on its own.
    bool oversized() const { return files.size() == 1 && total_bytes > bound; }
};

// Source root split into the bulky subtrees that get chunked and everything
// else, which goes into the bundle.
struct SourceTree {
    std::filesystem::path root;
    std::vector<std::string> large_subtrees;

    // Existing large subtree roots. Symlinked roots are left to the bundle.
    std::vector<std::filesystem::path> large_roots() const;
    bool is_large(const std::string& top_level_name) const;
};

// Regular files and symlinks under the given roots. Symlinks count as 0 bytes.
std::vector<SourceFile> enumerate_files(const std::vector<std::filesystem::path>& roots, Logger& logger);

// Largest-first greedy bin packing. Indices start at 1.
std::vector<Chunk> pack_chunks(std::vector<SourceFile> files, std::uint64_t bound, Logger& logger);

std::vector<Chunk> plan_chunks(const SourceTree& tree, std::uint64_t bound, Logger& logger);

}  // namespace chunksync::engine
