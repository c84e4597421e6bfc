#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace chunksync::engine {

struct EngineConfig {
    std::uint64_t chunk_size_bytes = 100ULL * 1024 * 1024;
    std::size_t max_parallel = 10;
    int compression_level = 6;
    std::string log_file;
    std::string log_level = "info";
    bool log_console = true;
    std::vector<std::string> large_subtrees = {"lib", "lib64"};
    std::string state_database = "./data/chunksync_state.db";

    // "filesystem" or "aws-cli"
    std::string blob_backend = "filesystem";
    std::string blob_store_root = "./data/blobs";
    std::string aws_cli = "aws";
    std::vector<std::string> aws_cli_args;
};

EngineConfig load_config(const std::string& path);

// Throws std::invalid_argument describing the first offending setting.
void validate_config(const EngineConfig& config);

}  // namespace chunksync::engine
