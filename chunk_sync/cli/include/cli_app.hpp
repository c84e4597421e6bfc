#pragma once

#include "config_loader.hpp"

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace chunksync::cli {

inline constexpr int kExitSuccess = 0;
inline constexpr int kExitFailure = 1;
inline constexpr int kExitUsage = 2;
inline constexpr int kExitCancelled = 130;

class UsageError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

struct CliOptions {
    std::string config_path = "chunk_sync/config/chunksync.conf";
    std::optional<std::uint64_t> chunk_size_mb;
    std::optional<std::size_t> parallel;
    std::optional<int> level;
    std::optional<std::string> log_file;
    std::optional<std::string> store_root;
    bool help = false;

    std::string verb;
    std::vector<std::string> operands;
};

// Throws UsageError for unknown options, bad numbers, unknown verbs and
// wrong operand counts.
CliOptions parse_arguments(const std::vector<std::string>& args);

// Command line settings win over the config file.
void apply_overrides(const CliOptions& options, engine::EngineConfig& config);

std::string usage_text();

class CliApp {
public:
    // Runs one verb and returns the process exit code.
    int run(const std::vector<std::string>& args);

private:
    int dispatch(const CliOptions& options, const engine::EngineConfig& config);
};

}  // namespace chunksync::cli
