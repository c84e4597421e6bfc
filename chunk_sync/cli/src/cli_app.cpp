#include "cli_app.hpp"

#include "blob_ref.hpp"
#include "blob_store.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "replication_engine.hpp"
#include "sync_state_store.hpp"

#include <algorithm>
#include <iostream>
#include <limits>
#include <map>
#include <memory>

namespace chunksync::cli {

namespace {

// Operand count per verb.
const std::map<std::string, std::size_t>& verbs() {
    static const std::map<std::string, std::size_t> table{
        {"chunk", 2}, {"restore", 2}, {"upload", 2}, {"download", 2}, {"verify", 1}, {"push", 2}, {"pull", 2},
    };
    return table;
}

std::uint64_t parse_number(const std::string& option, const std::string& value) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw UsageError("Option " + option + " expects a non-negative integer, got '" + value + "'");
    }
    try {
        return std::stoull(value);
    } catch (const std::out_of_range&) {
        throw UsageError("Option " + option + " is out of range: " + value);
    }
}

}  // namespace

CliOptions parse_arguments(const std::vector<std::string>& args) {
    CliOptions options;
    std::size_t i = 0;
    const auto value_of = [&](const std::string& option) -> std::string {
        if (i + 1 >= args.size()) {
            throw UsageError("Option " + option + " requires a value");
        }
        return args[++i];
    };

    for (; i < args.size(); ++i) {
        const auto& arg = args[i];
        if (arg == "-h" || arg == "--help") {
            options.help = true;
        } else if (arg == "--config") {
            options.config_path = value_of(arg);
        } else if (arg == "--chunk-size-mb") {
            options.chunk_size_mb = parse_number(arg, value_of(arg));
            if (*options.chunk_size_mb > std::numeric_limits<std::uint64_t>::max() / (1024 * 1024)) {
                throw UsageError("Option " + arg + " is out of range");
            }
        } else if (arg == "--parallel") {
            options.parallel = static_cast<std::size_t>(parse_number(arg, value_of(arg)));
        } else if (arg == "--level") {
            const auto level = parse_number(arg, value_of(arg));
            if (level < 1 || level > 9) {
                throw UsageError("Option --level must be within 1..9");
            }
            options.level = static_cast<int>(level);
        } else if (arg == "--log-file") {
            options.log_file = value_of(arg);
        } else if (arg == "--store-root") {
            options.store_root = value_of(arg);
        } else if (arg.size() > 1 && arg[0] == '-') {
            throw UsageError("Unknown option: " + arg);
        } else if (options.verb.empty()) {
            options.verb = arg;
        } else {
            options.operands.push_back(arg);
        }
    }

    if (options.help) {
        return options;
    }
    if (options.verb.empty()) {
        throw UsageError("No command given");
    }
    const auto it = verbs().find(options.verb);
    if (it == verbs().end()) {
        throw UsageError("Unknown command: " + options.verb);
    }
    if (options.operands.size() != it->second) {
        throw UsageError("Command " + options.verb + " expects " + std::to_string(it->second) + " arguments");
    }
    if (options.chunk_size_mb && *options.chunk_size_mb == 0) {
        throw UsageError("Option --chunk-size-mb must be > 0");
    }
    if (options.parallel && *options.parallel == 0) {
        throw UsageError("Option --parallel must be > 0");
    }
    return options;
}

void apply_overrides(const CliOptions& options, engine::EngineConfig& config) {
    if (options.chunk_size_mb) {
        config.chunk_size_bytes = *options.chunk_size_mb * 1024 * 1024;
    }
    if (options.parallel) {
        config.max_parallel = *options.parallel;
    }
    if (options.level) {
        config.compression_level = *options.level;
    }
    if (options.log_file) {
        config.log_file = *options.log_file;
    }
    if (options.store_root) {
        config.blob_backend = "filesystem";
        config.blob_store_root = *options.store_root;
    }
}

std::string usage_text() {
    return "Usage: chunksync [options] <command> <args>\n"
           "Commands:\n"
           "  chunk <source_dir> <out_dir>\n"
           "  restore <chunk_dir> <dest_dir>\n"
           "  upload <chunk_dir> <s3://bucket/prefix>\n"
           "  download <s3://bucket/prefix> <chunk_dir>\n"
           "  verify <chunk_dir>\n"
           "  push <source_dir> <s3://bucket/prefix>\n"
           "  pull <s3://bucket/prefix> <dest_dir>\n"
           "Options:\n"
           "  --config <file>        configuration file (default chunk_sync/config/chunksync.conf)\n"
           "  --chunk-size-mb <n>    chunk size bound in MiB (default 100)\n"
           "  --parallel <n>         concurrent jobs (default 10)\n"
           "  --level <1-9>          compression level (default 6)\n"
           "  --log-file <path>      append log lines to this file\n"
           "  --store-root <dir>     use a filesystem blob store rooted at dir\n";
}

int CliApp::run(const std::vector<std::string>& args) {
    CliOptions options;
    engine::EngineConfig config;
    try {
        options = parse_arguments(args);
        if (options.help) {
            std::cout << usage_text();
            return kExitSuccess;
        }
        config = engine::load_config(options.config_path);
        apply_overrides(options, config);
        engine::validate_config(config);
    } catch (const std::invalid_argument& ex) {
        std::cerr << "Error: " << ex.what() << "\n" << usage_text();
        return kExitUsage;
    }
    return dispatch(options, config);
}

int CliApp::dispatch(const CliOptions& options, const engine::EngineConfig& config) {
    std::unique_ptr<engine::Logger> logger;
    try {
        logger = std::make_unique<engine::Logger>(config.log_file);
        logger->set_min_level(engine::parse_log_level(config.log_level));
        logger->set_console(config.log_console);
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return kExitFailure;
    }

    try {
        const auto& verb = options.verb;
        const auto& first = options.operands.at(0);
        const auto& second = options.operands.size() > 1 ? options.operands[1] : std::string();

        auto store = engine::make_blob_store(config, *logger);
        std::unique_ptr<engine::SyncStateStore> state;
        if (verb == "push") {
            state = std::make_unique<engine::SyncStateStore>(config.state_database);
            state->initialize_schema();
        }
        engine::ReplicationEngine replicator(config, *logger, *store, state.get());

        if (verb == "chunk") {
            replicator.chunk(first, second);
        } else if (verb == "restore") {
            replicator.restore(first, second);
        } else if (verb == "upload") {
            replicator.upload(first, blob::parse_blob_ref(second));
        } else if (verb == "download") {
            replicator.download(blob::parse_blob_ref(first), second);
        } else if (verb == "verify") {
            const auto report = replicator.verify(first);
            for (const auto& failure : report.failures) {
                std::cout << failure.name << ": " << engine::to_string(failure.kind) << " (" << failure.detail
                          << ")" << std::endl;
            }
            if (!report.ok()) {
                return kExitFailure;
            }
            std::cout << report.verified << " artifacts verified" << std::endl;
        } else if (verb == "push") {
            const auto summary = replicator.push(first, blob::parse_blob_ref(second));
            if (summary.skipped) {
                std::cout << "Up to date: " << summary.fingerprint << std::endl;
            }
        } else if (verb == "pull") {
            replicator.pull(blob::parse_blob_ref(first), second);
        }
    } catch (const engine::CancelledError& ex) {
        logger->warn(ex.what());
        return kExitCancelled;
    } catch (const engine::IntegrityError& ex) {
        logger->error(std::string("Integrity check failed (") + engine::to_string(ex.kind()) + ", " +
                      ex.artifact() + "): " + ex.what());
        return kExitFailure;
    } catch (const std::invalid_argument& ex) {
        logger->error(ex.what());
        std::cerr << usage_text();
        return kExitUsage;
    } catch (const std::exception& ex) {
        logger->error(std::string("Operation failed: ") + ex.what());
        return kExitFailure;
    }
    return kExitSuccess;
}

}  // namespace chunksync::cli
