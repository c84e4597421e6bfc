#include "config_loader.hpp"

#include "logger.hpp"

#include <algorithm>
#include <cstdint>
#include <fstream>
#include <iostream>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace chunksync::engine {

namespace {

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

std::vector<std::string> split_list(const std::string& value, char separator) {
    std::vector<std::string> items;
    std::istringstream stream(value);
    std::string item;
    while (std::getline(stream, item, separator)) {
        item = trim(item);
        if (!item.empty()) {
            items.push_back(item);
        }
    }
    return items;
}

// Digits only, so "-1" cannot wrap around; scale is applied with an overflow check.
std::uint64_t parse_unsigned(const std::string& key, const std::string& value, std::uint64_t scale = 1) {
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](char c) { return c >= '0' && c <= '9'; })) {
        throw std::invalid_argument(key + " expects a non-negative integer, got '" + value + "'");
    }
    std::uint64_t number = 0;
    try {
        number = std::stoull(value);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument(key + " is out of range: " + value);
    }
    if (number > std::numeric_limits<std::uint64_t>::max() / scale) {
        throw std::invalid_argument(key + " is out of range: " + value);
    }
    return number * scale;
}

}  // namespace

EngineConfig load_config(const std::string& path) {
    EngineConfig config;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        std::cerr << "[WARN] Unable to open config file " << path
                  << ", falling back to defaults" << std::endl;
        return config;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line[0] == '#') {
            continue;
        }
        const auto equals_pos = line.find('=');
        if (equals_pos == std::string::npos) {
            continue;
        }
        const std::string key = trim(line.substr(0, equals_pos));
        const std::string value = trim(line.substr(equals_pos + 1));

        if (key == "chunk_size_mb") {
            config.chunk_size_bytes = parse_unsigned(key, value, 1024 * 1024);
        } else if (key == "chunk_size_bytes") {
            config.chunk_size_bytes = parse_unsigned(key, value);
        } else if (key == "max_parallel") {
            config.max_parallel = static_cast<std::size_t>(parse_unsigned(key, value));
        } else if (key == "compression_level") {
            config.compression_level = std::stoi(value);
        } else if (key == "log_file") {
            config.log_file = value;
        } else if (key == "log_level") {
            config.log_level = value;
        } else if (key == "log_console") {
            config.log_console = value == "true" || value == "1" || value == "yes";
        } else if (key == "large_subtrees") {
            config.large_subtrees = split_list(value, ',');
        } else if (key == "state_database") {
            config.state_database = value;
        } else if (key == "blob_backend") {
            config.blob_backend = value;
        } else if (key == "blob_store_root") {
            config.blob_store_root = value;
        } else if (key == "aws_cli") {
            config.aws_cli = value;
        } else if (key == "aws_cli_args") {
            config.aws_cli_args = split_list(value, ' ');
        }
    }

    return config;
}

void validate_config(const EngineConfig& config) {
    if (config.chunk_size_bytes == 0) {
        throw std::invalid_argument("chunk size must be > 0");
    }
    if (config.max_parallel == 0) {
        throw std::invalid_argument("max_parallel must be > 0");
    }
    if (config.compression_level < 1 || config.compression_level > 9) {
        throw std::invalid_argument("compression_level must be within 1..9");
    }
    parse_log_level(config.log_level);
    if (config.large_subtrees.empty()) {
        throw std::invalid_argument("large_subtrees must name at least one directory");
    }
    for (const auto& name : config.large_subtrees) {
        if (name.find('/') != std::string::npos || name == "." || name == "..") {
            throw std::invalid_argument("large_subtrees entries must be plain directory names: " + name);
        }
    }
    if (config.blob_backend != "filesystem" && config.blob_backend != "aws-cli") {
        throw std::invalid_argument("Unknown blob_backend: " + config.blob_backend);
    }
}

}  // namespace chunksync::engine
