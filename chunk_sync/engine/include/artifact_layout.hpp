#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace chunksync::engine::layout {

inline constexpr std::string_view kChunkPrefix = "chunk_";
inline constexpr std::string_view kChunkSuffix = ".tar.gz";
inline constexpr std::string_view kBundleName = "other_folders.zip";
inline constexpr std::string_view kManifestName = "manifest.sha256";
inline constexpr std::string_view kFingerprintName = "source.fingerprint";

inline std::string chunk_archive_name(std::size_t index) {
    return std::string(kChunkPrefix) + std::to_string(index) + std::string(kChunkSuffix);
}

// Index encoded in a chunk archive name, or nullopt for any other file.
inline std::optional<std::size_t> parse_chunk_index(std::string_view name) {
    if (name.size() <= kChunkPrefix.size() + kChunkSuffix.size()) {
        return std::nullopt;
    }
    if (name.substr(0, kChunkPrefix.size()) != kChunkPrefix ||
        name.substr(name.size() - kChunkSuffix.size()) != kChunkSuffix) {
        return std::nullopt;
    }
    const auto digits = name.substr(kChunkPrefix.size(), name.size() - kChunkPrefix.size() - kChunkSuffix.size());
    std::size_t value = 0;
    for (char c : digits) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        value = value * 10 + static_cast<std::size_t>(c - '0');
    }
    if (value == 0) {
        return std::nullopt;
    }
    return value;
}

inline bool is_artifact_name(std::string_view name) {
    return parse_chunk_index(name).has_value() || name == kBundleName;
}

}  // namespace chunksync::engine::layout
