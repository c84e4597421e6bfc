#include "replication_engine.hpp"

#include "archive_builder.hpp"
#include "artifact_layout.hpp"
#include "bundle_builder.hpp"
#include "change_detector.hpp"
#include "chunk_planner.hpp"
#include "errors.hpp"
#include "scoped_temp_dir.hpp"

#include <algorithm>
#include <iomanip>
#include <mutex>
#include <set>
#include <sstream>
#include <system_error>
#include <vector>

namespace chunksync::engine {

namespace {

EngineConfig validated(EngineConfig config) {
    validate_config(config);
    return config;
}

std::string to_mb(std::uint64_t bytes) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << static_cast<double>(bytes) / (1024.0 * 1024.0) << "MB";
    return oss.str();
}

std::uint64_t size_or_zero(const std::filesystem::path& path) {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    return ec ? 0 : size;
}

// An absent bundle means nothing to extract, so it is not held against the manifest.
Manifest drop_absent_bundle(Manifest manifest, const std::filesystem::path& chunk_dir, Logger& logger) {
    std::error_code ec;
    if (std::filesystem::exists(chunk_dir / layout::kBundleName, ec)) {
        return manifest;
    }
    const auto it = std::find_if(manifest.entries.begin(), manifest.entries.end(),
                                 [](const ManifestEntry& entry) { return entry.name == layout::kBundleName; });
    if (it != manifest.entries.end()) {
        logger.warn("Bundle listed in manifest but not present, continuing without it");
        manifest.entries.erase(it);
    }
    return manifest;
}

}  // namespace

ReplicationEngine::ReplicationEngine(EngineConfig config,
                                     Logger& logger,
                                     BlobStore& store,
                                     SyncStateStore* state,
                                     const CancellationToken& cancel)
    : config_(validated(std::move(config))),
      logger_(logger),
      store_(store),
      state_(state),
      cancel_(cancel),
      scheduler_(config_.max_parallel) {}

void ReplicationEngine::run_batch(const std::string& phase) {
    const auto result = scheduler_.wait_all();
    if (!result.ok()) {
        for (const auto& failure : result.failures) {
            logger_.error(phase + " failed: " + failure);
        }
        logger_.error(phase + ": " + std::to_string(result.failed) + " of " +
                      std::to_string(result.failed + result.succeeded) + " jobs failed");
    }
    result.rethrow_if_failed();
}

void ReplicationEngine::clear_artifacts(const std::filesystem::path& dir) {
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return;
    }
    std::vector<std::filesystem::path> stale;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        const auto name = entry.path().filename().string();
        if (layout::is_artifact_name(name) || name == layout::kManifestName || name == layout::kFingerprintName) {
            stale.push_back(entry.path());
        }
    }
    for (const auto& path : stale) {
        std::filesystem::remove(path);
    }
    if (!stale.empty()) {
        logger_.info("Removed " + std::to_string(stale.size()) + " stale artifacts from " + dir.string());
    }
}

ChunkSummary ReplicationEngine::chunk(const std::filesystem::path& source_dir, const std::filesystem::path& out_dir) {
    cancel_.throw_if_requested();
    std::error_code ec;
    if (!std::filesystem::is_directory(source_dir, ec)) {
        throw PlanningError("Source directory not found: " + source_dir.string());
    }

    ChangeDetector detector(state_, scheduler_, logger_);
    const auto check = detector.against_directory(source_dir, out_dir, cancel_);
    if (check.unchanged) {
        ChunkSummary summary;
        summary.skipped = true;
        summary.fingerprint = check.fingerprint;
        for (const auto& name : list_artifacts(out_dir)) {
            if (layout::parse_chunk_index(name)) {
                ++summary.chunks;
            }
            summary.artifact_bytes += size_or_zero(out_dir / name);
        }
        logger_.info("Chunks in " + out_dir.string() + " are up to date, skipping rebuild");
        return summary;
    }
    return build_artifacts(source_dir, out_dir, check.fingerprint);
}

ChunkSummary ReplicationEngine::build_artifacts(const std::filesystem::path& source_dir,
                                                const std::filesystem::path& out_dir,
                                                const std::string& fingerprint) {
    std::filesystem::create_directories(out_dir);
    clear_artifacts(out_dir);
    cancel_.throw_if_requested();

    const SourceTree tree{source_dir, config_.large_subtrees};
    const auto chunks = plan_chunks(tree, config_.chunk_size_bytes, logger_);
    cancel_.throw_if_requested();

    std::vector<ArchiveStats> chunk_stats(chunks.size());
    BundleStats bundle_stats;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        const auto output = out_dir / layout::chunk_archive_name(chunks[i].index);
        scheduler_.submit("build " + output.filename().string(), [&, i, output] {
            chunk_stats[i] = build_chunk_archive(chunks[i], source_dir, output, config_.compression_level, logger_,
                                                 cancel_);
        });
    }
    scheduler_.submit("build bundle", [&] {
        bundle_stats = build_bundle(tree, out_dir / layout::kBundleName, config_.compression_level, logger_, cancel_);
    });
    try {
        run_batch("Archive build");
    } catch (const std::exception&) {
        // A manifest is never written over an incomplete artifact set.
        std::error_code ignored;
        for (const auto& name : list_artifacts(out_dir)) {
            std::filesystem::remove(out_dir / name, ignored);
        }
        throw;
    }
    cancel_.throw_if_requested();

    auto manifest = generate_manifest(out_dir, scheduler_, logger_);
    manifest.fingerprint = fingerprint;
    write_manifest(manifest, out_dir);

    ChunkSummary summary;
    summary.chunks = chunks.size();
    summary.bundle_entries = bundle_stats.entries;
    summary.fingerprint = fingerprint;
    for (const auto& stats : chunk_stats) {
        summary.source_bytes += stats.input_bytes;
        summary.artifact_bytes += stats.archive_bytes;
    }
    summary.source_bytes += bundle_stats.input_bytes;
    summary.artifact_bytes += bundle_stats.archive_bytes;

    logger_.info("Chunking completed: " + std::to_string(summary.chunks) + " chunks + 1 bundle, " +
                 to_mb(summary.source_bytes) + " in, " + to_mb(summary.artifact_bytes) + " out, written to " +
                 out_dir.string());
    return summary;
}

RestoreSummary ReplicationEngine::restore(const std::filesystem::path& chunk_dir,
                                          const std::filesystem::path& dest_dir) {
    cancel_.throw_if_requested();
    logger_.info("Restoring " + chunk_dir.string() + " to " + dest_dir.string());
    const auto manifest = drop_absent_bundle(read_manifest(chunk_dir), chunk_dir, logger_);

    // Nothing touches dest_dir until every artifact passed its checks.
    std::vector<std::string> chunk_names;
    bool has_bundle = false;
    for (const auto& entry : manifest.entries) {
        if (layout::parse_chunk_index(entry.name)) {
            validate_chunk_archive(chunk_dir / entry.name, logger_);
            chunk_names.push_back(entry.name);
        } else if (entry.name == layout::kBundleName) {
            has_bundle = validate_bundle(chunk_dir / entry.name, logger_);
        }
    }
    cancel_.throw_if_requested();
    verify_manifest(chunk_dir, manifest, scheduler_, logger_).throw_if_failed();
    cancel_.throw_if_requested();

    std::filesystem::create_directories(dest_dir);
    RestoreSummary summary;
    std::mutex summary_mutex;
    const auto accumulate = [&](const ExtractStats& stats) {
        std::lock_guard<std::mutex> lock(summary_mutex);
        ++summary.artifacts;
        summary.entries += stats.entries;
        summary.bytes += stats.bytes;
        summary.executables_fixed += stats.executables_fixed;
    };
    for (const auto& name : chunk_names) {
        scheduler_.submit("extract " + name, [&, name] {
            accumulate(extract_chunk_archive(chunk_dir / name, dest_dir, logger_, cancel_));
        });
    }
    if (has_bundle) {
        scheduler_.submit("extract bundle", [&] {
            accumulate(extract_bundle(chunk_dir / layout::kBundleName, dest_dir, logger_, cancel_));
        });
    }
    run_batch("Extraction");

    logger_.info("Restore completed: " + std::to_string(summary.artifacts) + " artifacts, " +
                 std::to_string(summary.entries) + " entries, " + to_mb(summary.bytes) + " into " +
                 dest_dir.string());
    return summary;
}

TransferSummary ReplicationEngine::upload(const std::filesystem::path& chunk_dir, const BlobRef& prefix) {
    cancel_.throw_if_requested();
    const auto manifest = read_manifest(chunk_dir);
    logger_.info("Uploading " + std::to_string(manifest.entries.size()) + " artifacts from " + chunk_dir.string() +
                 " to " + prefix.uri());

    TransferSummary summary;
    std::mutex summary_mutex;
    for (const auto& entry : manifest.entries) {
        scheduler_.submit("upload " + entry.name, [&, name = entry.name] {
            cancel_.throw_if_requested();
            const auto local = chunk_dir / name;
            store_.put(local, prefix.child(name));
            std::lock_guard<std::mutex> lock(summary_mutex);
            ++summary.objects;
            summary.bytes += size_or_zero(local);
        });
    }
    run_batch("Upload");
    cancel_.throw_if_requested();

    // Manifest goes up only once every artifact it lists is in place.
    const auto manifest_path = chunk_dir / layout::kManifestName;
    store_.put(manifest_path, prefix.child(layout::kManifestName));
    ++summary.objects;
    summary.bytes += size_or_zero(manifest_path);

    const auto fingerprint_path = chunk_dir / layout::kFingerprintName;
    std::error_code ec;
    if (std::filesystem::is_regular_file(fingerprint_path, ec)) {
        store_.put(fingerprint_path, prefix.child(layout::kFingerprintName));
        ++summary.objects;
        summary.bytes += size_or_zero(fingerprint_path);
    }

    logger_.info("Upload completed: " + std::to_string(summary.objects) + " objects, " + to_mb(summary.bytes) +
                 " to " + prefix.uri());
    return summary;
}

TransferSummary ReplicationEngine::download(const BlobRef& prefix, const std::filesystem::path& chunk_dir) {
    cancel_.throw_if_requested();
    logger_.info("Downloading artifacts from " + prefix.uri() + " to " + chunk_dir.string());

    std::set<std::string> remote;
    for (const auto& key : store_.list(prefix)) {
        remote.insert(BlobRef{prefix.bucket, key}.name());
    }
    if (remote.count(std::string(layout::kManifestName)) == 0) {
        throw IntegrityError(IntegrityFailure::kMissingManifest, std::string(layout::kManifestName),
                             "Checksum manifest not found at " + prefix.uri());
    }

    std::filesystem::create_directories(chunk_dir);
    clear_artifacts(chunk_dir);

    TransferSummary summary;
    std::mutex summary_mutex;
    const auto fetch = [&](const std::string& name) {
        cancel_.throw_if_requested();
        const auto local = chunk_dir / name;
        store_.get(prefix.child(name), local);
        std::lock_guard<std::mutex> lock(summary_mutex);
        ++summary.objects;
        summary.bytes += size_or_zero(local);
    };

    // The manifest decides what belongs to this release; other keys under the prefix are leftovers.
    fetch(std::string(layout::kManifestName));
    const auto manifest = read_manifest(chunk_dir);
    std::vector<std::string> wanted;
    std::vector<std::string> chunk_names;
    for (const auto& entry : manifest.entries) {
        if (entry.name == layout::kBundleName && remote.count(entry.name) == 0) {
            logger_.warn("Bundle file not found at " + prefix.uri() + ", continuing without it");
            continue;
        }
        if (remote.count(entry.name) == 0) {
            throw IntegrityError(IntegrityFailure::kMissingArtifact, entry.name,
                                 "Artifact " + entry.name + " listed in manifest but not found at " + prefix.uri());
        }
        if (layout::parse_chunk_index(entry.name)) {
            chunk_names.push_back(entry.name);
        }
        wanted.push_back(entry.name);
    }
    logger_.info("Found " + std::to_string(chunk_names.size()) + " chunk files to download");
    for (const auto& name : wanted) {
        scheduler_.submit("download " + name, [&, name] { fetch(name); });
    }
    run_batch("Download");
    cancel_.throw_if_requested();

    for (const auto& name : chunk_names) {
        validate_chunk_archive(chunk_dir / name, logger_);
    }
    if (remote.count(std::string(layout::kFingerprintName)) != 0) {
        fetch(std::string(layout::kFingerprintName));
    }

    logger_.info("Download completed: " + std::to_string(summary.objects) + " objects, " + to_mb(summary.bytes) +
                 " from " + prefix.uri());
    return summary;
}

VerificationReport ReplicationEngine::verify(const std::filesystem::path& chunk_dir) {
    cancel_.throw_if_requested();
    const auto manifest = drop_absent_bundle(read_manifest(chunk_dir), chunk_dir, logger_);
    return verify_manifest(chunk_dir, manifest, scheduler_, logger_);
}

PushSummary ReplicationEngine::push(const std::filesystem::path& source_dir, const BlobRef& prefix) {
    cancel_.throw_if_requested();
    std::error_code ec;
    if (!std::filesystem::is_directory(source_dir, ec)) {
        throw PlanningError("Source directory not found: " + source_dir.string());
    }

    ChangeDetector detector(state_, scheduler_, logger_);
    const auto check = detector.against_remote(source_dir, prefix.uri(), cancel_);
    PushSummary summary;
    summary.fingerprint = check.fingerprint;
    if (check.unchanged) {
        summary.skipped = true;
        logger_.info("No changes since last push to " + prefix.uri() + ", nothing to do");
        return summary;
    }

    ScopedTempDir staging("chunksync-push");
    const auto chunk_dir = staging.path() / "chunks";
    summary.chunk = build_artifacts(source_dir, chunk_dir, check.fingerprint);
    summary.upload = upload(chunk_dir, prefix);
    detector.record_success(source_dir, prefix.uri(), check.fingerprint, summary.chunk.chunks + 1,
                            summary.chunk.artifact_bytes);
    logger_.info("Push completed: " + source_dir.string() + " -> " + prefix.uri());
    return summary;
}

RestoreSummary ReplicationEngine::pull(const BlobRef& prefix, const std::filesystem::path& dest_dir) {
    ScopedTempDir staging("chunksync-pull");
    const auto chunk_dir = staging.path() / "chunks";
    download(prefix, chunk_dir);
    auto summary = restore(chunk_dir, dest_dir);
    logger_.info("Pull completed: " + prefix.uri() + " -> " + dest_dir.string());
    return summary;
}

}  // namespace chunksync::engine
