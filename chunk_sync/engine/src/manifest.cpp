#include "manifest.hpp"

#include "artifact_layout.hpp"
#include "digest.hpp"

#include <algorithm>
#include <atomic>
#include <fstream>
#include <mutex>
#include <system_error>

namespace chunksync::engine {

namespace {

bool is_hex_digest(const std::string& value) {
    return value.size() == 64 && std::all_of(value.begin(), value.end(), [](char c) {
               return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
           });
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return "";
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

void write_atomically(const std::filesystem::path& file, const std::string& content) {
    auto temp = file;
    temp += ".tmp";
    {
        std::ofstream stream(temp, std::ios::binary | std::ios::trunc);
        stream << content;
        stream.flush();
        if (!stream) {
            throw BuildError("Unable to write " + file.string());
        }
    }
    std::filesystem::rename(temp, file);
}

// Runs work(i) for i in [0, count) on every worker of the scheduler.
void parallel_for(JobScheduler& scheduler, const std::string& label, std::size_t count,
                  const std::function<void(std::size_t)>& work) {
    std::atomic<std::size_t> next{0};
    const auto workers = std::min(scheduler.max_parallel(), std::max<std::size_t>(count, 1));
    for (std::size_t w = 0; w < workers; ++w) {
        scheduler.submit(label + " worker " + std::to_string(w), [&] {
            for (auto i = next.fetch_add(1); i < count; i = next.fetch_add(1)) {
                work(i);
            }
        });
    }
    scheduler.wait_all().rethrow_if_failed();
}

}  // namespace

const ManifestEntry* Manifest::find(const std::string& name) const {
    const auto it = std::find_if(entries.begin(), entries.end(), [&](const ManifestEntry& entry) {
        return entry.name == name;
    });
    return it == entries.end() ? nullptr : &*it;
}

void VerificationReport::throw_if_failed() const {
    if (failures.empty()) {
        return;
    }
    const auto& first = failures.front();
    throw IntegrityError(first.kind, first.name,
                         "Checksum verification failed for " + std::to_string(failures.size()) +
                             " artifacts (first: " + first.name + ", " + to_string(first.kind) + ")");
}

std::vector<std::string> list_artifacts(const std::filesystem::path& chunk_dir) {
    std::vector<std::pair<std::size_t, std::string>> chunks;
    bool has_bundle = false;
    std::error_code ec;
    for (const auto& entry : std::filesystem::directory_iterator(chunk_dir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (const auto index = layout::parse_chunk_index(name)) {
            chunks.emplace_back(*index, name);
        } else if (name == layout::kBundleName) {
            has_bundle = true;
        }
    }
    std::sort(chunks.begin(), chunks.end());

    std::vector<std::string> names;
    for (auto& chunk : chunks) {
        names.push_back(std::move(chunk.second));
    }
    if (has_bundle) {
        names.emplace_back(layout::kBundleName);
    }
    return names;
}

Manifest generate_manifest(const std::filesystem::path& chunk_dir, JobScheduler& scheduler, Logger& logger) {
    logger.info("Generating checksums for artifacts in: " + chunk_dir.string());
    const auto names = list_artifacts(chunk_dir);
    Manifest manifest;
    manifest.entries.resize(names.size());
    parallel_for(scheduler, "checksum", names.size(), [&](std::size_t i) {
        manifest.entries[i] = ManifestEntry{names[i], sha256_file(chunk_dir / names[i])};
    });
    logger.info("Generated checksums for " + std::to_string(manifest.entries.size()) + " artifacts");
    return manifest;
}

void write_manifest(const Manifest& manifest, const std::filesystem::path& chunk_dir) {
    std::string content;
    for (const auto& entry : manifest.entries) {
        content += entry.digest + "  " + entry.name + "\n";
    }
    write_atomically(chunk_dir / layout::kManifestName, content);
    if (!manifest.fingerprint.empty()) {
        write_fingerprint(chunk_dir / layout::kFingerprintName, manifest.fingerprint);
    }
}

Manifest read_manifest(const std::filesystem::path& chunk_dir) {
    const auto path = chunk_dir / layout::kManifestName;
    std::ifstream stream(path);
    if (!stream.is_open()) {
        throw IntegrityError(IntegrityFailure::kMissingManifest, std::string(layout::kManifestName),
                             "Checksum manifest not found: " + path.string());
    }

    Manifest manifest;
    std::string line;
    std::size_t line_number = 0;
    while (std::getline(stream, line)) {
        ++line_number;
        line = trim(line);
        if (line.empty()) {
            continue;
        }
        const auto space = line.find(' ');
        const auto digest = line.substr(0, space);
        auto name = space == std::string::npos ? std::string() : trim(line.substr(space + 1));
        if (!name.empty() && name.front() == '*') {
            name.erase(0, 1);
        }
        if (!is_hex_digest(digest) || name.empty() || name.find('/') != std::string::npos) {
            throw IntegrityError(IntegrityFailure::kMissingManifest, std::string(layout::kManifestName),
                                 "Malformed manifest line " + std::to_string(line_number) + " in " + path.string());
        }
        if (manifest.find(name) != nullptr) {
            throw IntegrityError(IntegrityFailure::kMissingManifest, std::string(layout::kManifestName),
                                 "Duplicate manifest entry " + name + " in " + path.string());
        }
        manifest.entries.push_back({name, digest});
    }
    if (auto fingerprint = read_fingerprint(chunk_dir / layout::kFingerprintName)) {
        manifest.fingerprint = std::move(*fingerprint);
    }
    return manifest;
}

VerificationReport verify_manifest(const std::filesystem::path& chunk_dir,
                                   const Manifest& manifest,
                                   JobScheduler& scheduler,
                                   Logger& logger) {
    logger.info("Verifying " + std::to_string(manifest.entries.size()) + " artifacts against checksums");
    VerificationReport report;
    std::mutex report_mutex;

    parallel_for(scheduler, "verify", manifest.entries.size(), [&](std::size_t i) {
        const auto& entry = manifest.entries[i];
        const auto path = chunk_dir / entry.name;
        std::error_code ec;
        if (!std::filesystem::is_regular_file(path, ec)) {
            logger.error("Missing file: " + path.string());
            std::lock_guard<std::mutex> lock(report_mutex);
            report.failures.push_back({entry.name, IntegrityFailure::kMissingArtifact, "missing"});
            return;
        }
        const auto actual = sha256_file(path);
        std::lock_guard<std::mutex> lock(report_mutex);
        if (actual != entry.digest) {
            logger.error("Checksum mismatch for " + path.string() + " (expected " + entry.digest + ", actual " +
                         actual + ", size " + std::to_string(std::filesystem::file_size(path)) + " bytes)");
            report.failures.push_back({entry.name, IntegrityFailure::kDigestMismatch, "expected " + entry.digest +
                                                                                          ", actual " + actual});
            return;
        }
        ++report.verified;
    });

    for (const auto& name : list_artifacts(chunk_dir)) {
        if (manifest.find(name) == nullptr) {
            logger.error("Artifact not listed in manifest: " + name);
            report.failures.push_back({name, IntegrityFailure::kUnlistedArtifact, "not in manifest"});
        }
    }

    std::sort(report.failures.begin(), report.failures.end(),
              [](const ManifestFailure& a, const ManifestFailure& b) { return a.name < b.name; });
    if (report.ok()) {
        logger.info("All checksums verified successfully");
    } else {
        logger.error("Checksum verification failed for " + std::to_string(report.failures.size()) + " files");
    }
    return report;
}

std::optional<std::string> read_fingerprint(const std::filesystem::path& file) {
    std::ifstream stream(file);
    if (!stream.is_open()) {
        return std::nullopt;
    }
    std::string value;
    std::getline(stream, value);
    value = trim(value);
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

void write_fingerprint(const std::filesystem::path& file, const std::string& fingerprint) {
    write_atomically(file, fingerprint + "\n");
}

std::string compute_fingerprint(const std::filesystem::path& root,
                                JobScheduler& scheduler,
                                Logger& logger,
                                const CancellationToken& cancel) {
    std::error_code ec;
    if (!std::filesystem::is_directory(root, ec)) {
        throw PlanningError("Source directory not found: " + root.string());
    }

    std::vector<std::string> relatives;
    std::filesystem::recursive_directory_iterator it(root, ec);
    for (const auto end = std::filesystem::recursive_directory_iterator(); !ec && it != end; it.increment(ec)) {
        std::error_code entry_ec;
        if (it->is_symlink(entry_ec) || it->is_regular_file(entry_ec)) {
            relatives.push_back(it->path().lexically_relative(root).generic_string());
        }
    }
    if (ec) {
        throw PlanningError("Unable to walk " + root.string() + ": " + ec.message());
    }
    std::sort(relatives.begin(), relatives.end());

    std::vector<std::string> digests(relatives.size());
    parallel_for(scheduler, "fingerprint", relatives.size(), [&](std::size_t i) {
        cancel.throw_if_requested();
        const auto file = root / relatives[i];
        std::error_code link_ec;
        if (std::filesystem::is_symlink(std::filesystem::symlink_status(file, link_ec))) {
            digests[i] = sha256_hex("symlink:" + std::filesystem::read_symlink(file).string());
            return;
        }
        try {
            digests[i] = sha256_file(file);
        } catch (const std::runtime_error& ex) {
            throw PlanningError(std::string("Unable to fingerprint source: ") + ex.what());
        }
    });

    Sha256 aggregate;
    for (std::size_t i = 0; i < relatives.size(); ++i) {
        aggregate.update(digests[i] + "  " + relatives[i] + "\n");
    }
    auto fingerprint = aggregate.finish_hex();
    logger.info("Source fingerprint for " + root.string() + ": " + fingerprint + " (" +
                std::to_string(relatives.size()) + " files)");
    return fingerprint;
}

}  // namespace chunksync::engine
