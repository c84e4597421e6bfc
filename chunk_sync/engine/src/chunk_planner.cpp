#include "chunk_planner.hpp"

#include "errors.hpp"

#include <algorithm>
#include <system_error>

namespace chunksync::engine {

namespace {

std::string to_mb(std::uint64_t bytes) {
    return std::to_string(bytes / 1024 / 1024) + "MB";
}

}  // namespace

std::vector<std::filesystem::path> SourceTree::large_roots() const {
    std::vector<std::filesystem::path> roots;
    for (const auto& name : large_subtrees) {
        const auto candidate = root / name;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(candidate, ec);
        if (ec || !std::filesystem::is_directory(status)) {
            continue;
        }
        roots.push_back(candidate);
    }
    return roots;
}

bool SourceTree::is_large(const std::string& top_level_name) const {
    if (std::find(large_subtrees.begin(), large_subtrees.end(), top_level_name) == large_subtrees.end()) {
        return false;
    }
    std::error_code ec;
    return std::filesystem::is_directory(std::filesystem::symlink_status(root / top_level_name, ec));
}

std::vector<SourceFile> enumerate_files(const std::vector<std::filesystem::path>& roots, Logger& logger) {
    std::vector<SourceFile> files;
    for (const auto& root : roots) {
        std::error_code ec;
        std::filesystem::recursive_directory_iterator it(root, ec);
        if (ec) {
            throw PlanningError("Unable to read " + root.string() + ": " + ec.message());
        }
        for (const auto end = std::filesystem::recursive_directory_iterator(); it != end; it.increment(ec)) {
            if (ec) {
                throw PlanningError("Unable to walk " + root.string() + ": " + ec.message());
            }
            const auto& entry = *it;
            std::error_code entry_ec;
            if (entry.is_symlink(entry_ec)) {
                files.push_back({entry.path(), 0});
                continue;
            }
            if (!entry.is_regular_file(entry_ec)) {
                continue;
            }
            const auto size = entry.file_size(entry_ec);
            if (entry_ec) {
                logger.warn("File vanished during enumeration, skipping: " + entry.path().string());
                continue;
            }
            files.push_back({entry.path(), size});
        }
        if (ec) {
            throw PlanningError("Unable to walk " + root.string() + ": " + ec.message());
        }
    }
    return files;
}

std::vector<Chunk> pack_chunks(std::vector<SourceFile> files, std::uint64_t bound, Logger& logger) {
    std::sort(files.begin(), files.end(), [](const SourceFile& a, const SourceFile& b) {
        if (a.size != b.size) {
            return a.size > b.size;
        }
        return a.path < b.path;
    });

    std::vector<Chunk> chunks;
    Chunk current{1, {}, 0, bound};
    bool large_files_warned = false;

    auto close_current = [&] {
        if (current.files.empty()) {
            return;
        }
        const auto next_index = current.index + 1;
        chunks.push_back(std::move(current));
        current = Chunk{next_index, {}, 0, bound};
    };

    for (auto& file : files) {
        if (file.size > bound * 2 && !large_files_warned) {
            logger.warn("Found files larger than 2x chunk size (" + to_mb(file.size) +
                        "). Consider increasing the chunk size.");
            large_files_warned = true;
        }

        if (file.size > bound) {
            close_current();
            logger.info("Large file (" + to_mb(file.size) + ") assigned to chunk " +
                        std::to_string(current.index) + ": " + file.path.filename().string());
            current.files.push_back(std::move(file.path));
            current.total_bytes = file.size;
            close_current();
            continue;
        }

        if (!current.files.empty() && current.total_bytes + file.size > bound) {
            close_current();
        }
        current.files.push_back(std::move(file.path));
        current.total_bytes += file.size;
    }
    close_current();
    return chunks;
}

std::vector<Chunk> plan_chunks(const SourceTree& tree, std::uint64_t bound, Logger& logger) {
    std::error_code ec;
    if (!std::filesystem::is_directory(tree.root, ec)) {
        throw PlanningError("Source directory not found: " + tree.root.string());
    }
    const auto roots = tree.large_roots();
    if (roots.empty()) {
        logger.warn("No large subtree found under " + tree.root.string() + ", nothing to chunk");
        return {};
    }

    auto files = enumerate_files(roots, logger);
    std::uint64_t total = 0;
    for (const auto& file : files) {
        total += file.size;
    }
    auto chunks = pack_chunks(std::move(files), bound, logger);
    logger.info("Planned " + std::to_string(chunks.size()) + " chunks over " + to_mb(total) +
                " (bound " + to_mb(bound) + ")");
    return chunks;
}

}  // namespace chunksync::engine
