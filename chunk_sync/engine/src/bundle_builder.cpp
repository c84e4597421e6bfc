#include "bundle_builder.hpp"

#include "errors.hpp"

#include <sys/stat.h>
#include <zip.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <deque>
#include <fstream>
#include <memory>
#include <system_error>
#include <vector>

namespace chunksync::engine {

namespace {

constexpr std::size_t kCopyBuffer = 1024 * 1024;

using ZipHandle = std::unique_ptr<zip_t, decltype(&zip_discard)>;

std::string zip_error_message(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

time_t mtime_of(const std::filesystem::path& path) {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    const auto sys_time = decltype(ftime)::clock::to_sys(ftime);
    return static_cast<time_t>(
        std::chrono::duration_cast<std::chrono::seconds>(sys_time.time_since_epoch()).count());
}

class BundleWriter {
public:
    BundleWriter(zip_t* archive, int level, Logger& logger, const CancellationToken& cancel)
        : archive_(archive), level_(level), logger_(logger), cancel_(cancel) {}

    void add_tree(const std::filesystem::path& root, const std::filesystem::path& entry) {
        cancel_.throw_if_requested();
        const auto member = entry.lexically_relative(root).generic_string();
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(entry, ec);
        if (ec || !std::filesystem::exists(status)) {
            logger_.warn("Entry disappeared before bundling, skipping: " + entry.string());
            return;
        }
        const auto mode = static_cast<zip_uint32_t>(status.permissions()) & 07777;

        if (std::filesystem::is_symlink(status)) {
            add_symlink(entry, member);
            return;
        }
        if (std::filesystem::is_directory(status)) {
            const auto index = zip_dir_add(archive_, (member + "/").c_str(), ZIP_FL_ENC_UTF_8);
            if (index < 0) {
                fail("Unable to add directory " + member);
            }
            set_attributes(static_cast<zip_uint64_t>(index), S_IFDIR | mode, mtime_of(entry));
            ++entries_;

            std::vector<std::filesystem::path> children;
            for (const auto& child : std::filesystem::directory_iterator(entry)) {
                children.push_back(child.path());
            }
            std::sort(children.begin(), children.end());
            for (const auto& child : children) {
                add_tree(root, child);
            }
            return;
        }
        if (!std::filesystem::is_regular_file(status)) {
            logger_.warn("Skipping special file in bundle: " + entry.string());
            return;
        }

        zip_source_t* source = zip_source_file(archive_, entry.c_str(), 0, 0);
        if (source == nullptr) {
            fail("Unable to read " + entry.string());
        }
        const auto index = zip_file_add(archive_, member.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
        if (index < 0) {
            zip_source_free(source);
            fail("Unable to add " + member);
        }
        if (zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index), ZIP_CM_DEFLATE,
                                     static_cast<zip_uint32_t>(level_)) != 0) {
            fail("Unable to set compression for " + member);
        }
        set_attributes(static_cast<zip_uint64_t>(index), S_IFREG | mode, mtime_of(entry));
        input_bytes_ += std::filesystem::file_size(entry);
        ++entries_;
    }

    std::size_t entries() const { return entries_; }
    std::uint64_t input_bytes() const { return input_bytes_; }

private:
    void add_symlink(const std::filesystem::path& entry, const std::string& member) {
        std::error_code ec;
        const auto target = std::filesystem::read_symlink(entry, ec);
        if (ec) {
            logger_.warn("Symlink disappeared before bundling, skipping: " + entry.string());
            return;
        }
        // libzip reads buffer sources at zip_close time.
        const auto& data = link_targets_.emplace_back(target.string());
        zip_source_t* source = zip_source_buffer(archive_, data.data(), data.size(), 0);
        if (source == nullptr) {
            fail("Unable to create source for symlink " + member);
        }
        const auto index = zip_file_add(archive_, member.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8);
        if (index < 0) {
            zip_source_free(source);
            fail("Unable to add symlink " + member);
        }
        zip_set_file_compression(archive_, static_cast<zip_uint64_t>(index), ZIP_CM_STORE, 0);
        set_attributes(static_cast<zip_uint64_t>(index), S_IFLNK | 0777, 0);
        ++entries_;
    }

    void set_attributes(zip_uint64_t index, zip_uint32_t mode, time_t mtime) {
        if (zip_file_set_external_attributes(archive_, index, 0, ZIP_OPSYS_UNIX, mode << 16) != 0) {
            fail("Unable to set attributes");
        }
        if (mtime > 0 && zip_file_set_mtime(archive_, index, mtime, 0) != 0) {
            fail("Unable to set modification time");
        }
    }

    [[noreturn]] void fail(const std::string& what) {
        throw BuildError(what + ": " + zip_strerror(archive_));
    }

    zip_t* archive_;
    int level_;
    Logger& logger_;
    const CancellationToken& cancel_;
    std::deque<std::string> link_targets_;
    std::size_t entries_ = 0;
    std::uint64_t input_bytes_ = 0;
};

void write_placeholder(const std::filesystem::path& output) {
    std::ofstream placeholder(output, std::ios::binary | std::ios::trunc);
    if (!placeholder) {
        throw BuildError("Unable to create bundle placeholder: " + output.string());
    }
}

void write_bundle(const SourceTree& tree, const std::filesystem::path& output, int compression_level,
                  BundleStats& stats, Logger& logger, const CancellationToken& cancel) {
    std::vector<std::filesystem::path> included;
    for (const auto& entry : std::filesystem::directory_iterator(tree.root)) {
        const auto name = entry.path().filename().string();
        if (tree.is_large(name)) {
            logger.info("Excluding from bundle: " + name + " (chunked separately)");
            continue;
        }
        logger.info("Including in bundle: " + name);
        included.push_back(entry.path());
    }
    std::sort(included.begin(), included.end());

    if (included.empty()) {
        logger.info("No other folders found to bundle, writing empty placeholder");
        write_placeholder(output);
        return;
    }

    int error_code = 0;
    ZipHandle archive(zip_open(output.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error_code), zip_discard);
    if (!archive) {
        throw BuildError("Unable to create bundle " + output.string() + ": " + zip_error_message(error_code));
    }

    BundleWriter writer(archive.get(), compression_level, logger, cancel);
    for (const auto& entry : included) {
        writer.add_tree(tree.root, entry);
    }
    cancel.throw_if_requested();

    if (writer.entries() == 0) {
        archive.reset();
        write_placeholder(output);
        return;
    }
    if (zip_close(archive.get()) != 0) {
        throw BuildError("Failed to write bundle " + output.string() + ": " + zip_strerror(archive.get()));
    }
    archive.release();
    stats.entries = writer.entries();
    stats.input_bytes = writer.input_bytes();
}

void remove_partial(const std::filesystem::path& output, Logger& logger) {
    std::error_code ec;
    std::filesystem::remove(output, ec);
    if (ec) {
        logger.error("Unable to remove partial bundle " + output.string() + ": " + ec.message());
    }
}

void write_member(zip_t* archive, zip_uint64_t index, const std::string& name, const std::filesystem::path& target,
                  std::vector<char>& buffer, const CancellationToken& cancel) {
    std::unique_ptr<zip_file_t, decltype(&zip_fclose)> file(zip_fopen_index(archive, index, 0), zip_fclose);
    if (!file) {
        throw ExtractionError("Unable to open bundle member " + name + ": " + zip_strerror(archive));
    }
    std::ofstream output(target, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw ExtractionError("Unable to create " + target.string());
    }
    while (true) {
        cancel.throw_if_requested();
        const auto got = zip_fread(file.get(), buffer.data(), buffer.size());
        if (got < 0) {
            throw ExtractionError("Failed to decode bundle member " + name + ": " + zip_file_strerror(file.get()));
        }
        if (got == 0) {
            break;
        }
        output.write(buffer.data(), static_cast<std::streamsize>(got));
        if (!output) {
            throw ExtractionError("Write failed for " + target.string() + " (disk full?)");
        }
    }
}

std::string read_member(zip_t* archive, zip_uint64_t index, const std::string& name) {
    std::unique_ptr<zip_file_t, decltype(&zip_fclose)> file(zip_fopen_index(archive, index, 0), zip_fclose);
    if (!file) {
        throw ExtractionError("Unable to open bundle member " + name + ": " + zip_strerror(archive));
    }
    std::string content;
    std::array<char, 4096> buffer{};
    while (true) {
        const auto got = zip_fread(file.get(), buffer.data(), buffer.size());
        if (got < 0) {
            throw ExtractionError("Failed to decode bundle member " + name + ": " + zip_file_strerror(file.get()));
        }
        if (got == 0) {
            break;
        }
        content.append(buffer.data(), static_cast<std::size_t>(got));
    }
    return content;
}

void apply_metadata(const std::filesystem::path& target, zip_uint32_t mode, const zip_stat_t& stat, Logger& logger) {
    std::error_code ec;
    if ((mode & 07777) != 0) {
        std::filesystem::permissions(target, static_cast<std::filesystem::perms>(mode & 07777),
                                     std::filesystem::perm_options::replace, ec);
        if (ec) {
            logger.warn("Unable to set permissions on " + target.string() + ": " + ec.message());
        }
    }
    if ((stat.valid & ZIP_STAT_MTIME) != 0) {
        const auto sys_time = std::chrono::system_clock::from_time_t(stat.mtime);
        std::filesystem::last_write_time(target, std::filesystem::file_time_type::clock::from_sys(sys_time), ec);
        if (ec) {
            logger.warn("Unable to set modification time on " + target.string() + ": " + ec.message());
        }
    }
}

}  // namespace

BundleStats build_bundle(const SourceTree& tree,
                         const std::filesystem::path& output,
                         int compression_level,
                         Logger& logger,
                         const CancellationToken& cancel) {
    BundleStats stats;
    stats.path = output;
    std::error_code ec;
    if (!std::filesystem::is_directory(tree.root, ec)) {
        throw PlanningError("Source directory not found: " + tree.root.string());
    }
    logger.info("Creating bundle of non-chunked folders: " + output.filename().string());
    try {
        write_bundle(tree, output, compression_level, stats, logger, cancel);
    } catch (const CancelledError&) {
        remove_partial(output, logger);
        throw;
    } catch (const BuildError& ex) {
        logger.error(std::string("Failed to create bundle: ") + ex.what());
        remove_partial(output, logger);
        throw;
    } catch (const std::exception& ex) {
        logger.error(std::string("Failed to create bundle: ") + ex.what());
        remove_partial(output, logger);
        throw BuildError(std::string("Failed to create bundle: ") + ex.what());
    }

    stats.archive_bytes = std::filesystem::file_size(output);
    if (stats.placeholder()) {
        logger.info("Created empty bundle placeholder: " + output.filename().string());
    } else {
        logger.info("Successfully created bundle: " + output.filename().string() + " (" +
                    std::to_string(stats.entries) + " entries, " + std::to_string(stats.archive_bytes) + " bytes)");
    }
    return stats;
}

bool validate_bundle(const std::filesystem::path& bundle, Logger& logger) {
    std::error_code ec;
    if (!std::filesystem::exists(bundle, ec)) {
        logger.info("No bundle present, nothing to extract");
        return false;
    }
    const auto size = std::filesystem::file_size(bundle, ec);
    if (ec) {
        throw IntegrityError(IntegrityFailure::kMissingArtifact, bundle.filename().string(),
                             "Unable to stat bundle " + bundle.string() + ": " + ec.message());
    }
    if (size == 0) {
        logger.info("Empty bundle placeholder, nothing to extract");
        return false;
    }

    std::array<char, 4> magic{};
    std::ifstream stream(bundle, std::ios::binary);
    stream.read(magic.data(), static_cast<std::streamsize>(magic.size()));
    const bool complete = static_cast<std::size_t>(stream.gcount()) == magic.size();
    const bool local_header = complete && magic[0] == 'P' && magic[1] == 'K' && magic[2] == 3 && magic[3] == 4;
    const bool empty_archive = complete && magic[0] == 'P' && magic[1] == 'K' && magic[2] == 5 && magic[3] == 6;
    if (!local_header && !empty_archive) {
        logger.error("Bundle is not a valid zip archive: " + bundle.string());
        logger.error("File size: " + std::to_string(size) + " bytes");
        logger.error("First bytes: " + leading_bytes_hex(bundle, 32));
        throw IntegrityError(IntegrityFailure::kInvalidHeader, bundle.filename().string(),
                             "Bundle is not a valid zip archive: " + bundle.string());
    }
    return true;
}

ExtractStats extract_bundle(const std::filesystem::path& bundle,
                            const std::filesystem::path& dest_dir,
                            Logger& logger,
                            const CancellationToken& cancel) {
    ExtractStats stats;
    if (!validate_bundle(bundle, logger)) {
        return stats;
    }
    logger.info("Extracting bundle: " + bundle.filename().string() + " to " + dest_dir.string());
    std::filesystem::create_directories(dest_dir);

    int error_code = 0;
    ZipHandle archive(zip_open(bundle.c_str(), ZIP_RDONLY | ZIP_CHECKCONS, &error_code), zip_discard);
    if (!archive) {
        throw ExtractionError("Unable to open bundle " + bundle.string() + ": " + zip_error_message(error_code));
    }

    const auto count = zip_get_num_entries(archive.get(), 0);
    if (count < 0) {
        throw ExtractionError("Unable to read bundle directory: " + bundle.string());
    }
    std::vector<char> buffer(kCopyBuffer);
    std::vector<std::pair<std::filesystem::path, std::pair<zip_uint32_t, zip_stat_t>>> directories;

    for (zip_int64_t i = 0; i < count; ++i) {
        cancel.throw_if_requested();
        const auto index = static_cast<zip_uint64_t>(i);
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(archive.get(), index, 0, &stat) != 0 || (stat.valid & ZIP_STAT_NAME) == 0) {
            throw ExtractionError("Unable to stat bundle member " + std::to_string(i) + ": " +
                                  zip_strerror(archive.get()));
        }
        const std::string name = stat.name;

        zip_uint8_t opsys = 0;
        zip_uint32_t attributes = 0;
        zip_uint32_t mode = 0;
        if (zip_file_get_external_attributes(archive.get(), index, 0, &opsys, &attributes) == 0 &&
            opsys == ZIP_OPSYS_UNIX) {
            mode = attributes >> 16;
        }

        const auto relative = safe_member_path(name);
        const auto target = dest_dir / relative;

        if (!name.empty() && name.back() == '/') {
            reject_symlinked_components(dest_dir, relative);
            std::filesystem::create_directories(target);
            directories.emplace_back(target, std::make_pair(mode | 0700, stat));
            ++stats.entries;
            continue;
        }

        reject_symlinked_components(dest_dir, relative.parent_path());
        std::filesystem::create_directories(target.parent_path());
        if (S_ISLNK(mode)) {
            const auto link_target = read_member(archive.get(), index, name);
            std::error_code ec;
            std::filesystem::remove(target, ec);
            std::filesystem::create_symlink(link_target, target, ec);
            if (ec) {
                throw ExtractionError("Unable to create symlink " + target.string() + ": " + ec.message());
            }
            ++stats.entries;
            continue;
        }

        std::error_code ec;
        if (std::filesystem::is_symlink(std::filesystem::symlink_status(target, ec))) {
            std::filesystem::remove(target);
        }
        write_member(archive.get(), index, name, target, buffer, cancel);
        apply_metadata(target, mode, stat, logger);
        if (in_bin_directory(relative) && mark_executable(target, logger)) {
            ++stats.executables_fixed;
        }
        ++stats.entries;
        if ((stat.valid & ZIP_STAT_SIZE) != 0) {
            stats.bytes += stat.size;
        }
    }

    // Directory times are applied last so member writes do not disturb them.
    for (auto it = directories.rbegin(); it != directories.rend(); ++it) {
        apply_metadata(it->first, it->second.first, it->second.second, logger);
    }

    logger.info("Successfully extracted bundle (" + std::to_string(stats.entries) + " entries, " +
                std::to_string(stats.bytes) + " bytes)");
    return stats;
}

}  // namespace chunksync::engine
