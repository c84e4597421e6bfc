#include "archive_builder.hpp"

#include "errors.hpp"

#include <zlib.h>

#include <algorithm>
#include <array>
#include <chrono>
#include <climits>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <iomanip>
#include <sstream>
#include <system_error>

namespace chunksync::engine {

namespace {

constexpr std::size_t kBlockSize = 512;
constexpr std::size_t kCopyBuffer = 1024 * 1024;
constexpr std::size_t kNameSize = 100;
constexpr char kLongLinkName[] = "././@LongLink";

struct TarHeader {
    char name[100];
    char mode[8];
    char uid[8];
    char gid[8];
    char size[12];
    char mtime[12];
    char chksum[8];
    char typeflag;
    char linkname[100];
    char magic[6];
    char version[2];
    char uname[32];
    char gname[32];
    char devmajor[8];
    char devminor[8];
    char prefix[155];
    char padding[12];
};

static_assert(sizeof(TarHeader) == kBlockSize, "TarHeader must be 512 bytes");

// Octal when the value fits, GNU base-256 otherwise.
void write_numeric(char* dest, std::size_t size, std::uint64_t value) {
    const std::size_t digits = size - 1;
    if (digits * 3 >= 64 || value < (std::uint64_t{1} << (digits * 3))) {
        dest[digits] = '\0';
        for (std::size_t i = digits; i > 0; --i) {
            dest[i - 1] = static_cast<char>('0' + (value & 7));
            value >>= 3;
        }
        return;
    }
    std::memset(dest, 0, size);
    for (std::size_t i = size; i > 1; --i) {
        dest[i - 1] = static_cast<char>(value & 0xff);
        value >>= 8;
    }
    dest[0] = static_cast<char>(0x80);
}

std::uint64_t parse_numeric(const char* data, std::size_t size) {
    if (static_cast<unsigned char>(data[0]) & 0x80) {
        std::uint64_t result = 0;
        for (std::size_t i = 1; i < size; ++i) {
            result = (result << 8) | static_cast<unsigned char>(data[i]);
        }
        return result;
    }
    std::uint64_t result = 0;
    std::size_t i = 0;
    while (i < size && data[i] == ' ') {
        ++i;
    }
    for (; i < size && data[i] >= '0' && data[i] <= '7'; ++i) {
        result = (result << 3) | static_cast<std::uint64_t>(data[i] - '0');
    }
    return result;
}

std::uint32_t header_checksum(const TarHeader& header) {
    const auto* bytes = reinterpret_cast<const unsigned char*>(&header);
    std::uint32_t sum = 0;
    for (std::size_t i = 0; i < sizeof(TarHeader); ++i) {
        sum += (i >= 148 && i < 156) ? static_cast<unsigned char>(' ') : bytes[i];
    }
    return sum;
}

std::string field_string(const char* data, std::size_t size) {
    return std::string(data, ::strnlen(data, size));
}

std::uint64_t padding_for(std::uint64_t size) {
    return (kBlockSize - (size % kBlockSize)) % kBlockSize;
}

std::int64_t mtime_seconds(const std::filesystem::path& path) {
    std::error_code ec;
    const auto ftime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    const auto sys_time = decltype(ftime)::clock::to_sys(ftime);
    return std::chrono::duration_cast<std::chrono::seconds>(sys_time.time_since_epoch()).count();
}

class GzWriter {
public:
    GzWriter(const std::filesystem::path& path, int level) : path_(path) {
        const std::string mode = "wb" + std::to_string(level);
        file_ = gzopen(path.c_str(), mode.c_str());
        if (file_ == nullptr) {
            throw BuildError("Unable to create archive: " + path.string());
        }
        gzbuffer(file_, 256 * 1024);
    }

    ~GzWriter() {
        if (file_ != nullptr) {
            gzclose(file_);
        }
    }

    GzWriter(const GzWriter&) = delete;
    GzWriter& operator=(const GzWriter&) = delete;

    void write(const void* data, std::size_t size) {
        const auto* bytes = static_cast<const char*>(data);
        while (size > 0) {
            const auto step = static_cast<unsigned>(std::min<std::size_t>(size, INT_MAX / 2));
            const int written = gzwrite(file_, bytes, step);
            if (written <= 0) {
                int errnum = 0;
                const char* message = gzerror(file_, &errnum);
                throw BuildError("Compression failed for " + path_.string() + ": " +
                                 (message ? message : "unknown error"));
            }
            bytes += written;
            size -= static_cast<std::size_t>(written);
        }
    }

    void write_zeros(std::size_t count) {
        static const std::array<char, kBlockSize> zeros{};
        while (count > 0) {
            const auto step = std::min(count, zeros.size());
            write(zeros.data(), step);
            count -= step;
        }
    }

    void close() {
        gzFile file = file_;
        file_ = nullptr;
        const int rc = gzclose(file);
        if (rc != Z_OK) {
            throw BuildError("Failed to finalize archive " + path_.string() + " (zlib code " +
                             std::to_string(rc) + ")");
        }
    }

private:
    std::filesystem::path path_;
    gzFile file_ = nullptr;
};

class GzReader {
public:
    explicit GzReader(const std::filesystem::path& path) : path_(path) {
        file_ = gzopen(path.c_str(), "rb");
        if (file_ == nullptr) {
            throw ExtractionError("Unable to open archive: " + path.string());
        }
        gzbuffer(file_, 256 * 1024);
    }

    ~GzReader() {
        if (file_ != nullptr) {
            gzclose(file_);
        }
    }

    GzReader(const GzReader&) = delete;
    GzReader& operator=(const GzReader&) = delete;

    // Reads up to size bytes; fewer only at the end of a complete stream.
    std::size_t read(void* data, std::size_t size) {
        auto* bytes = static_cast<char*>(data);
        std::size_t total = 0;
        while (total < size) {
            const auto step = static_cast<unsigned>(std::min<std::size_t>(size - total, INT_MAX / 2));
            const int got = gzread(file_, bytes + total, step);
            if (got < 0) {
                fail();
            }
            if (got == 0) {
                break;
            }
            total += static_cast<std::size_t>(got);
        }
        if (total < size) {
            // A truncated deflate stream shows up as Z_BUF_ERROR after a short read.
            int errnum = Z_OK;
            gzerror(file_, &errnum);
            if (errnum != Z_OK) {
                fail();
            }
        }
        return total;
    }

    void read_exact(void* data, std::size_t size, const std::string& what) {
        if (read(data, size) != size) {
            throw ExtractionError("Unexpected end of archive " + path_.string() + " while reading " + what);
        }
    }

    void skip(std::uint64_t count, const std::string& what) {
        std::array<char, kBlockSize * 8> buffer{};
        while (count > 0) {
            const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(count, buffer.size()));
            read_exact(buffer.data(), step, what);
            count -= step;
        }
    }

private:
    [[noreturn]] void fail() {
        int errnum = 0;
        const char* message = gzerror(file_, &errnum);
        throw ExtractionError("Decompression failed for " + path_.string() + ": " +
                              (message ? message : "unknown error"));
    }

    std::filesystem::path path_;
    gzFile file_ = nullptr;
};

TarHeader make_header(const std::string& name, char typeflag, std::uint64_t size, unsigned mode,
                      std::int64_t mtime, const std::string& linkname) {
    TarHeader header;
    std::memset(&header, 0, sizeof(header));
    std::memcpy(header.name, name.data(), std::min(name.size(), kNameSize - 1));
    write_numeric(header.mode, sizeof(header.mode), mode & 07777);
    write_numeric(header.uid, sizeof(header.uid), 0);
    write_numeric(header.gid, sizeof(header.gid), 0);
    write_numeric(header.size, sizeof(header.size), size);
    write_numeric(header.mtime, sizeof(header.mtime), static_cast<std::uint64_t>(std::max<std::int64_t>(mtime, 0)));
    header.typeflag = typeflag;
    std::memcpy(header.linkname, linkname.data(), std::min(linkname.size(), kNameSize - 1));
    std::memcpy(header.magic, "ustar", 5);
    header.version[0] = '0';
    header.version[1] = '0';

    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", header_checksum(header));
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';
    return header;
}

// GNU 'L'/'K' record carrying a name that does not fit the 100-byte field.
void write_long_record(GzWriter& writer, char typeflag, const std::string& value) {
    const auto header = make_header(kLongLinkName, typeflag, value.size() + 1, 0644, 0, {});
    writer.write(&header, sizeof(header));
    writer.write(value.c_str(), value.size() + 1);
    writer.write_zeros(padding_for(value.size() + 1));
}

void write_entry_header(GzWriter& writer, const std::string& name, char typeflag, std::uint64_t size,
                        unsigned mode, std::int64_t mtime, const std::string& linkname = {}) {
    if (name.size() >= kNameSize) {
        write_long_record(writer, 'L', name);
    }
    if (linkname.size() >= kNameSize) {
        write_long_record(writer, 'K', linkname);
    }
    const auto header = make_header(name, typeflag, size, mode, mtime, linkname);
    writer.write(&header, sizeof(header));
}

// Returns false when the file disappeared and was skipped.
bool append_file(GzWriter& writer, const std::filesystem::path& file, const std::string& member,
                 ArchiveStats& stats, std::vector<char>& buffer, Logger& logger, const CancellationToken& cancel) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(file, ec);
    if (ec || !std::filesystem::exists(status)) {
        logger.warn("File disappeared before packaging, skipping: " + file.string());
        return false;
    }

    const unsigned mode = static_cast<unsigned>(status.permissions()) & 07777;
    if (std::filesystem::is_symlink(status)) {
        const auto target = std::filesystem::read_symlink(file, ec);
        if (ec) {
            logger.warn("Symlink disappeared before packaging, skipping: " + file.string());
            return false;
        }
        write_entry_header(writer, member, '2', 0, 0777, 0, target.string());
        return true;
    }
    if (!std::filesystem::is_regular_file(status)) {
        logger.warn("Not a regular file anymore, skipping: " + file.string());
        return false;
    }

    std::ifstream input(file, std::ios::binary);
    const auto size = std::filesystem::file_size(file, ec);
    if (!input || ec) {
        if (!std::filesystem::exists(file)) {
            logger.warn("File disappeared before packaging, skipping: " + file.string());
            return false;
        }
        throw BuildError("Unable to read " + file.string());
    }

    write_entry_header(writer, member, '0', size, mode, mtime_seconds(file));
    std::uint64_t remaining = size;
    while (remaining > 0) {
        cancel.throw_if_requested();
        const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
        input.read(buffer.data(), static_cast<std::streamsize>(step));
        if (static_cast<std::size_t>(input.gcount()) != step) {
            throw BuildError("File changed while archiving: " + file.string());
        }
        writer.write(buffer.data(), step);
        remaining -= step;
    }
    writer.write_zeros(padding_for(size));
    stats.input_bytes += size;
    return true;
}

void write_chunk_archive(const Chunk& chunk, const std::filesystem::path& base_dir,
                         const std::filesystem::path& output, int compression_level, ArchiveStats& stats,
                         Logger& logger, const CancellationToken& cancel) {
    GzWriter writer(output, compression_level);
    std::vector<char> buffer(kCopyBuffer);
    for (const auto& file : chunk.files) {
        cancel.throw_if_requested();
        const auto relative = file.lexically_relative(base_dir);
        const auto member = relative.generic_string();
        if (relative.empty() || member.rfind("..", 0) == 0) {
            throw BuildError("File outside of base directory: " + file.string());
        }
        if (append_file(writer, file, member, stats, buffer, logger, cancel)) {
            ++stats.entries;
        } else {
            ++stats.skipped;
        }
    }
    writer.write_zeros(kBlockSize * 2);
    writer.close();
}

void remove_partial(const std::filesystem::path& output, Logger& logger) {
    std::error_code ec;
    std::filesystem::remove(output, ec);
    if (ec) {
        logger.error("Unable to remove partial archive " + output.string() + ": " + ec.message());
    }
}

void apply_metadata(const std::filesystem::path& target, unsigned mode, std::int64_t mtime, Logger& logger) {
    std::error_code ec;
    std::filesystem::permissions(target, static_cast<std::filesystem::perms>(mode & 07777),
                                 std::filesystem::perm_options::replace, ec);
    if (ec) {
        logger.warn("Unable to set permissions on " + target.string() + ": " + ec.message());
    }
    const auto sys_time = std::chrono::system_clock::time_point(std::chrono::seconds(mtime));
    std::filesystem::last_write_time(target, std::filesystem::file_time_type::clock::from_sys(sys_time), ec);
    if (ec) {
        logger.warn("Unable to set modification time on " + target.string() + ": " + ec.message());
    }
}

void clear_for_write(const std::filesystem::path& target) {
    std::error_code ec;
    const auto status = std::filesystem::symlink_status(target, ec);
    if (!ec && std::filesystem::is_symlink(status)) {
        std::filesystem::remove(target);
    }
}

}  // namespace

std::string leading_bytes_hex(const std::filesystem::path& path, std::size_t count) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        return "unable to read";
    }
    std::vector<char> bytes(count);
    stream.read(bytes.data(), static_cast<std::streamsize>(bytes.size()));
    const auto read = static_cast<std::size_t>(stream.gcount());
    std::ostringstream oss;
    oss << std::hex;
    for (std::size_t i = 0; i < read; ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::setw(2) << std::setfill('0') << static_cast<int>(static_cast<unsigned char>(bytes[i]));
    }
    return oss.str();
}

bool in_bin_directory(const std::filesystem::path& relative) {
    const auto parent = relative.parent_path();
    return std::any_of(parent.begin(), parent.end(), [](const std::filesystem::path& part) {
        return part == "bin";
    });
}

bool mark_executable(const std::filesystem::path& path, Logger& logger) {
    using std::filesystem::perms;
    std::error_code ec;
    std::filesystem::permissions(path, perms::owner_exec | perms::group_exec | perms::others_exec,
                                 std::filesystem::perm_options::add, ec);
    if (ec) {
        logger.warn("Unable to restore executable bit on " + path.string() + ": " + ec.message());
        return false;
    }
    return true;
}

std::filesystem::path safe_member_path(const std::string& name) {
    const std::filesystem::path path(name);
    if (name.empty() || path.is_absolute()) {
        throw ExtractionError("Refusing archive member with absolute or empty path: " + name);
    }
    std::filesystem::path cleaned;
    for (const auto& part : path) {
        if (part == "..") {
            throw ExtractionError("Refusing archive member escaping the destination: " + name);
        }
        if (part.empty() || part == ".") {
            continue;
        }
        cleaned /= part;
    }
    if (cleaned.empty()) {
        throw ExtractionError("Refusing archive member with empty path: " + name);
    }
    return cleaned;
}

void reject_symlinked_components(const std::filesystem::path& dest_dir, const std::filesystem::path& relative) {
    auto current = dest_dir;
    for (const auto& part : relative) {
        current /= part;
        std::error_code ec;
        const auto status = std::filesystem::symlink_status(current, ec);
        if (ec || !std::filesystem::exists(status)) {
            return;
        }
        if (std::filesystem::is_symlink(status)) {
            throw ExtractionError("Refusing to extract through symlink " + current.string());
        }
    }
}

ArchiveStats build_chunk_archive(const Chunk& chunk,
                                 const std::filesystem::path& base_dir,
                                 const std::filesystem::path& output,
                                 int compression_level,
                                 Logger& logger,
                                 const CancellationToken& cancel) {
    ArchiveStats stats;
    stats.path = output;
    logger.info("Creating chunk: " + output.filename().string() + " (" + std::to_string(chunk.files.size()) +
                " files)");
    try {
        write_chunk_archive(chunk, base_dir, output, compression_level, stats, logger, cancel);
    } catch (const CancelledError&) {
        remove_partial(output, logger);
        throw;
    } catch (const BuildError& ex) {
        logger.error("Failed to create chunk " + output.filename().string() + ": " + ex.what());
        remove_partial(output, logger);
        throw;
    } catch (const std::exception& ex) {
        logger.error("Failed to create chunk " + output.filename().string() + ": " + ex.what());
        remove_partial(output, logger);
        throw BuildError("Failed to create chunk " + output.string() + ": " + ex.what());
    }

    stats.archive_bytes = std::filesystem::file_size(output);
    logger.info("Created chunk: " + output.filename().string() + " (" + std::to_string(stats.archive_bytes) +
                " bytes from " + std::to_string(stats.input_bytes) + ")");
    return stats;
}

void validate_chunk_archive(const std::filesystem::path& archive, Logger& logger) {
    const auto name = archive.filename().string();
    std::error_code ec;
    if (!std::filesystem::is_regular_file(archive, ec)) {
        logger.error("Chunk file not found: " + archive.string());
        throw IntegrityError(IntegrityFailure::kMissingArtifact, name, "Chunk file not found: " + archive.string());
    }
    const auto size = std::filesystem::file_size(archive, ec);
    if (ec || size == 0) {
        logger.error("Chunk file is empty (possible download failure): " + archive.string());
        logger.error("File size: 0 bytes");
        throw IntegrityError(IntegrityFailure::kEmptyArtifact, name, "Chunk file is empty: " + archive.string());
    }

    std::array<unsigned char, 10> header{};
    std::ifstream stream(archive, std::ios::binary);
    stream.read(reinterpret_cast<char*>(header.data()), static_cast<std::streamsize>(header.size()));
    const bool complete = static_cast<std::size_t>(stream.gcount()) == header.size();
    // ID1 ID2 CM FLG: gzip magic, deflate method, reserved flag bits clear.
    if (!complete || header[0] != 0x1f || header[1] != 0x8b || header[2] != 8 || (header[3] & 0xe0) != 0) {
        logger.error("Chunk file is not a valid gzip archive: " + archive.string());
        logger.error("File size: " + std::to_string(size) + " bytes");
        logger.error("First bytes: " + leading_bytes_hex(archive, 32));
        throw IntegrityError(IntegrityFailure::kInvalidHeader, name,
                             "Chunk file is not a valid gzip archive: " + archive.string());
    }
}

ExtractStats extract_chunk_archive(const std::filesystem::path& archive,
                                   const std::filesystem::path& dest_dir,
                                   Logger& logger,
                                   const CancellationToken& cancel) {
    validate_chunk_archive(archive, logger);
    logger.info("Extracting chunk: " + archive.filename().string() + " to " + dest_dir.string());
    std::filesystem::create_directories(dest_dir);

    ExtractStats stats;
    GzReader reader(archive);
    std::vector<char> buffer(kCopyBuffer);
    std::string long_name;
    std::string long_link;

    while (true) {
        cancel.throw_if_requested();
        TarHeader header;
        const auto got = reader.read(&header, sizeof(header));
        if (got == 0) {
            break;
        }
        if (got != sizeof(header)) {
            throw ExtractionError("Truncated tar header in " + archive.string());
        }
        const auto* raw = reinterpret_cast<const unsigned char*>(&header);
        if (std::all_of(raw, raw + sizeof(header), [](unsigned char c) { return c == 0; })) {
            break;
        }
        if (parse_numeric(header.chksum, sizeof(header.chksum)) != header_checksum(header)) {
            throw ExtractionError("Corrupt tar header checksum in " + archive.string());
        }

        const auto size = parse_numeric(header.size, sizeof(header.size));
        const auto typeflag = header.typeflag;

        if (typeflag == 'L' || typeflag == 'K') {
            std::string value(static_cast<std::size_t>(size), '\0');
            reader.read_exact(value.data(), value.size(), "long name record");
            reader.skip(padding_for(size), "long name padding");
            value.resize(::strnlen(value.c_str(), value.size()));
            (typeflag == 'L' ? long_name : long_link) = value;
            continue;
        }
        if (typeflag == 'x' || typeflag == 'g') {
            reader.skip(size + padding_for(size), "extended header");
            continue;
        }

        std::string name = long_name;
        if (name.empty()) {
            const auto prefix = field_string(header.prefix, sizeof(header.prefix));
            name = field_string(header.name, sizeof(header.name));
            if (!prefix.empty()) {
                name = prefix + "/" + name;
            }
        }
        std::string linkname = long_link.empty() ? field_string(header.linkname, sizeof(header.linkname)) : long_link;
        long_name.clear();
        long_link.clear();

        const auto relative = safe_member_path(name);
        const auto target = dest_dir / relative;
        const auto mode = static_cast<unsigned>(parse_numeric(header.mode, sizeof(header.mode)));
        const auto mtime = static_cast<std::int64_t>(parse_numeric(header.mtime, sizeof(header.mtime)));

        if (typeflag == '5') {
            reject_symlinked_components(dest_dir, relative);
            std::filesystem::create_directories(target);
            apply_metadata(target, mode | 0700, mtime, logger);
            reader.skip(size + padding_for(size), "directory entry");
            ++stats.entries;
            continue;
        }

        reject_symlinked_components(dest_dir, relative.parent_path());
        std::filesystem::create_directories(target.parent_path());
        if (typeflag == '2') {
            std::error_code ec;
            std::filesystem::remove(target, ec);
            std::filesystem::create_symlink(linkname, target, ec);
            if (ec) {
                throw ExtractionError("Unable to create symlink " + target.string() + ": " + ec.message());
            }
            reader.skip(size + padding_for(size), "symlink entry");
            ++stats.entries;
            continue;
        }
        if (typeflag != '0' && typeflag != '\0' && typeflag != '7') {
            logger.warn("Skipping unsupported tar entry type '" + std::string(1, typeflag) + "': " + name);
            reader.skip(size + padding_for(size), "unsupported entry");
            continue;
        }

        clear_for_write(target);
        std::ofstream output(target, std::ios::binary | std::ios::trunc);
        if (!output) {
            throw ExtractionError("Unable to create " + target.string());
        }
        std::uint64_t remaining = size;
        while (remaining > 0) {
            cancel.throw_if_requested();
            const auto step = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, buffer.size()));
            reader.read_exact(buffer.data(), step, name);
            output.write(buffer.data(), static_cast<std::streamsize>(step));
            if (!output) {
                throw ExtractionError("Write failed for " + target.string() + " (disk full?)");
            }
            remaining -= step;
        }
        output.close();
        if (!output) {
            throw ExtractionError("Write failed for " + target.string());
        }
        reader.skip(padding_for(size), "file padding");
        apply_metadata(target, mode, mtime, logger);
        if (in_bin_directory(relative) && mark_executable(target, logger)) {
            ++stats.executables_fixed;
        }
        ++stats.entries;
        stats.bytes += size;
    }

    logger.info("Successfully extracted: " + archive.filename().string() + " (" + std::to_string(stats.entries) +
                " entries, " + std::to_string(stats.bytes) + " bytes)");
    return stats;
}

}  // namespace chunksync::engine
