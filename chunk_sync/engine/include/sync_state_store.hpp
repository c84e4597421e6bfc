#pragma once

#include <cstdint>
#include <optional>
#include <string>

struct sqlite3;

namespace chunksync::engine {

struct SyncRecord {
    std::string source_path;
    std::string remote_prefix;
    std::string fingerprint;
    std::uint64_t artifact_count = 0;
    std::uint64_t total_bytes = 0;
    std::string updated_at;
};

// Last successful push per (source, remote prefix).
class SyncStateStore {
public:
    explicit SyncStateStore(const std::string& database_path);
    ~SyncStateStore();

    SyncStateStore(const SyncStateStore&) = delete;
    SyncStateStore& operator=(const SyncStateStore&) = delete;

    void initialize_schema();
    std::optional<SyncRecord> find(const std::string& source_path, const std::string& remote_prefix);
    void upsert(const SyncRecord& record);
    void remove(const std::string& source_path, const std::string& remote_prefix);

private:
    sqlite3* db_{};
};

}  // namespace chunksync::engine
