#include "sync_state_store.hpp"

#include <filesystem>
#include <stdexcept>

#include <sqlite3.h>

namespace chunksync::engine {

namespace {

class Statement {
public:
    Statement(sqlite3* db, const char* sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql, -1, &stmt_, nullptr) != SQLITE_OK) {
            throw std::runtime_error(std::string("Failed to prepare statement: ") + sqlite3_errmsg(db_));
        }
    }
    ~Statement() { sqlite3_finalize(stmt_); }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    void bind(int index, const std::string& value) {
        sqlite3_bind_text(stmt_, index, value.c_str(), -1, SQLITE_TRANSIENT);
    }
    void bind(int index, std::uint64_t value) {
        sqlite3_bind_int64(stmt_, index, static_cast<sqlite3_int64>(value));
    }

    // True while rows are available.
    bool step() {
        const int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) {
            return true;
        }
        if (rc != SQLITE_DONE) {
            throw std::runtime_error(std::string("Sync state query failed: ") + sqlite3_errmsg(db_));
        }
        return false;
    }

    std::string text(int column) const {
        const auto* value = sqlite3_column_text(stmt_, column);
        return value ? reinterpret_cast<const char*>(value) : "";
    }
    std::uint64_t integer(int column) const {
        return static_cast<std::uint64_t>(sqlite3_column_int64(stmt_, column));
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

}  // namespace

SyncStateStore::SyncStateStore(const std::string& database_path) {
    const auto parent = std::filesystem::path(database_path).parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    if (sqlite3_open(database_path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("Failed to open sync state database " + database_path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, 5000);
}

SyncStateStore::~SyncStateStore() {
    if (db_) {
        sqlite3_close(db_);
        db_ = nullptr;
    }
}

void SyncStateStore::initialize_schema() {
    const char* ddl = R"SQL(
        CREATE TABLE IF NOT EXISTS sync_state (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            source_path TEXT NOT NULL,
            remote_prefix TEXT NOT NULL,
            fingerprint TEXT NOT NULL,
            artifact_count INTEGER NOT NULL,
            total_bytes INTEGER NOT NULL,
            updated_at TIMESTAMP DEFAULT CURRENT_TIMESTAMP,
            UNIQUE(source_path, remote_prefix)
        );
    )SQL";

    char* err = nullptr;
    if (sqlite3_exec(db_, ddl, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("Failed to initialize sync state: " + msg);
    }
}

std::optional<SyncRecord> SyncStateStore::find(const std::string& source_path, const std::string& remote_prefix) {
    Statement stmt(db_, R"SQL(
        SELECT source_path,remote_prefix,fingerprint,artifact_count,total_bytes,updated_at FROM sync_state
        WHERE source_path=? AND remote_prefix=?
    )SQL");
    stmt.bind(1, source_path);
    stmt.bind(2, remote_prefix);

    std::optional<SyncRecord> record;
    if (stmt.step()) {
        record = SyncRecord{stmt.text(0), stmt.text(1), stmt.text(2), stmt.integer(3), stmt.integer(4), stmt.text(5)};
    }
    return record;
}

void SyncStateStore::upsert(const SyncRecord& record) {
    Statement stmt(db_, R"SQL(
        INSERT INTO sync_state(source_path, remote_prefix, fingerprint, artifact_count, total_bytes)
        VALUES(?,?,?,?,?)
        ON CONFLICT(source_path, remote_prefix)
        DO UPDATE SET fingerprint=excluded.fingerprint,
                      artifact_count=excluded.artifact_count,
                      total_bytes=excluded.total_bytes,
                      updated_at=CURRENT_TIMESTAMP
    )SQL");
    stmt.bind(1, record.source_path);
    stmt.bind(2, record.remote_prefix);
    stmt.bind(3, record.fingerprint);
    stmt.bind(4, record.artifact_count);
    stmt.bind(5, record.total_bytes);
    stmt.step();
}

void SyncStateStore::remove(const std::string& source_path, const std::string& remote_prefix) {
    Statement stmt(db_, "DELETE FROM sync_state WHERE source_path=? AND remote_prefix=?");
    stmt.bind(1, source_path);
    stmt.bind(2, remote_prefix);
    stmt.step();
}

}  // namespace chunksync::engine
