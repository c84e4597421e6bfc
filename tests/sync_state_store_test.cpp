#include "sync_state_store.hpp"

#include "test_support.hpp"

#include <gtest/gtest.h>

namespace chunksync::engine {
namespace {

class SyncStateStoreTest : public test_support::TempDirTest {
protected:
    std::string database() const { return (dir() / "state" / "sync.db").string(); }
};

TEST_F(SyncStateStoreTest, UpsertFindRemove) {
    SyncStateStore store(database());
    store.initialize_schema();
    EXPECT_FALSE(store.find("/opt/venv", "s3://bucket/env").has_value());

    store.upsert({"/opt/venv", "s3://bucket/env", "abc", 4, 1024, {}});
    auto record = store.find("/opt/venv", "s3://bucket/env");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->fingerprint, "abc");
    EXPECT_EQ(record->artifact_count, 4u);
    EXPECT_EQ(record->total_bytes, 1024u);
    EXPECT_FALSE(record->updated_at.empty());

    store.upsert({"/opt/venv", "s3://bucket/env", "def", 5, 2048, {}});
    record = store.find("/opt/venv", "s3://bucket/env");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->fingerprint, "def");
    EXPECT_EQ(record->artifact_count, 5u);

    store.remove("/opt/venv", "s3://bucket/env");
    EXPECT_FALSE(store.find("/opt/venv", "s3://bucket/env").has_value());
}

TEST_F(SyncStateStoreTest, RecordsAreKeyedBySourceAndRemote) {
    SyncStateStore store(database());
    store.initialize_schema();
    store.upsert({"/opt/venv", "s3://bucket/a", "one", 1, 1, {}});
    store.upsert({"/opt/venv", "s3://bucket/b", "two", 1, 1, {}});
    store.upsert({"/opt/other", "s3://bucket/a", "three", 1, 1, {}});

    EXPECT_EQ(store.find("/opt/venv", "s3://bucket/a")->fingerprint, "one");
    EXPECT_EQ(store.find("/opt/venv", "s3://bucket/b")->fingerprint, "two");
    EXPECT_EQ(store.find("/opt/other", "s3://bucket/a")->fingerprint, "three");
}

TEST_F(SyncStateStoreTest, StatePersistsAcrossConnections) {
    {
        SyncStateStore store(database());
        store.initialize_schema();
        store.upsert({"/opt/venv", "s3://bucket/env", "persisted", 2, 10, {}});
    }
    SyncStateStore reopened(database());
    reopened.initialize_schema();
    ASSERT_TRUE(reopened.find("/opt/venv", "s3://bucket/env").has_value());
    EXPECT_EQ(reopened.find("/opt/venv", "s3://bucket/env")->fingerprint, "persisted");
}

TEST_F(SyncStateStoreTest, QueriesWithoutSchemaFail) {
    SyncStateStore store(database());
    EXPECT_THROW(store.find("/opt/venv", "s3://bucket/env"), std::runtime_error);
}

}  // namespace
}  // namespace chunksync::engine
