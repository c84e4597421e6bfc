#include "blob_store.hpp"

#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace chunksync::engine {
namespace {

using blob::parse_blob_ref;
using test_support::read_file;
using test_support::write_file;

TEST(BlobRefTest, ParsesBucketAndKey) {
    const auto ref = parse_blob_ref("s3://my-bucket/venvs/prod/");
    EXPECT_EQ(ref.bucket, "my-bucket");
    EXPECT_EQ(ref.key, "venvs/prod");
    EXPECT_EQ(ref.uri(), "s3://my-bucket/venvs/prod");
    EXPECT_EQ(ref.child("chunk_1.tar.gz").key, "venvs/prod/chunk_1.tar.gz");
    EXPECT_EQ(ref.child("chunk_1.tar.gz").name(), "chunk_1.tar.gz");
}

TEST(BlobRefTest, BucketOnly) {
    const auto ref = parse_blob_ref("s3://bucket");
    EXPECT_EQ(ref.key, "");
    EXPECT_EQ(ref.child("manifest.sha256").key, "manifest.sha256");
}

TEST(BlobRefTest, RejectsMalformedReferences) {
    EXPECT_THROW(parse_blob_ref("/local/path"), std::invalid_argument);
    EXPECT_THROW(parse_blob_ref("s3:///key"), std::invalid_argument);
    EXPECT_THROW(parse_blob_ref("s3://bad bucket/key"), std::invalid_argument);
    EXPECT_THROW(parse_blob_ref("s3://bucket/a//b"), std::invalid_argument);
    EXPECT_THROW(parse_blob_ref("s3://bucket/a/../b"), std::invalid_argument);
}

class FilesystemBlobStoreTest : public test_support::TempDirTest {
protected:
    std::filesystem::path root() const { return dir() / "store"; }
};

TEST_F(FilesystemBlobStoreTest, PutGetAndList) {
    FilesystemBlobStore store(root());
    const auto prefix = parse_blob_ref("s3://bucket/env");
    write_file(dir() / "a.bin", "alpha");
    write_file(dir() / "b.bin", "beta");

    store.put(dir() / "b.bin", prefix.child("b.bin"));
    store.put(dir() / "a.bin", prefix.child("a.bin"));
    EXPECT_EQ(read_file(root() / "bucket" / "env" / "a.bin"), "alpha");
    EXPECT_EQ(store.list(prefix), (std::vector<std::string>{"env/a.bin", "env/b.bin"}));

    store.get(prefix.child("b.bin"), dir() / "out" / "b.bin");
    EXPECT_EQ(read_file(dir() / "out" / "b.bin"), "beta");
}

TEST_F(FilesystemBlobStoreTest, PutOverwritesExistingObject) {
    FilesystemBlobStore store(root());
    const auto ref = parse_blob_ref("s3://bucket/env/obj");
    write_file(dir() / "v1", "first");
    write_file(dir() / "v2", "second");
    store.put(dir() / "v1", ref);
    store.put(dir() / "v2", ref);
    EXPECT_EQ(read_file(store.object_path(ref)), "second");
}

TEST_F(FilesystemBlobStoreTest, ListOfUnknownPrefixIsEmpty) {
    FilesystemBlobStore store(root());
    EXPECT_TRUE(store.list(parse_blob_ref("s3://bucket/nothing")).empty());
}

TEST_F(FilesystemBlobStoreTest, FailuresAreTransferErrors) {
    FilesystemBlobStore store(root());
    EXPECT_THROW(store.get(parse_blob_ref("s3://bucket/missing"), dir() / "x"), TransferError);
    EXPECT_THROW(store.put(dir() / "missing", parse_blob_ref("s3://bucket/x")), TransferError);
}

TEST_F(FilesystemBlobStoreTest, FailingCliIsTransferError) {
    AwsCliBlobStore store("false", {}, logger_);
    write_file(dir() / "a.bin", "alpha");
    EXPECT_THROW(store.put(dir() / "a.bin", parse_blob_ref("s3://bucket/a.bin")), TransferError);
    EXPECT_THROW(store.list(parse_blob_ref("s3://bucket/prefix")), TransferError);
}

TEST_F(FilesystemBlobStoreTest, CliListParsesObjectLines) {
    // Stand-in for the aws client: prints a canned `s3 ls` listing.
    const auto script = dir() / "fake-aws";
    write_file(script,
               "echo '                           PRE nested/'\n"
               "echo '2024-05-01 10:00:00    1048576 chunk_1.tar.gz'\n"
               "echo '2024-05-01 10:00:01        120 manifest.sha256'\n");

    AwsCliBlobStore store("sh", {script.string()}, logger_);
    EXPECT_EQ(store.list(parse_blob_ref("s3://bucket/env")),
              (std::vector<std::string>{"env/chunk_1.tar.gz", "env/manifest.sha256"}));
}

}  // namespace
}  // namespace chunksync::engine
