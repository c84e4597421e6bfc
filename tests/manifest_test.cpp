#include "manifest.hpp"

#include "artifact_layout.hpp"
#include "digest.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace chunksync::engine {
namespace {

using test_support::read_file;
using test_support::write_file;
using test_support::write_sized_file;

class ManifestTest : public test_support::TempDirTest {
protected:
    void make_artifacts() {
        write_sized_file(dir() / "chunk_1.tar.gz", 4096, 1);
        write_sized_file(dir() / "chunk_2.tar.gz", 2048, 2);
        write_sized_file(dir() / "chunk_10.tar.gz", 1024, 3);
        write_sized_file(dir() / "other_folders.zip", 512, 4);
        write_file(dir() / "notes.txt", "not an artifact");
    }

    JobScheduler scheduler_{4};
};

TEST(DigestTest, KnownVectors) {
    EXPECT_EQ(sha256_hex(""), "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
    EXPECT_EQ(sha256_hex("abc"), "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(ArtifactLayoutTest, ChunkNames) {
    EXPECT_EQ(layout::chunk_archive_name(7), "chunk_7.tar.gz");
    EXPECT_EQ(layout::parse_chunk_index("chunk_12.tar.gz"), std::optional<std::size_t>(12));
    EXPECT_FALSE(layout::parse_chunk_index("chunk_0.tar.gz"));
    EXPECT_FALSE(layout::parse_chunk_index("chunk_.tar.gz"));
    EXPECT_FALSE(layout::parse_chunk_index("chunk_1a.tar.gz"));
    EXPECT_FALSE(layout::parse_chunk_index("chunk_1.tar"));
    EXPECT_TRUE(layout::is_artifact_name("other_folders.zip"));
    EXPECT_FALSE(layout::is_artifact_name("manifest.sha256"));
}

TEST_F(ManifestTest, ListsChunksNumericallyThenBundle) {
    make_artifacts();
    EXPECT_EQ(list_artifacts(dir()), (std::vector<std::string>{"chunk_1.tar.gz", "chunk_2.tar.gz",
                                                               "chunk_10.tar.gz", "other_folders.zip"}));
}

TEST_F(ManifestTest, WritesSha256sumFormat) {
    make_artifacts();
    auto manifest = generate_manifest(dir(), scheduler_, logger_);
    manifest.fingerprint = std::string(64, 'a');
    write_manifest(manifest, dir());

    const auto text = read_file(dir() / layout::kManifestName);
    EXPECT_EQ(text.substr(0, 64), sha256_file(dir() / "chunk_1.tar.gz"));
    EXPECT_NE(text.find("  chunk_1.tar.gz\n"), std::string::npos);
    EXPECT_EQ(text.find("notes.txt"), std::string::npos);
    EXPECT_EQ(read_file(dir() / layout::kFingerprintName), std::string(64, 'a') + "\n");

    const auto reread = read_manifest(dir());
    EXPECT_EQ(reread.entries, manifest.entries);
    EXPECT_EQ(reread.fingerprint, manifest.fingerprint);
}

TEST_F(ManifestTest, CleanDirectoryVerifies) {
    make_artifacts();
    write_manifest(generate_manifest(dir(), scheduler_, logger_), dir());
    const auto report = verify_manifest(dir(), read_manifest(dir()), scheduler_, logger_);
    EXPECT_TRUE(report.ok());
    EXPECT_EQ(report.verified, 4u);
    EXPECT_NO_THROW(report.throw_if_failed());
}

TEST_F(ManifestTest, SingleFlippedByteFailsExactlyOneEntry) {
    make_artifacts();
    write_manifest(generate_manifest(dir(), scheduler_, logger_), dir());

    {
        std::fstream stream(dir() / "chunk_2.tar.gz", std::ios::in | std::ios::out | std::ios::binary);
        stream.seekg(100);
        char byte = 0;
        stream.get(byte);
        stream.seekp(100);
        stream.put(static_cast<char>(byte ^ 0x01));
    }

    const auto report = verify_manifest(dir(), read_manifest(dir()), scheduler_, logger_);
    ASSERT_EQ(report.failures.size(), 1u);
    EXPECT_EQ(report.failures[0].name, "chunk_2.tar.gz");
    EXPECT_EQ(report.failures[0].kind, IntegrityFailure::kDigestMismatch);
    EXPECT_EQ(report.verified, 3u);
    try {
        report.throw_if_failed();
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& ex) {
        EXPECT_EQ(ex.kind(), IntegrityFailure::kDigestMismatch);
        EXPECT_EQ(ex.artifact(), "chunk_2.tar.gz");
    }
}

TEST_F(ManifestTest, ReportsMissingAndUnlistedArtifacts) {
    make_artifacts();
    write_manifest(generate_manifest(dir(), scheduler_, logger_), dir());
    std::filesystem::remove(dir() / "chunk_10.tar.gz");
    write_sized_file(dir() / "chunk_3.tar.gz", 64, 9);

    const auto report = verify_manifest(dir(), read_manifest(dir()), scheduler_, logger_);
    ASSERT_EQ(report.failures.size(), 2u);
    EXPECT_EQ(report.failures[0].name, "chunk_10.tar.gz");
    EXPECT_EQ(report.failures[0].kind, IntegrityFailure::kMissingArtifact);
    EXPECT_EQ(report.failures[1].name, "chunk_3.tar.gz");
    EXPECT_EQ(report.failures[1].kind, IntegrityFailure::kUnlistedArtifact);
}

TEST_F(ManifestTest, MissingOrMalformedManifestIsRejected) {
    try {
        read_manifest(dir());
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& ex) {
        EXPECT_EQ(ex.kind(), IntegrityFailure::kMissingManifest);
    }

    write_file(dir() / layout::kManifestName, "not-a-digest  chunk_1.tar.gz\n");
    EXPECT_THROW(read_manifest(dir()), IntegrityError);

    const std::string digest(64, 'b');
    write_file(dir() / layout::kManifestName, digest + "  chunk_1.tar.gz\n" + digest + "  chunk_1.tar.gz\n");
    EXPECT_THROW(read_manifest(dir()), IntegrityError);
}

TEST_F(ManifestTest, AcceptsBinaryModeMarker) {
    const std::string digest(64, 'c');
    write_file(dir() / layout::kManifestName, digest + " *chunk_1.tar.gz\n\n");
    const auto manifest = read_manifest(dir());
    ASSERT_EQ(manifest.entries.size(), 1u);
    EXPECT_EQ(manifest.entries[0].name, "chunk_1.tar.gz");
    EXPECT_TRUE(manifest.fingerprint.empty());
}

TEST_F(ManifestTest, FingerprintTracksContentAndPaths) {
    const auto source = dir() / "source";
    write_file(source / "lib" / "a.py", "print('a')\n");
    write_file(source / "bin" / "tool", "#!/bin/sh\n");
    std::filesystem::create_symlink("tool", source / "bin" / "alias");

    const auto first = compute_fingerprint(source, scheduler_, logger_);
    EXPECT_EQ(first.size(), 64u);
    EXPECT_EQ(compute_fingerprint(source, scheduler_, logger_), first);

    write_file(source / "lib" / "a.py", "print('b')\n");
    const auto edited = compute_fingerprint(source, scheduler_, logger_);
    EXPECT_NE(edited, first);

    std::filesystem::rename(source / "lib" / "a.py", source / "lib" / "b.py");
    EXPECT_NE(compute_fingerprint(source, scheduler_, logger_), edited);
}

TEST_F(ManifestTest, FingerprintOfMissingSourceIsPlanningError) {
    EXPECT_THROW(compute_fingerprint(dir() / "absent", scheduler_, logger_), PlanningError);
}

}  // namespace
}  // namespace chunksync::engine
