#include "bundle_builder.hpp"

#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

namespace chunksync::engine {
namespace {

using test_support::read_file;
using test_support::write_file;
using test_support::write_sized_file;

class BundleBuilderTest : public test_support::TempDirTest {
protected:
    std::filesystem::path source() const { return dir() / "source"; }
    std::filesystem::path bundle() const { return dir() / "other_folders.zip"; }
    SourceTree tree() const { return SourceTree{source(), {"lib", "lib64"}}; }
};

TEST_F(BundleBuilderTest, RoundTripExcludesLargeSubtrees) {
    write_sized_file(source() / "lib" / "libhuge.so", 10'000, 1);
    write_file(source() / "bin" / "python", "#!/usr/bin/env python3\n");
    std::filesystem::permissions(source() / "bin" / "python", std::filesystem::perms(0644));
    std::filesystem::create_symlink("python", source() / "bin" / "python3");
    write_sized_file(source() / "include" / "site" / "header.h", 5'000, 2);
    std::filesystem::create_directories(source() / "share" / "empty");
    write_file(source() / "pyvenv.cfg", "home = /usr/bin\n");

    const auto stats = build_bundle(tree(), bundle(), 6, logger_);
    EXPECT_FALSE(stats.placeholder());
    EXPECT_GT(stats.archive_bytes, 0u);
    EXPECT_TRUE(validate_bundle(bundle(), logger_));

    const auto dest = dir() / "dest";
    const auto extracted = extract_bundle(bundle(), dest, logger_);
    EXPECT_GE(extracted.executables_fixed, 1u);

    EXPECT_FALSE(std::filesystem::exists(dest / "lib"));
    EXPECT_EQ(read_file(dest / "pyvenv.cfg"), "home = /usr/bin\n");
    EXPECT_EQ(read_file(dest / "include" / "site" / "header.h"), read_file(source() / "include" / "site" / "header.h"));
    EXPECT_TRUE(std::filesystem::is_directory(dest / "share" / "empty"));
    EXPECT_EQ(std::filesystem::read_symlink(dest / "bin" / "python3"), "python");
    EXPECT_TRUE(test_support::is_executable(dest / "bin" / "python"));
}

TEST_F(BundleBuilderTest, OnlyLargeSubtreesGivesPlaceholder) {
    write_sized_file(source() / "lib" / "a.so", 100, 1);
    write_sized_file(source() / "lib64" / "b.so", 100, 2);

    const auto stats = build_bundle(tree(), bundle(), 6, logger_);
    EXPECT_TRUE(stats.placeholder());
    EXPECT_EQ(std::filesystem::file_size(bundle()), 0u);
    EXPECT_FALSE(validate_bundle(bundle(), logger_));

    const auto extracted = extract_bundle(bundle(), dir() / "dest", logger_);
    EXPECT_EQ(extracted.entries, 0u);
}

TEST_F(BundleBuilderTest, SymlinkedLargeSubtreeIsBundled) {
    write_sized_file(source() / "lib" / "a.so", 100, 1);
    std::filesystem::create_directory_symlink("lib", source() / "lib64");

    build_bundle(tree(), bundle(), 6, logger_);
    const auto dest = dir() / "dest";
    extract_bundle(bundle(), dest, logger_);
    EXPECT_EQ(std::filesystem::read_symlink(dest / "lib64"), "lib");
    EXPECT_FALSE(std::filesystem::exists(dest / "lib"));
}

TEST_F(BundleBuilderTest, AbsentBundleHasNothingToExtract) {
    EXPECT_FALSE(validate_bundle(bundle(), logger_));
}

TEST_F(BundleBuilderTest, GarbageBundleIsInvalidHeader) {
    write_file(bundle(), "definitely not a zip");
    try {
        validate_bundle(bundle(), logger_);
        FAIL() << "expected IntegrityError";
    } catch (const IntegrityError& ex) {
        EXPECT_EQ(ex.kind(), IntegrityFailure::kInvalidHeader);
        EXPECT_EQ(ex.artifact(), "other_folders.zip");
    }
}

TEST_F(BundleBuilderTest, MissingSourceIsPlanningError) {
    EXPECT_THROW(build_bundle(tree(), bundle(), 6, logger_), PlanningError);
    EXPECT_FALSE(std::filesystem::exists(bundle()));
}

}  // namespace
}  // namespace chunksync::engine
