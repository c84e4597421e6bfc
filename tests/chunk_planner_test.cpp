#include "chunk_planner.hpp"

#include "errors.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <numeric>

namespace chunksync::engine {
namespace {

using test_support::TempDirTest;

std::vector<SourceFile> files_of_sizes(const std::vector<std::uint64_t>& sizes) {
    std::vector<SourceFile> files;
    for (std::size_t i = 0; i < sizes.size(); ++i) {
        files.push_back({"lib/file_" + std::to_string(i), sizes[i]});
    }
    return files;
}

class ChunkPlannerTest : public TempDirTest {};

TEST_F(ChunkPlannerTest, PacksLargestFirstWithinBound) {
    std::vector<std::uint64_t> sizes(22, 100'000);
    sizes.push_back(300'000);
    const auto chunks = pack_chunks(files_of_sizes(sizes), 1'000'000, logger_);

    ASSERT_EQ(chunks.size(), 3u);
    EXPECT_EQ(chunks[0].index, 1u);
    EXPECT_EQ(chunks[0].files.size(), 8u);
    EXPECT_EQ(chunks[0].files.front(), "lib/file_22");
    EXPECT_EQ(chunks[0].total_bytes, 1'000'000u);
    EXPECT_EQ(chunks[1].files.size(), 10u);
    EXPECT_EQ(chunks[1].total_bytes, 1'000'000u);
    EXPECT_EQ(chunks[2].files.size(), 5u);
    EXPECT_EQ(chunks[2].total_bytes, 500'000u);
}

TEST_F(ChunkPlannerTest, EveryChunkRespectsBoundUnlessOversized) {
    const std::vector<std::uint64_t> sizes{900, 10, 400, 400, 350, 1200, 70, 70, 999, 1, 500, 3000};
    const std::uint64_t bound = 1000;
    const auto chunks = pack_chunks(files_of_sizes(sizes), bound, logger_);

    std::size_t packed = 0;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        EXPECT_EQ(chunks[i].index, i + 1);
        EXPECT_FALSE(chunks[i].files.empty());
        if (chunks[i].oversized()) {
            EXPECT_EQ(chunks[i].files.size(), 1u);
        } else {
            EXPECT_LE(chunks[i].total_bytes, bound);
        }
        packed += chunks[i].files.size();
    }
    EXPECT_EQ(packed, sizes.size());
}

TEST_F(ChunkPlannerTest, OversizedFileGetsItsOwnChunk) {
    const auto chunks = pack_chunks(files_of_sizes({2500, 200, 300}), 1000, logger_);

    ASSERT_EQ(chunks.size(), 2u);
    EXPECT_TRUE(chunks[0].oversized());
    EXPECT_EQ(chunks[0].files, std::vector<std::filesystem::path>{"lib/file_0"});
    EXPECT_EQ(chunks[0].total_bytes, 2500u);
    EXPECT_FALSE(chunks[1].oversized());
    EXPECT_EQ(chunks[1].total_bytes, 500u);
}

TEST_F(ChunkPlannerTest, EmptyInputYieldsNoChunks) {
    EXPECT_TRUE(pack_chunks({}, 1000, logger_).empty());
}

TEST_F(ChunkPlannerTest, PlansOnlyTheLargeSubtrees) {
    test_support::write_sized_file(dir() / "lib" / "a.so", 600, 1);
    test_support::write_sized_file(dir() / "lib" / "python3" / "b.py", 500, 2);
    test_support::write_sized_file(dir() / "lib64" / "c.so", 100, 3);
    test_support::write_sized_file(dir() / "bin" / "python", 700, 4);
    test_support::write_file(dir() / "pyvenv.cfg", "home = /usr/bin\n");

    const SourceTree tree{dir(), {"lib", "lib64"}};
    const auto chunks = plan_chunks(tree, 1000, logger_);

    std::uint64_t total = 0;
    std::size_t files = 0;
    for (const auto& chunk : chunks) {
        total += chunk.total_bytes;
        files += chunk.files.size();
        for (const auto& file : chunk.files) {
            const auto top = *file.lexically_relative(dir()).begin();
            EXPECT_TRUE(top == "lib" || top == "lib64") << file;
        }
    }
    EXPECT_EQ(files, 3u);
    EXPECT_EQ(total, 1200u);
    EXPECT_TRUE(tree.is_large("lib"));
    EXPECT_FALSE(tree.is_large("bin"));
}

TEST_F(ChunkPlannerTest, MissingLargeSubtreeYieldsNoChunks) {
    test_support::write_file(dir() / "bin" / "tool", "#!/bin/sh\n");
    const SourceTree tree{dir(), {"lib", "lib64"}};
    EXPECT_TRUE(tree.large_roots().empty());
    EXPECT_TRUE(plan_chunks(tree, 1000, logger_).empty());
}

TEST_F(ChunkPlannerTest, MissingSourceIsPlanningError) {
    const SourceTree tree{dir() / "absent", {"lib"}};
    EXPECT_THROW(plan_chunks(tree, 1000, logger_), PlanningError);
}

TEST_F(ChunkPlannerTest, SymlinksCountAsZeroBytes) {
    test_support::write_sized_file(dir() / "lib" / "real.so", 400, 5);
    std::filesystem::create_symlink("real.so", dir() / "lib" / "alias.so");

    const auto files = enumerate_files({dir() / "lib"}, logger_);
    ASSERT_EQ(files.size(), 2u);
    const auto total = std::accumulate(files.begin(), files.end(), std::uint64_t{0},
                                       [](std::uint64_t sum, const SourceFile& f) { return sum + f.size; });
    EXPECT_EQ(total, 400u);
}

}  // namespace
}  // namespace chunksync::engine
