#pragma once

#include "logger.hpp"
#include "scoped_temp_dir.hpp"

#include <gtest/gtest.h>

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>

namespace chunksync::test_support {

void write_file(const std::filesystem::path& path, const std::string& content);

// size bytes of a pattern derived from seed, so files of equal size differ.
void write_sized_file(const std::filesystem::path& path, std::size_t size, unsigned seed);

std::string read_file(const std::filesystem::path& path);

// Relative path -> content for regular files, "-> target" for symlinks.
std::map<std::string, std::string> snapshot_tree(const std::filesystem::path& root);

bool is_executable(const std::filesystem::path& path);

// Fresh temporary directory and a quiet logger per test.
class TempDirTest : public ::testing::Test {
protected:
    TempDirTest() { logger_.set_console(false); }

    const std::filesystem::path& dir() const { return temp_.path(); }

    engine::ScopedTempDir temp_{"chunksync-test"};
    engine::Logger logger_;
};

}  // namespace chunksync::test_support
