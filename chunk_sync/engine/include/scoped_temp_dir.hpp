#pragma once

#include <filesystem>
#include <string>

namespace chunksync::engine {

// mkdtemp directory removed recursively when the owner goes out of scope.
class ScopedTempDir {
public:
    explicit ScopedTempDir(const std::string& prefix = "chunksync");
    ~ScopedTempDir();

    ScopedTempDir(const ScopedTempDir&) = delete;
    ScopedTempDir& operator=(const ScopedTempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

}  // namespace chunksync::engine
