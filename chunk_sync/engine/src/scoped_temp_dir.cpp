#include "scoped_temp_dir.hpp"

#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <vector>

namespace chunksync::engine {

ScopedTempDir::ScopedTempDir(const std::string& prefix) {
    const auto pattern = (std::filesystem::temp_directory_path() / (prefix + "-XXXXXX")).string();
    std::vector<char> buffer(pattern.begin(), pattern.end());
    buffer.push_back('\0');
    if (::mkdtemp(buffer.data()) == nullptr) {
        throw std::runtime_error("Unable to create temporary directory " + pattern + ": " + std::strerror(errno));
    }
    path_ = buffer.data();
}

ScopedTempDir::~ScopedTempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
    if (ec) {
        std::cerr << "[WARN] Unable to remove temporary directory " << path_.string() << ": " << ec.message()
                  << std::endl;
    }
}

}  // namespace chunksync::engine
