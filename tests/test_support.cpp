#include "test_support.hpp"

#include <fstream>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunksync::test_support {

void write_file(const std::filesystem::path& path, const std::string& content) {
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path());
    }
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    stream << content;
    if (!stream) {
        throw std::runtime_error("Unable to write test file " + path.string());
    }
}

void write_sized_file(const std::filesystem::path& path, std::size_t size, unsigned seed) {
    std::string content(size, '\0');
    unsigned state = seed * 2654435761u + 1;
    for (auto& c : content) {
        state = state * 1103515245u + 12345u;
        c = static_cast<char>((state >> 16) & 0xff);
    }
    write_file(path, content);
}

std::string read_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Unable to read test file " + path.string());
    }
    std::ostringstream oss;
    oss << stream.rdbuf();
    return oss.str();
}

std::map<std::string, std::string> snapshot_tree(const std::filesystem::path& root) {
    std::map<std::string, std::string> snapshot;
    for (const auto& entry : std::filesystem::recursive_directory_iterator(root)) {
        const auto relative = entry.path().lexically_relative(root).generic_string();
        if (entry.is_symlink()) {
            snapshot[relative] = "-> " + std::filesystem::read_symlink(entry.path()).string();
        } else if (entry.is_regular_file()) {
            snapshot[relative] = read_file(entry.path());
        }
    }
    return snapshot;
}

bool is_executable(const std::filesystem::path& path) {
    const auto perms = std::filesystem::status(path).permissions();
    return (perms & std::filesystem::perms::owner_exec) != std::filesystem::perms::none;
}

}  // namespace chunksync::test_support
