#include "blob_store.hpp"

#include "errors.hpp"

#include <fcntl.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <sstream>
#include <system_error>

extern char** environ;

namespace chunksync::engine {

namespace {

std::atomic<unsigned> g_temp_counter{0};

std::filesystem::path temp_sibling(const std::filesystem::path& target) {
    auto temp = target;
    temp += ".part-" + std::to_string(::getpid()) + "-" + std::to_string(g_temp_counter.fetch_add(1));
    return temp;
}

// Copies through a temporary sibling so readers never observe a half-written object.
void copy_atomically(const std::filesystem::path& from, const std::filesystem::path& to) {
    const auto parent = to.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    const auto temp = temp_sibling(to);
    std::error_code ec;
    std::filesystem::copy_file(from, temp, std::filesystem::copy_options::overwrite_existing, ec);
    if (ec) {
        std::filesystem::remove(temp, ec);
        throw TransferError("Copy " + from.string() + " -> " + to.string() + " failed");
    }
    std::filesystem::rename(temp, to, ec);
    if (ec) {
        std::error_code ignored;
        std::filesystem::remove(temp, ignored);
        throw TransferError("Rename into " + to.string() + " failed: " + ec.message());
    }
}

std::string describe_status(int status) {
    if (WIFEXITED(status)) {
        return "exit code " + std::to_string(WEXITSTATUS(status));
    }
    if (WIFSIGNALED(status)) {
        return "signal " + std::to_string(WTERMSIG(status));
    }
    return "status " + std::to_string(status);
}

}  // namespace

FilesystemBlobStore::FilesystemBlobStore(std::filesystem::path root) : root_(std::move(root)) {
    std::filesystem::create_directories(root_);
}

std::filesystem::path FilesystemBlobStore::object_path(const BlobRef& ref) const {
    return root_ / ref.bucket / ref.key;
}

void FilesystemBlobStore::put(const std::filesystem::path& local_path, const BlobRef& remote) {
    if (!std::filesystem::is_regular_file(local_path)) {
        throw TransferError("Source path does not exist: " + local_path.string());
    }
    try {
        copy_atomically(local_path, object_path(remote));
    } catch (const std::filesystem::filesystem_error& ex) {
        throw TransferError("Upload to " + remote.uri() + " failed: " + ex.what());
    }
}

void FilesystemBlobStore::get(const BlobRef& remote, const std::filesystem::path& local_path) {
    const auto source = object_path(remote);
    if (!std::filesystem::is_regular_file(source)) {
        throw TransferError("No such object: " + remote.uri());
    }
    try {
        copy_atomically(source, local_path);
    } catch (const std::filesystem::filesystem_error& ex) {
        throw TransferError("Download of " + remote.uri() + " failed: " + ex.what());
    }
}

std::vector<std::string> FilesystemBlobStore::list(const BlobRef& prefix) {
    std::vector<std::string> keys;
    const auto dir = object_path(prefix);
    std::error_code ec;
    if (!std::filesystem::is_directory(dir, ec)) {
        return keys;
    }
    for (const auto& entry : std::filesystem::directory_iterator(dir, ec)) {
        if (!entry.is_regular_file()) {
            continue;
        }
        const auto name = entry.path().filename().string();
        if (name.find(".part-") != std::string::npos) {
            continue;
        }
        keys.push_back(prefix.child(name).key);
    }
    if (ec) {
        throw TransferError("Unable to list " + prefix.uri() + ": " + ec.message());
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

AwsCliBlobStore::AwsCliBlobStore(std::string executable, std::vector<std::string> extra_args, Logger& logger)
    : executable_(std::move(executable)), extra_args_(std::move(extra_args)), logger_(logger) {}

std::string AwsCliBlobStore::run(const std::vector<std::string>& args, bool capture_output) {
    std::vector<std::string> command{executable_};
    command.insert(command.end(), extra_args_.begin(), extra_args_.end());
    command.insert(command.end(), args.begin(), args.end());

    std::vector<char*> argv;
    for (auto& part : command) {
        argv.push_back(part.data());
    }
    argv.push_back(nullptr);

    int pipe_fds[2] = {-1, -1};
    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    if (capture_output) {
        if (::pipe2(pipe_fds, O_CLOEXEC) != 0) {
            posix_spawn_file_actions_destroy(&actions);
            throw TransferError(std::string("pipe failed: ") + std::strerror(errno));
        }
        posix_spawn_file_actions_addclose(&actions, pipe_fds[0]);
        posix_spawn_file_actions_adddup2(&actions, pipe_fds[1], STDOUT_FILENO);
        posix_spawn_file_actions_addclose(&actions, pipe_fds[1]);
    }

    pid_t pid = -1;
    const int spawn_rc = ::posix_spawnp(&pid, executable_.c_str(), &actions, nullptr, argv.data(), environ);
    posix_spawn_file_actions_destroy(&actions);
    if (capture_output) {
        ::close(pipe_fds[1]);
    }
    if (spawn_rc != 0) {
        if (capture_output) {
            ::close(pipe_fds[0]);
        }
        throw TransferError("Unable to run " + executable_ + ": " + std::strerror(spawn_rc));
    }

    std::string output;
    if (capture_output) {
        char buffer[4096];
        while (true) {
            const ssize_t got = ::read(pipe_fds[0], buffer, sizeof(buffer));
            if (got < 0 && errno == EINTR) {
                continue;
            }
            if (got <= 0) {
                break;
            }
            output.append(buffer, static_cast<std::size_t>(got));
        }
        ::close(pipe_fds[0]);
    }

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            throw TransferError(std::string("waitpid failed: ") + std::strerror(errno));
        }
    }
    if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
        std::ostringstream oss;
        oss << executable_;
        for (const auto& arg : args) {
            oss << ' ' << arg;
        }
        throw TransferError(oss.str() + " failed with " + describe_status(status));
    }
    return output;
}

void AwsCliBlobStore::put(const std::filesystem::path& local_path, const BlobRef& remote) {
    if (!std::filesystem::exists(local_path)) {
        throw TransferError("Source path does not exist: " + local_path.string());
    }
    logger_.info("Copying to S3: " + local_path.string() + " -> " + remote.uri());
    run({"s3", "cp", local_path.string(), remote.uri(), "--only-show-errors"}, false);
}

void AwsCliBlobStore::get(const BlobRef& remote, const std::filesystem::path& local_path) {
    const auto parent = local_path.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent);
    }
    logger_.info("Copying from S3: " + remote.uri() + " -> " + local_path.string());
    run({"s3", "cp", remote.uri(), local_path.string(), "--only-show-errors"}, false);
}

std::vector<std::string> AwsCliBlobStore::list(const BlobRef& prefix) {
    logger_.info("Listing S3 path: " + prefix.uri() + "/");
    const auto output = run({"s3", "ls", prefix.uri() + "/"}, true);

    std::vector<std::string> keys;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        std::istringstream fields(line);
        std::string date;
        std::string time;
        std::string size;
        fields >> date;
        if (date == "PRE") {
            continue;
        }
        fields >> time >> size;
        std::string name;
        std::getline(fields, name);
        const auto first = name.find_first_not_of(' ');
        if (first == std::string::npos) {
            continue;
        }
        keys.push_back(prefix.child(name.substr(first)).key);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

std::unique_ptr<BlobStore> make_blob_store(const EngineConfig& config, Logger& logger) {
    if (config.blob_backend == "aws-cli") {
        return std::make_unique<AwsCliBlobStore>(config.aws_cli, config.aws_cli_args, logger);
    }
    return std::make_unique<FilesystemBlobStore>(config.blob_store_root);
}

}  // namespace chunksync::engine
