#pragma once

#include "blob_ref.hpp"
#include "config_loader.hpp"
#include "logger.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace chunksync::engine {

using blob::BlobRef;

// Object store boundary. Every failure surfaces as TransferError; retrying
// is left to the caller.
class BlobStore {
public:
    virtual ~BlobStore() = default;

    virtual void put(const std::filesystem::path& local_path, const BlobRef& remote) = 0;
    virtual void get(const BlobRef& remote, const std::filesystem::path& local_path) = 0;
    // Keys of the objects directly below prefix.
    virtual std::vector<std::string> list(const BlobRef& prefix) = 0;
};

// Buckets are directories under a local root. Used for shared volumes and tests.
class FilesystemBlobStore : public BlobStore {
public:
    explicit FilesystemBlobStore(std::filesystem::path root);

    void put(const std::filesystem::path& local_path, const BlobRef& remote) override;
    void get(const BlobRef& remote, const std::filesystem::path& local_path) override;
    std::vector<std::string> list(const BlobRef& prefix) override;

    std::filesystem::path object_path(const BlobRef& ref) const;

private:
    std::filesystem::path root_;
};

// Drives the aws command line client (`aws s3 cp`, `aws s3 ls`).
class AwsCliBlobStore : public BlobStore {
public:
    AwsCliBlobStore(std::string executable, std::vector<std::string> extra_args, Logger& logger);

    void put(const std::filesystem::path& local_path, const BlobRef& remote) override;
    void get(const BlobRef& remote, const std::filesystem::path& local_path) override;
    std::vector<std::string> list(const BlobRef& prefix) override;

private:
    std::string run(const std::vector<std::string>& args, bool capture_output);

    std::string executable_;
    std::vector<std::string> extra_args_;
    Logger& logger_;
};

std::unique_ptr<BlobStore> make_blob_store(const EngineConfig& config, Logger& logger);

}  // namespace chunksync::engine
