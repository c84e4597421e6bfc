#include "digest.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

namespace chunksync::engine {

namespace {
constexpr std::size_t kReadChunk = 1024 * 1024;
}  // namespace

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    if (ctx_ == nullptr) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_, EVP_sha256(), nullptr) != 1) {
        EVP_MD_CTX_free(ctx_);
        throw std::runtime_error("EVP_DigestInit_ex failed");
    }
}

Sha256::~Sha256() {
    if (ctx_) {
        EVP_MD_CTX_free(ctx_);
        ctx_ = nullptr;
    }
}

void Sha256::update(const void* data, std::size_t size) {
    if (size == 0) {
        return;
    }
    if (EVP_DigestUpdate(ctx_, data, size) != 1) {
        throw std::runtime_error("EVP_DigestUpdate failed");
    }
}

std::string Sha256::finish_hex() {
    unsigned char digest[EVP_MAX_MD_SIZE];
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(ctx_, digest, &length) != 1) {
        throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    std::ostringstream oss;
    oss << std::hex;
    for (unsigned int i = 0; i < length; ++i) {
        oss << std::setw(2) << std::setfill('0') << static_cast<int>(digest[i]);
    }
    return oss.str();
}

std::string sha256_hex(std::string_view data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finish_hex();
}

std::string sha256_file(const std::filesystem::path& path) {
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw std::runtime_error("Unable to open file for SHA-256: " + path.string());
    }
    Sha256 hasher;
    std::vector<char> buf(kReadChunk);
    while (stream) {
        stream.read(buf.data(), static_cast<std::streamsize>(buf.size()));
        const auto read = stream.gcount();
        if (read > 0) {
            hasher.update(buf.data(), static_cast<std::size_t>(read));
        }
    }
    if (stream.bad()) {
        throw std::runtime_error("Read error while hashing: " + path.string());
    }
    return hasher.finish_hex();
}

}  // namespace chunksync::engine
