#pragma once

#include <stdexcept>
#include <string>
#include <string_view>

namespace chunksync::blob {

inline constexpr std::string_view kScheme = "s3://";

// Remote object reference, validated once when it enters the process.
struct BlobRef {
    std::string bucket;
    std::string key;

    std::string uri() const { return std::string(kScheme) + bucket + "/" + key; }

    // Key of an object directly below this prefix.
    BlobRef child(std::string_view name) const {
        BlobRef ref{bucket, key};
        if (!ref.key.empty() && ref.key.back() != '/') {
            ref.key.push_back('/');
        }
        ref.key.append(name);
        return ref;
    }

    // Last path component of the key.
    std::string name() const {
        const auto pos = key.find_last_of('/');
        return pos == std::string::npos ? key : key.substr(pos + 1);
    }

    bool operator==(const BlobRef&) const = default;
};

namespace detail {

inline bool valid_bucket_char(char c) {
    return (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_' ||
           (c >= 'A' && c <= 'Z');
}

}  // namespace detail

inline BlobRef parse_blob_ref(std::string_view uri) {
    if (uri.substr(0, kScheme.size()) != kScheme) {
        throw std::invalid_argument("Blob reference must start with s3://: " + std::string(uri));
    }
    const auto rest = uri.substr(kScheme.size());
    const auto slash = rest.find('/');
    const auto bucket = rest.substr(0, slash);
    if (bucket.empty()) {
        throw std::invalid_argument("Blob reference has no bucket: " + std::string(uri));
    }
    for (char c : bucket) {
        if (!detail::valid_bucket_char(c)) {
            throw std::invalid_argument("Invalid bucket name in blob reference: " + std::string(uri));
        }
    }

    BlobRef ref;
    ref.bucket = std::string(bucket);
    if (slash != std::string_view::npos) {
        ref.key = std::string(rest.substr(slash + 1));
    }
    while (!ref.key.empty() && ref.key.back() == '/') {
        ref.key.pop_back();
    }
    std::size_t start = 0;
    while (start <= ref.key.size() && !ref.key.empty()) {
        const auto end = ref.key.find('/', start);
        const auto segment = ref.key.substr(start, end == std::string::npos ? std::string::npos : end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            throw std::invalid_argument("Invalid key segment in blob reference: " + std::string(uri));
        }
        if (end == std::string::npos) {
            break;
        }
        start = end + 1;
    }
    return ref;
}

}  // namespace chunksync::blob
