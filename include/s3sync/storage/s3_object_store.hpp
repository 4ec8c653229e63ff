#pragma once

#include "s3sync/storage/object_store.hpp"
#include "s3sync/storage/sigv4.hpp"

#include <cstdint>
#include <string>

namespace s3sync::storage {

struct S3Options {
    std::string endpoint = "s3.amazonaws.com";  ///< Host name, no scheme
    std::uint16_t port = 443;
    bool use_tls = true;
    bool path_style = false;                      ///< "/bucket/key" instead of "bucket.host/key"
    std::string region = "us-east-1";
    std::string bucket;
    Credentials credentials;
};

/**
 * @brief Single-request PutObject against an S3-compatible endpoint
 *
 * One connection per Put (Connection: close). The body is streamed in fixed
 * size buffers and signed as UNSIGNED-PAYLOAD, so memory use does not grow
 * with object size.
 */
class S3ObjectStore : public ObjectStore {
public:
    static constexpr std::size_t kSendBufferSize = 256 * 1024;

    explicit S3ObjectStore(S3Options options);

    Result<void> put(const std::string& key,
                     std::istream& body,
                     std::uint64_t size_bytes,
                     StorageClass storage_class) override;

    /// Request line and headers for a Put, terminated by an empty line.
    std::string build_request_head(const std::string& key,
                                   std::uint64_t size_bytes,
                                   StorageClass storage_class,
                                   const std::string& amz_date) const;

    const S3Options& options() const noexcept { return options_; }

private:
    std::string host_header() const;
    std::string canonical_uri(const std::string& key) const;

    S3Options options_;
    SigV4Signer signer_;
};

} // namespace s3sync::storage
