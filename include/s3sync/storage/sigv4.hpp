#pragma once

#include <cstdint>
#include <ctime>
#include <map>
#include <string>
#include <vector>

namespace s3sync::storage {

struct Credentials {
    std::string access_key_id;
    std::string secret_access_key;
    std::string session_token;  ///< Empty unless using temporary credentials
};

/**
 * @brief AWS Signature Version 4 for S3 requests
 *
 * The caller supplies every header that must be signed (host,
 * x-amz-content-sha256, x-amz-date, ...); header names are lower-cased and
 * sorted here. Returns the value for the Authorization header.
 */
class SigV4Signer {
public:
    static constexpr const char* kUnsignedPayload = "UNSIGNED-PAYLOAD";

    SigV4Signer(Credentials credentials, std::string region, std::string service = "s3");

    std::string authorization(const std::string& method,
                              const std::string& canonical_uri,
                              const std::string& canonical_query,
                              const std::map<std::string, std::string>& headers,
                              const std::string& payload_hash,
                              const std::string& amz_date) const;

    /// "YYYYMMDD'T'HHMMSS'Z'" for the given UTC time.
    static std::string amz_date(std::time_t when);

    static std::string sha256_hex(const std::string& data);

    /// RFC 3986 encoding; '/' kept when encoding a path.
    static std::string uri_encode(const std::string& value, bool keep_slash);

private:
    static std::vector<std::uint8_t> hmac_sha256(const std::vector<std::uint8_t>& key, const std::string& data);

    Credentials credentials_;
    std::string region_;
    std::string service_;
};

} // namespace s3sync::storage
