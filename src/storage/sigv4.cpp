#include "s3sync/storage/sigv4.hpp"

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

#include <algorithm>
#include <cctype>
#include <iomanip>
#include <sstream>

namespace s3sync::storage {
namespace {

std::string to_hex(const std::uint8_t* data, std::size_t size) {
    std::ostringstream oss;
    for (std::size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

} // namespace

SigV4Signer::SigV4Signer(Credentials credentials, std::string region, std::string service)
    : credentials_(std::move(credentials)), region_(std::move(region)), service_(std::move(service)) {}

std::string SigV4Signer::authorization(const std::string& method,
                                       const std::string& canonical_uri,
                                       const std::string& canonical_query,
                                       const std::map<std::string, std::string>& headers,
                                       const std::string& payload_hash,
                                       const std::string& amz_date) const {
    std::map<std::string, std::string> canonical;
    for (const auto& [name, value] : headers) {
        canonical[to_lower(name)] = trim(value);
    }

    std::ostringstream canonical_headers;
    std::string signed_headers;
    for (const auto& [name, value] : canonical) {
        canonical_headers << name << ":" << value << "\n";
        if (!signed_headers.empty()) {
            signed_headers += ";";
        }
        signed_headers += name;
    }

    std::ostringstream canonical_request;
    canonical_request << method << "\n"
                      << canonical_uri << "\n"
                      << canonical_query << "\n"
                      << canonical_headers.str() << "\n"
                      << signed_headers << "\n"
                      << payload_hash;

    const std::string date_stamp = amz_date.substr(0, 8);
    const std::string scope = date_stamp + "/" + region_ + "/" + service_ + "/aws4_request";

    std::ostringstream string_to_sign;
    string_to_sign << "AWS4-HMAC-SHA256\n"
                   << amz_date << "\n"
                   << scope << "\n"
                   << sha256_hex(canonical_request.str());

    const std::string secret = "AWS4" + credentials_.secret_access_key;
    auto key = hmac_sha256(std::vector<std::uint8_t>(secret.begin(), secret.end()), date_stamp);
    key = hmac_sha256(key, region_);
    key = hmac_sha256(key, service_);
    key = hmac_sha256(key, "aws4_request");
    const auto signature = hmac_sha256(key, string_to_sign.str());

    return "AWS4-HMAC-SHA256 Credential=" + credentials_.access_key_id + "/" + scope +
           ",SignedHeaders=" + signed_headers +
           ",Signature=" + to_hex(signature.data(), signature.size());
}

std::string SigV4Signer::amz_date(std::time_t when) {
    std::tm utc{};
    gmtime_r(&when, &utc);
    std::ostringstream oss;
    oss << std::put_time(&utc, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

std::string SigV4Signer::sha256_hex(const std::string& data) {
    unsigned char digest[SHA256_DIGEST_LENGTH];
    SHA256(reinterpret_cast<const unsigned char*>(data.data()), data.size(), digest);
    return to_hex(digest, sizeof(digest));
}

std::string SigV4Signer::uri_encode(const std::string& value, bool keep_slash) {
    std::ostringstream oss;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slash && c == '/')) {
            oss << c;
        } else {
            oss << '%' << std::uppercase << std::hex << std::setw(2) << std::setfill('0')
                << static_cast<int>(c) << std::nouppercase << std::dec;
        }
    }
    return oss.str();
}

std::vector<std::uint8_t> SigV4Signer::hmac_sha256(const std::vector<std::uint8_t>& key, const std::string& data) {
    std::vector<std::uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int length = 0;
    HMAC(EVP_sha256(),
         key.data(), static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         result.data(), &length);
    result.resize(length);
    return result;
}

} // namespace s3sync::storage
