#include "s3sync/storage/s3_object_store.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <ctime>
#include <map>
#include <sstream>
#include <vector>

namespace s3sync::storage {

namespace asio = boost::asio;
namespace ssl = boost::asio::ssl;
using tcp = asio::ip::tcp;

namespace {

template<typename Stream>
Result<void> exchange(Stream& stream,
                      const std::string& head,
                      std::istream& body,
                      std::uint64_t size_bytes,
                      const std::string& key) {
    asio::write(stream, asio::buffer(head));

    std::vector<char> buffer(S3ObjectStore::kSendBufferSize);
    std::uint64_t sent = 0;
    while (sent < size_bytes) {
        const auto wanted = static_cast<std::streamsize>(
            std::min<std::uint64_t>(buffer.size(), size_bytes - sent));
        body.read(buffer.data(), wanted);
        const std::streamsize count = body.gcount();
        if (count <= 0) {
            return Err<void>(ErrorCode::Io,
                             "Body for " + key + " ended after " + std::to_string(sent) + " of " +
                             std::to_string(size_bytes) + " bytes");
        }
        asio::write(stream, asio::buffer(buffer.data(), static_cast<std::size_t>(count)));
        sent += static_cast<std::uint64_t>(count);
    }

    asio::streambuf response;
    asio::read_until(stream, response, "\r\n\r\n");

    std::istream response_stream(&response);
    std::string http_version;
    unsigned int status = 0;
    response_stream >> http_version >> status;
    if (!response_stream || http_version.rfind("HTTP/", 0) != 0) {
        return Err<void>(ErrorCode::Transport, "Malformed response to PUT " + key);
    }

    if (status >= 200 && status < 300) {
        return Ok();
    }

    // Drain whatever the server sent as an error document
    boost::system::error_code ec;
    asio::read(stream, response, asio::transfer_all(), ec);
    std::ostringstream rest;
    rest << &response;
    std::string detail = rest.str();
    if (detail.size() > 512) {
        detail.resize(512);
    }
    return Err<void>(ErrorCode::Transport,
                     "PUT " + key + " failed with HTTP " + std::to_string(status) + ": " + detail);
}

} // namespace

S3ObjectStore::S3ObjectStore(S3Options options)
    : options_(std::move(options)),
      signer_(options_.credentials, options_.region) {}

std::string S3ObjectStore::host_header() const {
    std::string host = options_.path_style ? options_.endpoint : options_.bucket + "." + options_.endpoint;
    const bool default_port = (options_.use_tls && options_.port == 443) || (!options_.use_tls && options_.port == 80);
    if (!default_port) {
        host += ":" + std::to_string(options_.port);
    }
    return host;
}

std::string S3ObjectStore::canonical_uri(const std::string& key) const {
    const std::string encoded = SigV4Signer::uri_encode(key, true);
    return options_.path_style ? "/" + options_.bucket + "/" + encoded : "/" + encoded;
}

std::string S3ObjectStore::build_request_head(const std::string& key,
                                              std::uint64_t size_bytes,
                                              StorageClass storage_class,
                                              const std::string& amz_date) const {
    std::map<std::string, std::string> signed_headers{
        {"host", host_header()},
        {"x-amz-content-sha256", SigV4Signer::kUnsignedPayload},
        {"x-amz-date", amz_date},
        {"x-amz-storage-class", to_string(storage_class)},
    };
    if (!options_.credentials.session_token.empty()) {
        signed_headers["x-amz-security-token"] = options_.credentials.session_token;
    }

    const std::string uri = canonical_uri(key);
    const std::string authorization =
        signer_.authorization("PUT", uri, "", signed_headers, SigV4Signer::kUnsignedPayload, amz_date);

    std::ostringstream head;
    head << "PUT " << uri << " HTTP/1.1\r\n";
    for (const auto& [name, value] : signed_headers) {
        head << name << ": " << value << "\r\n";
    }
    head << "authorization: " << authorization << "\r\n"
         << "content-length: " << size_bytes << "\r\n"
         << "content-type: application/octet-stream\r\n"
         << "connection: close\r\n"
         << "\r\n";
    return head.str();
}

Result<void> S3ObjectStore::put(const std::string& key,
                                std::istream& body,
                                std::uint64_t size_bytes,
                                StorageClass storage_class) {
    if (options_.bucket.empty()) {
        return Err<void>(ErrorCode::Config, "S3 bucket is not configured");
    }

    const std::string head = build_request_head(key, size_bytes, storage_class,
                                                SigV4Signer::amz_date(std::time(nullptr)));
    spdlog::debug("PUT s3://{}/{} ({} bytes, {})", options_.bucket, key, size_bytes, to_string(storage_class));

    const std::string server_name = options_.path_style
        ? options_.endpoint
        : options_.bucket + "." + options_.endpoint;

    try {
        asio::io_context io_context;
        tcp::resolver resolver(io_context);
        const auto endpoints = resolver.resolve(server_name, std::to_string(options_.port));

        if (!options_.use_tls) {
            tcp::socket socket(io_context);
            asio::connect(socket, endpoints);
            return exchange(socket, head, body, size_bytes, key);
        }

        ssl::context context(ssl::context::tls_client);
        context.set_default_verify_paths();
        ssl::stream<tcp::socket> stream(io_context, context);
        stream.set_verify_mode(ssl::verify_peer);
        stream.set_verify_callback(ssl::host_name_verification(server_name));
        if (!SSL_set_tlsext_host_name(stream.native_handle(), server_name.c_str())) {
            return Err<void>(ErrorCode::Transport, "Failed to set TLS server name " + server_name);
        }

        asio::connect(stream.lowest_layer(), endpoints);
        stream.handshake(ssl::stream_base::client);
        return exchange(stream, head, body, size_bytes, key);
    } catch (const boost::system::system_error& e) {
        return Err<void>(ErrorCode::Transport, "PUT " + key + " failed: " + e.what());
    }
}

} // namespace s3sync::storage
