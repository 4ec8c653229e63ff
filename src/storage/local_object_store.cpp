#include "s3sync/storage/local_object_store.hpp"

#include <spdlog/spdlog.h>

#include <fstream>
#include <system_error>
#include <vector>

namespace s3sync::storage {
namespace fs = std::filesystem;

LocalObjectStore::LocalObjectStore(fs::path hot_root, fs::path cold_root)
    : hot_root_(std::move(hot_root)), cold_root_(std::move(cold_root)) {}

fs::path LocalObjectStore::object_path(const std::string& key, StorageClass storage_class) const {
    const auto& root = storage_class == StorageClass::DeepArchive ? cold_root_ : hot_root_;
    return root / fs::path(key).relative_path();
}

Result<void> LocalObjectStore::put(const std::string& key,
                                   std::istream& body,
                                   std::uint64_t size_bytes,
                                   StorageClass storage_class) {
    if (key.empty()) {
        return Err<void>(ErrorCode::Transport, "Object key must not be empty");
    }

    const fs::path destination = object_path(key, storage_class);
    std::error_code ec;
    fs::create_directories(destination.parent_path(), ec);
    if (ec) {
        return Err<void>(ErrorCode::Transport,
                         "Failed to create directory " + destination.parent_path().string() + ": " + ec.message());
    }

    fs::path staging = destination;
    staging += ".upload";

    std::uint64_t copied = 0;
    {
        std::ofstream output(staging, std::ios::binary | std::ios::trunc);
        if (!output) {
            return Err<void>(ErrorCode::Transport, "Failed to open object for writing: " + staging.string());
        }

        std::vector<char> buffer(64 * 1024);
        while (body.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || body.gcount() > 0) {
            const std::streamsize count = body.gcount();
            output.write(buffer.data(), count);
            if (!output) {
                break;
            }
            copied += static_cast<std::uint64_t>(count);
        }
        output.flush();

        if (!output || body.bad()) {
            output.close();
            fs::remove(staging, ec);
            return Err<void>(ErrorCode::Transport, "Failed to write object " + key);
        }
    }

    if (copied != size_bytes) {
        fs::remove(staging, ec);
        return Err<void>(ErrorCode::Transport,
                         "Short body for " + key + ": expected " + std::to_string(size_bytes) +
                         " bytes, got " + std::to_string(copied));
    }

    fs::rename(staging, destination, ec);
    if (ec) {
        fs::remove(staging, ec);
        return Err<void>(ErrorCode::Transport, "Failed to move object into place: " + destination.string());
    }

    spdlog::debug("Stored {} ({} bytes, {})", destination.string(), copied, to_string(storage_class));
    return Ok();
}

} // namespace s3sync::storage
