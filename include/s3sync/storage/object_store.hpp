#pragma once

#include "s3sync/core/result.hpp"

#include <cstdint>
#include <istream>
#include <string>

namespace s3sync::storage {

enum class StorageClass {
    Standard,
    DeepArchive
};

/**
 * @brief Destination for uploaded objects
 *
 * put() must be safe to retry; callers decide whether to. Implementations do
 * not retry internally.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    virtual Result<void> put(const std::string& key,
                             std::istream& body,
                             std::uint64_t size_bytes,
                             StorageClass storage_class) = 0;
};

inline StorageClass storage_class_for(bool deep) {
    return deep ? StorageClass::DeepArchive : StorageClass::Standard;
}

/// Wire name used in the x-amz-storage-class header.
inline const char* to_string(StorageClass storage_class) {
    return storage_class == StorageClass::DeepArchive ? "DEEP_ARCHIVE" : "STANDARD";
}

/// Object key for a root-relative path: forward slashes, no leading "./" or "/".
std::string make_object_key(const std::string& path);

} // namespace s3sync::storage
