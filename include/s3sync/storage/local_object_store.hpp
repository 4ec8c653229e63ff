#pragma once

#include "s3sync/storage/object_store.hpp"

#include <filesystem>

namespace s3sync::storage {

/**
 * @brief Object store backed by two local directory trees
 *
 * Standard objects land under the hot root, DeepArchive objects under the
 * cold root, each at "<root>/<key>". Writes go to a temporary sibling first
 * and are renamed into place, so a reader never sees a torn object.
 */
class LocalObjectStore : public ObjectStore {
public:
    LocalObjectStore(std::filesystem::path hot_root, std::filesystem::path cold_root);

    Result<void> put(const std::string& key,
                     std::istream& body,
                     std::uint64_t size_bytes,
                     StorageClass storage_class) override;

    std::filesystem::path object_path(const std::string& key, StorageClass storage_class) const;

private:
    std::filesystem::path hot_root_;
    std::filesystem::path cold_root_;
};

} // namespace s3sync::storage
