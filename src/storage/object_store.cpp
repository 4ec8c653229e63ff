#include "s3sync/storage/object_store.hpp"

#include <algorithm>
#include <filesystem>

namespace s3sync::storage {

std::string make_object_key(const std::string& path) {
    std::string key = std::filesystem::path(path).lexically_normal().generic_string();
    std::replace(key.begin(), key.end(), '\\', '/');

    while (key.rfind("./", 0) == 0) {
        key.erase(0, 2);
    }
    const auto first = key.find_first_not_of('/');
    return first == std::string::npos ? std::string() : key.substr(first);
}

} // namespace s3sync::storage
