#pragma once

#include "s3sync/core/result.hpp"

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <system_error>
#include <vector>

namespace s3sync::sync {

/// Root-relative forward-slash path -> modification time (unix seconds).
using InventoryMap = std::map<std::string, std::int64_t>;

/**
 * @brief Takes stock of the files under a sync root
 *
 * Only regular files whose name ends with one of the filter suffixes are
 * kept; an empty filter list keeps every file.
 */
class Inventory {
public:
    explicit Inventory(std::vector<std::string> filters = {}, bool recursive = true);

    /// Skip every path that starts with this root-relative prefix.
    void exclude(std::string relative_prefix);

    Result<InventoryMap> scan(const std::filesystem::path& root) const;

    [[nodiscard]] bool matches(const std::string& file_name) const;

    const std::vector<std::string>& filters() const noexcept { return filters_; }

private:
    bool excluded(const std::string& relative) const;

    std::vector<std::string> filters_;
    std::vector<std::string> excluded_;
    bool recursive_ = true;
};

/// Modification time of `path` in unix seconds.
std::int64_t file_mtime(const std::filesystem::path& path, std::error_code& ec);

} // namespace s3sync::sync
