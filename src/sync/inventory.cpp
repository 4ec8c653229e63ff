#include "s3sync/sync/inventory.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>

namespace s3sync::sync {
namespace fs = std::filesystem;

namespace {

std::int64_t to_unix_seconds(fs::file_time_type time) {
    using namespace std::chrono;
    // Fixed once per process so one file time always maps to the same second
    static const auto offset = system_clock::now().time_since_epoch() -
        duration_cast<system_clock::duration>(fs::file_time_type::clock::now().time_since_epoch());
    const auto since_epoch = duration_cast<system_clock::duration>(time.time_since_epoch()) + offset;
    return static_cast<std::int64_t>(duration_cast<seconds>(since_epoch).count());
}

bool ends_with(const std::string& value, const std::string& suffix) {
    return value.size() >= suffix.size() &&
           value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

std::int64_t file_mtime(const fs::path& path, std::error_code& ec) {
    const auto write_time = fs::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    return to_unix_seconds(write_time);
}

Inventory::Inventory(std::vector<std::string> filters, bool recursive)
    : filters_(std::move(filters)), recursive_(recursive) {}

void Inventory::exclude(std::string relative_prefix) {
    excluded_.push_back(std::move(relative_prefix));
}

bool Inventory::matches(const std::string& file_name) const {
    if (filters_.empty()) {
        return true;
    }
    return std::any_of(filters_.begin(), filters_.end(),
                       [&file_name](const std::string& filter) { return ends_with(file_name, filter); });
}

bool Inventory::excluded(const std::string& relative) const {
    return std::any_of(excluded_.begin(), excluded_.end(),
                       [&relative](const std::string& prefix) { return relative.rfind(prefix, 0) == 0; });
}

Result<InventoryMap> Inventory::scan(const fs::path& root) const {
    std::error_code ec;
    if (!fs::is_directory(root, ec)) {
        return Err<InventoryMap>(ErrorCode::Io, "Sync root is not a directory: " + root.string());
    }

    InventoryMap inventory;

    auto process_entry = [&](const fs::directory_entry& entry) -> Result<void> {
        std::error_code entry_ec;
        if (!entry.is_regular_file(entry_ec) || !matches(entry.path().filename().string())) {
            return Ok();
        }

        const auto relative = entry.path().lexically_relative(root);
        if (relative.empty()) {
            return Ok();
        }
        const std::string normalized = relative.generic_string();
        if (excluded(normalized)) {
            return Ok();
        }

        const auto modified = file_mtime(entry.path(), entry_ec);
        if (entry_ec) {
            return Err<void>(ErrorCode::Io, "Failed to stat " + entry.path().string() + ": " + entry_ec.message());
        }
        inventory[normalized] = modified;
        return Ok();
    };

    if (recursive_) {
        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        const fs::recursive_directory_iterator end;
        while (!ec && it != end) {
            if (auto res = process_entry(*it); res.is_error()) {
                return Err<InventoryMap>(res.error());
            }
            it.increment(ec);
        }
    } else {
        fs::directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        const fs::directory_iterator end;
        while (!ec && it != end) {
            if (auto res = process_entry(*it); res.is_error()) {
                return Err<InventoryMap>(res.error());
            }
            it.increment(ec);
        }
    }

    if (ec) {
        return Err<InventoryMap>(ErrorCode::Io, "Failed to walk " + root.string() + ": " + ec.message());
    }

    spdlog::debug("Inventory of {}: {} files", root.string(), inventory.size());
    return Ok(std::move(inventory));
}

} // namespace s3sync::sync
