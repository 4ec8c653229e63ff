#pragma once

/**
 * @file config.hpp
 * @brief JSON configuration for a sync run
 *
 * EXAMPLE:
 * {
 *   "root": "/data/photos",
 *   "ledger_path": "/var/lib/s3sync/photos.db",
 *   "filters": [".jpg", ".mov"],
 *   "deep_archive": false,
 *   "log_level": "info",
 *   "store": { "type": "s3", "bucket": "my-backups", "region": "eu-west-1" }
 * }
 *
 * Relative paths are resolved against the directory holding the config file.
 * AWS_ACCESS_KEY_ID, AWS_SECRET_ACCESS_KEY, AWS_SESSION_TOKEN and AWS_REGION
 * override the matching store settings when set.
 */

#include "s3sync/core/result.hpp"
#include "s3sync/storage/local_object_store.hpp"
#include "s3sync/storage/object_store.hpp"
#include "s3sync/storage/s3_object_store.hpp"
#include "s3sync/sync/syncer.hpp"

#include <spdlog/spdlog.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace s3sync::config {

enum class StoreType {
    S3,
    Local
};

struct LocalStoreConfig {
    std::filesystem::path hot_root;
    std::filesystem::path cold_root;   ///< Defaults to <hot_root>/DEEP_ARCHIVE
};

struct StoreConfig {
    StoreType type = StoreType::S3;
    storage::S3Options s3;
    LocalStoreConfig local;
};

struct SyncConfig {
    std::filesystem::path root;
    std::filesystem::path ledger_path;    ///< Defaults to <root>/.s3sync-ledger.db
    std::vector<std::string> filters;     ///< File name suffixes; empty keeps every file
    bool deep_archive = false;
    std::uint64_t split_threshold_bytes = sync::kMaxSingleObjectSize;
    std::uint64_t piece_size_bytes = sync::kMaxSingleObjectSize;
    std::string log_level = "info";
    StoreConfig store;
};

inline constexpr const char* kDefaultLedgerName = ".s3sync-ledger.db";

/// Parse config text; relative paths are resolved against `base_dir`.
Result<SyncConfig> parse_config(const std::string& text, const std::filesystem::path& base_dir);

Result<SyncConfig> load_config(const std::filesystem::path& path);

/// Apply AWS_* environment overrides to the S3 store settings.
void apply_environment(SyncConfig& config);

Result<void> validate(const SyncConfig& config);

Result<spdlog::level::level_enum> parse_log_level(const std::string& name);

sync::SyncOptions to_sync_options(const SyncConfig& config);

Result<std::unique_ptr<storage::ObjectStore>> make_object_store(const StoreConfig& config);

} // namespace s3sync::config
