#include "s3sync/config/config.hpp"

#include <nlohmann/json.hpp>

#include <array>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <utility>

namespace s3sync::config {
namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

fs::path resolve(const fs::path& base_dir, const std::string& value) {
    if (value.empty()) {
        return {};
    }
    const fs::path path(value);
    return path.is_absolute() ? path.lexically_normal() : (base_dir / path).lexically_normal();
}

void override_from_env(const char* name, std::string& target) {
    const char* value = std::getenv(name);
    if (value != nullptr && *value != '\0') {
        target = value;
    }
}

Result<StoreConfig> parse_store(const json& j, const fs::path& base_dir) {
    StoreConfig store;
    if (!j.is_object()) {
        return Err<StoreConfig>(ErrorCode::Config, "\"store\" must be an object");
    }

    const std::string type = j.value("type", "s3");
    if (type == "s3") {
        store.type = StoreType::S3;
        auto& s3 = store.s3;
        s3.bucket = j.value("bucket", "");
        s3.endpoint = j.value("endpoint", s3.endpoint);
        s3.port = j.value("port", s3.port);
        s3.use_tls = j.value("use_tls", s3.use_tls);
        s3.path_style = j.value("path_style", s3.path_style);
        s3.region = j.value("region", s3.region);
        s3.credentials.access_key_id = j.value("access_key_id", "");
        s3.credentials.secret_access_key = j.value("secret_access_key", "");
        s3.credentials.session_token = j.value("session_token", "");
    } else if (type == "local") {
        store.type = StoreType::Local;
        store.local.hot_root = resolve(base_dir, j.value("hot_root", ""));
        store.local.cold_root = resolve(base_dir, j.value("cold_root", ""));
        if (store.local.cold_root.empty() && !store.local.hot_root.empty()) {
            store.local.cold_root = store.local.hot_root / "DEEP_ARCHIVE";
        }
    } else {
        return Err<StoreConfig>(ErrorCode::Config, "Unknown store type: " + type);
    }

    return Ok(std::move(store));
}

} // namespace

Result<SyncConfig> parse_config(const std::string& text, const fs::path& base_dir) {
    auto j = json::parse(text, nullptr, false);
    if (j.is_discarded()) {
        return Err<SyncConfig>(ErrorCode::Config, "Invalid JSON");
    }
    if (!j.is_object()) {
        return Err<SyncConfig>(ErrorCode::Config, "Config must be a JSON object");
    }

    SyncConfig config;
    try {
        config.root = resolve(base_dir, j.value("root", ""));
        config.ledger_path = resolve(base_dir, j.value("ledger_path", ""));
        if (config.ledger_path.empty() && !config.root.empty()) {
            config.ledger_path = config.root / kDefaultLedgerName;
        }

        if (j.contains("filters")) {
            config.filters = j.at("filters").get<std::vector<std::string>>();
        }
        config.deep_archive = j.value("deep_archive", false);
        config.split_threshold_bytes = j.value("split_threshold_bytes", config.split_threshold_bytes);
        config.piece_size_bytes = j.value("piece_size_bytes", config.split_threshold_bytes);
        config.log_level = j.value("log_level", config.log_level);

        auto store = parse_store(j.value("store", json::object()), base_dir);
        if (store.is_error()) {
            return Err<SyncConfig>(store.error());
        }
        config.store = std::move(store.value());
    } catch (const json::exception& e) {
        return Err<SyncConfig>(ErrorCode::Config, std::string("Malformed config: ") + e.what());
    }

    return Ok(std::move(config));
}

Result<SyncConfig> load_config(const fs::path& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<SyncConfig>(ErrorCode::Config, "Cannot read config file: " + path.string());
    }
    std::ostringstream text;
    text << input.rdbuf();

    auto config = parse_config(text.str(), fs::absolute(path).parent_path());
    if (config.is_error()) {
        return Err<SyncConfig>(ErrorCode::Config, path.string() + ": " + config.error().message);
    }
    return config;
}

void apply_environment(SyncConfig& config) {
    auto& s3 = config.store.s3;
    override_from_env("AWS_ACCESS_KEY_ID", s3.credentials.access_key_id);
    override_from_env("AWS_SECRET_ACCESS_KEY", s3.credentials.secret_access_key);
    override_from_env("AWS_SESSION_TOKEN", s3.credentials.session_token);
    override_from_env("AWS_REGION", s3.region);
}

Result<void> validate(const SyncConfig& config) {
    if (config.root.empty()) {
        return Err<void>(ErrorCode::Config, "\"root\" is required");
    }
    if (config.split_threshold_bytes == 0) {
        return Err<void>(ErrorCode::Config, "split_threshold_bytes must be > 0");
    }
    if (config.split_threshold_bytes > sync::kMaxSingleObjectSize) {
        return Err<void>(ErrorCode::Config, "split_threshold_bytes exceeds the single-object limit of " +
                                            std::to_string(sync::kMaxSingleObjectSize) + " bytes");
    }
    if (config.piece_size_bytes == 0) {
        return Err<void>(ErrorCode::Config, "piece_size_bytes must be > 0");
    }
    if (config.piece_size_bytes > config.split_threshold_bytes) {
        return Err<void>(ErrorCode::Config, "piece_size_bytes must not exceed split_threshold_bytes");
    }
    if (auto level = parse_log_level(config.log_level); level.is_error()) {
        return Err<void>(level.error());
    }

    if (config.store.type == StoreType::Local) {
        if (config.store.local.hot_root.empty()) {
            return Err<void>(ErrorCode::Config, "Local store requires \"hot_root\"");
        }
        return Ok();
    }

    const auto& s3 = config.store.s3;
    if (s3.bucket.empty()) {
        return Err<void>(ErrorCode::Config, "S3 store requires \"bucket\"");
    }
    if (s3.endpoint.empty() || s3.region.empty()) {
        return Err<void>(ErrorCode::Config, "S3 store requires an endpoint and a region");
    }
    if (s3.credentials.access_key_id.empty() || s3.credentials.secret_access_key.empty()) {
        return Err<void>(ErrorCode::Config,
                         "S3 credentials missing: set AWS_ACCESS_KEY_ID and AWS_SECRET_ACCESS_KEY");
    }
    return Ok();
}

Result<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    static const std::array<std::pair<const char*, spdlog::level::level_enum>, 7> levels{{
        {"trace", spdlog::level::trace},
        {"debug", spdlog::level::debug},
        {"info", spdlog::level::info},
        {"warn", spdlog::level::warn},
        {"error", spdlog::level::err},
        {"critical", spdlog::level::critical},
        {"off", spdlog::level::off},
    }};
    for (const auto& [level_name, level] : levels) {
        if (name == level_name) {
            return Ok(level);
        }
    }
    return Err<spdlog::level::level_enum>(ErrorCode::Config, "Unknown log level: " + name);
}

sync::SyncOptions to_sync_options(const SyncConfig& config) {
    sync::SyncOptions options;
    options.root = config.root;
    options.split_threshold = config.split_threshold_bytes;
    options.piece_size = config.piece_size_bytes;
    return options;
}

Result<std::unique_ptr<storage::ObjectStore>> make_object_store(const StoreConfig& config) {
    std::unique_ptr<storage::ObjectStore> store;
    if (config.type == StoreType::Local) {
        std::error_code ec;
        fs::create_directories(config.local.hot_root, ec);
        if (!ec) {
            fs::create_directories(config.local.cold_root, ec);
        }
        if (ec) {
            return Err<std::unique_ptr<storage::ObjectStore>>(
                ErrorCode::Config, "Cannot create local store directories: " + ec.message());
        }
        store = std::make_unique<storage::LocalObjectStore>(config.local.hot_root, config.local.cold_root);
    } else {
        store = std::make_unique<storage::S3ObjectStore>(config.s3);
    }
    return Ok(std::move(store));
}

} // namespace s3sync::config
