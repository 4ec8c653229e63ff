#include "s3sync/config/config.hpp"

#include "../support/test_utils.hpp"

#include <gtest/gtest.h>

#include <cstdlib>

namespace fs = std::filesystem;
using s3sync::ErrorCode;
using s3sync::config::apply_environment;
using s3sync::config::load_config;
using s3sync::config::make_object_store;
using s3sync::config::parse_config;
using s3sync::config::parse_log_level;
using s3sync::config::StoreType;
using s3sync::config::SyncConfig;
using s3sync::config::to_sync_options;
using s3sync::config::validate;
using s3sync::testing::create_temp_dir;
using s3sync::testing::write_file;

namespace {

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        for (const char* name : {"AWS_ACCESS_KEY_ID", "AWS_SECRET_ACCESS_KEY", "AWS_SESSION_TOKEN", "AWS_REGION"}) {
            unsetenv(name);
        }
    }

    void TearDown() override { SetUp(); }
};

const char* kS3Config = R"({
    "root": "data",
    "filters": [".jpg", ".mov"],
    "deep_archive": true,
    "split_threshold_bytes": 1000,
    "piece_size_bytes": 250,
    "log_level": "debug",
    "store": {
        "type": "s3",
        "bucket": "backups",
        "region": "eu-west-1",
        "access_key_id": "AKID",
        "secret_access_key": "SECRET"
    }
})";

} // namespace

TEST_F(ConfigTest, ParsesS3Config) {
    auto parsed = parse_config(kS3Config, "/etc/s3sync");

    ASSERT_TRUE(parsed.is_ok()) << s3sync::to_string(parsed.error());
    const auto& config = parsed.value();
    EXPECT_EQ(config.root, fs::path("/etc/s3sync/data"));
    EXPECT_EQ(config.ledger_path, fs::path("/etc/s3sync/data/.s3sync-ledger.db"));
    EXPECT_EQ(config.filters, (std::vector<std::string>{".jpg", ".mov"}));
    EXPECT_TRUE(config.deep_archive);
    EXPECT_EQ(config.split_threshold_bytes, 1000u);
    EXPECT_EQ(config.piece_size_bytes, 250u);
    EXPECT_EQ(config.store.type, StoreType::S3);
    EXPECT_EQ(config.store.s3.bucket, "backups");
    EXPECT_EQ(config.store.s3.region, "eu-west-1");
    EXPECT_EQ(config.store.s3.endpoint, "s3.amazonaws.com");
    EXPECT_TRUE(validate(config).is_ok());

    const auto options = to_sync_options(config);
    EXPECT_EQ(options.root, config.root);
    EXPECT_EQ(options.piece_size, 250u);
}

TEST_F(ConfigTest, DefaultsFollowTheStoreLimit) {
    auto parsed = parse_config(R"({"root": "/data", "store": {"type": "local", "hot_root": "/backup"}})", "/");

    ASSERT_TRUE(parsed.is_ok());
    const auto& config = parsed.value();
    EXPECT_EQ(config.split_threshold_bytes, s3sync::sync::kMaxSingleObjectSize);
    EXPECT_EQ(config.piece_size_bytes, s3sync::sync::kMaxSingleObjectSize);
    EXPECT_TRUE(config.filters.empty());
    EXPECT_FALSE(config.deep_archive);
    EXPECT_EQ(config.store.type, StoreType::Local);
    EXPECT_EQ(config.store.local.cold_root, fs::path("/backup/DEEP_ARCHIVE"));
    EXPECT_TRUE(validate(config).is_ok());
}

TEST_F(ConfigTest, PieceSizeDefaultsToThreshold) {
    auto parsed = parse_config(
        R"({"root": "/data", "split_threshold_bytes": 64, "store": {"type": "local", "hot_root": "/b"}})", "/");

    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().piece_size_bytes, 64u);
}

TEST_F(ConfigTest, RejectsMalformedInput) {
    EXPECT_EQ(parse_config("{not json", "/").error().code, ErrorCode::Config);
    EXPECT_EQ(parse_config("[1, 2]", "/").error().code, ErrorCode::Config);
    EXPECT_EQ(parse_config(R"({"root": 5})", "/").error().code, ErrorCode::Config);
    EXPECT_EQ(parse_config(R"({"root": "/d", "store": {"type": "ftp"}})", "/").error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, ValidationRules) {
    auto config = parse_config(kS3Config, "/").value();
    ASSERT_TRUE(validate(config).is_ok());

    auto no_piece = config;
    no_piece.piece_size_bytes = 0;
    EXPECT_TRUE(validate(no_piece).is_error());

    auto big_piece = config;
    big_piece.piece_size_bytes = config.split_threshold_bytes + 1;
    EXPECT_TRUE(validate(big_piece).is_error());

    auto over_limit = config;
    over_limit.split_threshold_bytes = s3sync::sync::kMaxSingleObjectSize + 1;
    EXPECT_TRUE(validate(over_limit).is_error());

    auto no_bucket = config;
    no_bucket.store.s3.bucket.clear();
    EXPECT_EQ(validate(no_bucket).error().code, ErrorCode::Config);

    auto no_credentials = config;
    no_credentials.store.s3.credentials.secret_access_key.clear();
    EXPECT_TRUE(validate(no_credentials).is_error());

    auto bad_level = config;
    bad_level.log_level = "loud";
    EXPECT_TRUE(validate(bad_level).is_error());

    auto no_root = config;
    no_root.root.clear();
    EXPECT_TRUE(validate(no_root).is_error());
}

TEST_F(ConfigTest, EnvironmentOverridesCredentials) {
    auto config = parse_config(kS3Config, "/").value();
    setenv("AWS_ACCESS_KEY_ID", "ENV_KEY", 1);
    setenv("AWS_SECRET_ACCESS_KEY", "ENV_SECRET", 1);
    setenv("AWS_SESSION_TOKEN", "ENV_TOKEN", 1);
    setenv("AWS_REGION", "ap-south-1", 1);

    apply_environment(config);

    EXPECT_EQ(config.store.s3.credentials.access_key_id, "ENV_KEY");
    EXPECT_EQ(config.store.s3.credentials.secret_access_key, "ENV_SECRET");
    EXPECT_EQ(config.store.s3.credentials.session_token, "ENV_TOKEN");
    EXPECT_EQ(config.store.s3.region, "ap-south-1");
}

TEST_F(ConfigTest, UnsetEnvironmentKeepsFileValues) {
    auto config = parse_config(kS3Config, "/").value();

    apply_environment(config);

    EXPECT_EQ(config.store.s3.credentials.access_key_id, "AKID");
    EXPECT_EQ(config.store.s3.region, "eu-west-1");
}

TEST_F(ConfigTest, LoadResolvesPathsAgainstConfigDirectory) {
    const auto dir = create_temp_dir("s3sync_config");
    write_file(dir / "sync.json",
               R"({"root": "files", "ledger_path": "state/ledger.db",
                   "store": {"type": "local", "hot_root": "hot", "cold_root": "cold"}})");

    auto loaded = load_config(dir / "sync.json");

    ASSERT_TRUE(loaded.is_ok()) << s3sync::to_string(loaded.error());
    EXPECT_EQ(loaded.value().root, (dir / "files").lexically_normal());
    EXPECT_EQ(loaded.value().ledger_path, (dir / "state" / "ledger.db").lexically_normal());
    EXPECT_EQ(loaded.value().store.local.cold_root, (dir / "cold").lexically_normal());

    auto store = make_object_store(loaded.value().store);
    ASSERT_TRUE(store.is_ok());
    EXPECT_TRUE(fs::is_directory(dir / "hot"));
    EXPECT_TRUE(fs::is_directory(dir / "cold"));
}

TEST_F(ConfigTest, MissingFileIsConfigError) {
    auto loaded = load_config("/nonexistent/s3sync.json");

    ASSERT_TRUE(loaded.is_error());
    EXPECT_EQ(loaded.error().code, ErrorCode::Config);
}

TEST_F(ConfigTest, LogLevels) {
    EXPECT_EQ(parse_log_level("debug").value(), spdlog::level::debug);
    EXPECT_EQ(parse_log_level("warn").value(), spdlog::level::warn);
    EXPECT_EQ(parse_log_level("error").value(), spdlog::level::err);
    EXPECT_TRUE(parse_log_level("verbose").is_error());
}
