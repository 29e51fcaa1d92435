#include <gtest/gtest.h>

#include <fstream>

#include "usagedb/common/config_loader.h"
#include "test_util/temp_dir.h"

namespace usagedb {
namespace common {
namespace {

using core::Error;

TEST(ConfigLoaderTest, EmptyObjectKeepsDefaults) {
    auto config = ConfigLoader::parse("{}");
    ASSERT_TRUE(config.ok()) << config.error();

    const auto& storage = config.value().storage;
    EXPECT_EQ(storage.bucket_strategy, core::BucketStrategy::DAILY);
    EXPECT_TRUE(storage.compression_enabled);
    EXPECT_EQ(storage.compression_level, 6);
    EXPECT_EQ(storage.max_retention_days, 365);

    const auto& query = config.value().query;
    EXPECT_TRUE(query.cache.enabled);
    EXPECT_EQ(query.cache.max_size, 1000u);
    EXPECT_EQ(query.cache.ttl, 5 * core::kMillisPerMinute);
    EXPECT_EQ(config.value().log_level, spdlog::level::info);
}

TEST(ConfigLoaderTest, ReadsEverySection) {
    auto config = ConfigLoader::parse(R"({
        "logLevel": "debug",
        "storage": {
            "baseDir": "/var/lib/usage",
            "bucketStrategy": "weekly",
            "compressionEnabled": false,
            "compressionLevel": 9,
            "backupEnabled": false,
            "maxRetentionDays": 30
        },
        "query": {
            "baseDir": "/var/lib/usage-query",
            "slowQueryThresholdMs": 250,
            "historyLimit": 10,
            "cache": {"enabled": false, "maxSize": 5, "ttl": 1000, "keyFields": ["date"]}
        }
    })");
    ASSERT_TRUE(config.ok()) << config.error();

    const auto& value = config.value();
    EXPECT_EQ(value.log_level, spdlog::level::debug);
    EXPECT_EQ(value.storage.base_dir, "/var/lib/usage");
    EXPECT_EQ(value.storage.bucket_strategy, core::BucketStrategy::WEEKLY);
    EXPECT_FALSE(value.storage.compression_enabled);
    EXPECT_EQ(value.storage.compression_level, 9);
    EXPECT_FALSE(value.storage.backup_enabled);
    EXPECT_EQ(value.storage.max_retention_days, 30);

    EXPECT_EQ(value.query.base_dir, "/var/lib/usage-query");
    EXPECT_EQ(value.query.slow_query_threshold_ms, 250);
    EXPECT_EQ(value.query.history_limit, 10u);
    EXPECT_FALSE(value.query.cache.enabled);
    EXPECT_EQ(value.query.cache.max_size, 5u);
    EXPECT_EQ(value.query.cache.ttl, 1000);
    EXPECT_EQ(value.query.cache.key_fields, std::vector<std::string>{"date"});
    EXPECT_TRUE(value.query.cache.invalidate_on_write);
}

TEST(ConfigLoaderTest, RejectsInvalidValues) {
    const char* cases[] = {
        "not json",
        "[]",
        R"({"logLevel": "chatty"})",
        R"({"storage": {"bucketStrategy": "hourly"}})",
        R"({"storage": {"compressionLevel": 12}})",
        R"({"storage": {"compressionEnabled": "yes"}})",
        R"({"query": {"cache": {"maxSize": 0}}})",
        R"({"query": {"historyLimit": 0}})",
        R"({"query": {"cache": {"keyFields": [1, 2]}}})",
        R"({"query": []})",
    };
    for (const char* json : cases) {
        auto config = ConfigLoader::parse(json);
        EXPECT_FALSE(config.ok()) << json;
        EXPECT_EQ(config.code(), Error::Code::INVALID_ARGUMENT) << json;
    }
}

TEST(ConfigLoaderTest, ErrorNamesTheOffendingKey) {
    auto config = ConfigLoader::parse(R"({"storage": {"maxRetentionDays": -1}})");
    ASSERT_FALSE(config.ok());
    EXPECT_NE(config.error().find("storage.maxRetentionDays"), std::string::npos);
}

TEST(ConfigLoaderTest, LoadFile) {
    testutil::ScopedTestDir dir("usagedb_config");
    const auto path = (dir.path() / "usagedb.json").string();
    {
        std::ofstream out(path);
        out << R"({"storage": {"bucketStrategy": "monthly"}})";
    }
    auto config = ConfigLoader::load_file(path);
    ASSERT_TRUE(config.ok()) << config.error();
    EXPECT_EQ(config.value().storage.bucket_strategy, core::BucketStrategy::MONTHLY);

    auto missing = ConfigLoader::load_file((dir.path() / "absent.json").string());
    EXPECT_FALSE(missing.ok());
    EXPECT_EQ(missing.code(), Error::Code::NOT_FOUND);
}

TEST(ConfigLoaderTest, LoadFilePrefixesParseErrors) {
    testutil::ScopedTestDir dir("usagedb_config");
    const auto path = (dir.path() / "broken.json").string();
    {
        std::ofstream out(path);
        out << "{";
    }
    auto config = ConfigLoader::load_file(path);
    ASSERT_FALSE(config.ok());
    EXPECT_EQ(config.code(), Error::Code::INVALID_ARGUMENT);
    EXPECT_EQ(config.error().rfind(path, 0), 0u);
}

} // namespace
} // namespace common
} // namespace usagedb
