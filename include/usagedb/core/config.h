#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "usagedb/core/types.h"

namespace usagedb {
namespace core {

/**
 * @brief Policy mapping timestamps to bucket keys
 *
 * Fixed for the lifetime of a storage directory.
 */
enum class BucketStrategy {
    DAILY,
    WEEKLY,
    MONTHLY
};

const char* BucketStrategyName(BucketStrategy strategy);

/**
 * @brief Parse "daily" / "weekly" / "monthly"
 * @throws InvalidArgumentError for any other name
 */
BucketStrategy ParseBucketStrategy(const std::string& name);

/**
 * @brief Configuration for the file based storage engine
 */
struct StorageConfig {
    std::string base_dir;             // Root of index.json, buckets/ and backups/
    BucketStrategy bucket_strategy;
    bool compression_enabled;         // Compress buckets older than a week
    int compression_level;            // gzip level used for compressed buckets
    bool encryption_enabled;          // Recorded on buckets, not implemented
    bool backup_enabled;
    int64_t max_retention_days;       // Used by enforce_retention()
    uint64_t max_file_size;           // Advisory; larger bucket writes are logged, 0 disables
    Clock clock;

    StorageConfig()
        : base_dir(".usagedb/historical-data"),
          bucket_strategy(BucketStrategy::DAILY),
          compression_enabled(true),
          compression_level(6),
          encryption_enabled(false),
          backup_enabled(true),
          max_retention_days(365),
          max_file_size(10 * 1024 * 1024),
          clock(SystemClock()) {}

    static StorageConfig Default() {
        return StorageConfig();
    }
};

/**
 * @brief Configuration for the query result cache
 */
struct CacheConfig {
    bool enabled;
    size_t max_size;
    Duration ttl;
    std::vector<std::string> key_fields;
    bool invalidate_on_write;

    CacheConfig()
        : enabled(true),
          max_size(1000),
          ttl(5 * kMillisPerMinute),
          key_fields({"timestamp", "sessionId"}),
          invalidate_on_write(true) {}

    static CacheConfig Default() {
        return CacheConfig();
    }
};

/**
 * @brief Configuration for the query engine
 */
struct QueryEngineConfig {
    std::string base_dir;             // Root of indexes/, query-cache/, saved-queries/
    CacheConfig cache;
    Duration slow_query_threshold_ms; // Counted as slow by get_stats()
    Duration optimize_threshold_ms;   // Flagged by optimize()
    size_t history_limit;             // Executions kept per query signature
    size_t index_suggestion_threshold;
    Clock clock;

    QueryEngineConfig()
        : base_dir(".usagedb/query-engine"),
          cache(CacheConfig::Default()),
          slow_query_threshold_ms(1000),
          optimize_threshold_ms(500),
          history_limit(100),
          index_suggestion_threshold(100),
          clock(SystemClock()) {}

    static QueryEngineConfig Default() {
        return QueryEngineConfig();
    }
};

} // namespace core
} // namespace usagedb
