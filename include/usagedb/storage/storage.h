#ifndef USAGEDB_STORAGE_STORAGE_H_
#define USAGEDB_STORAGE_STORAGE_H_

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "usagedb/core/error.h"
#include "usagedb/core/result.h"
#include "usagedb/core/types.h"
#include "usagedb/storage/bucket.h"

namespace usagedb {
namespace storage {

/**
 * @brief Outcome of a storage mutation
 *
 * Storage mutations never throw; callers branch on success.
 */
struct StorageOperationResult {
    bool success = false;
    uint64_t records_affected = 0;
    int64_t execution_time_ms = 0;
    std::optional<std::string> error;
    core::Error::Code error_code = core::Error::Code::UNKNOWN;

    static StorageOperationResult Ok(uint64_t records, int64_t elapsed_ms) {
        StorageOperationResult result;
        result.success = true;
        result.records_affected = records;
        result.execution_time_ms = elapsed_ms;
        return result;
    }

    static StorageOperationResult Failure(std::string message, core::Error::Code code, int64_t elapsed_ms) {
        StorageOperationResult result;
        result.success = false;
        result.execution_time_ms = elapsed_ms;
        result.error = std::move(message);
        result.error_code = code;
        return result;
    }
};

/**
 * @brief Inclusive time range with pagination for raw point queries
 */
struct QueryRange {
    core::Timestamp start = 0;
    core::Timestamp end = 0;
    size_t offset = 0;
    std::optional<size_t> limit;

    QueryRange() = default;
    QueryRange(core::Timestamp s, core::Timestamp e) : start(s), end(e) {}
};

/**
 * @brief Rollup of the points that fall into one aggregation window
 */
struct AggregatedUsage {
    core::AggregationWindow time_window = core::AggregationWindow::DAY;
    core::Timestamp window_start = 0;
    core::Timestamp window_end = 0;
    int64_t total_requests = 0;
    double total_cost = 0.0;
    double average_usage = 0.0;   // total_requests / data_points
    double peak_usage = 0.0;      // highest usage percentage
    uint64_t unique_sessions = 0; // estimate, see FileBasedStorage::query_aggregated
    std::vector<std::string> features_used;
    uint64_t data_points = 0;
};

/**
 * @brief Storage statistics
 */
struct StorageStats {
    uint64_t total_data_points = 0;
    uint64_t total_file_size = 0;
    uint64_t total_uncompressed_size = 0;
    double compression_ratio = 1.0;   // on-disk bytes / decoded JSON bytes
    core::Timestamp oldest_record = 0;
    core::Timestamp newest_record = 0;
    double average_data_points_per_day = 0.0;
    size_t compressed_buckets = 0;
    std::vector<std::pair<std::string, StorageBucket>> storage_buckets;
    core::Timestamp last_compaction = 0;
    core::Timestamp last_backup = 0;
};

/**
 * @brief Storage engine interface for usage time series
 */
class UsageStorage {
public:
    virtual ~UsageStorage() = default;

    /**
     * @brief Store a single data point
     */
    virtual StorageOperationResult store(const core::UsageDataPoint& point) = 0;

    /**
     * @brief Store several points with one rewrite per touched bucket
     */
    virtual StorageOperationResult store_batch(const std::vector<core::UsageDataPoint>& points) = 0;

    /**
     * @brief Points with start <= timestamp <= end, ascending, paginated
     */
    virtual core::Result<std::vector<core::UsageDataPoint>> query(const QueryRange& range) = 0;

    /**
     * @brief Points of query(range) folded into windows
     */
    virtual core::Result<std::vector<AggregatedUsage>> query_aggregated(
        const QueryRange& range, core::AggregationWindow window) = 0;

    virtual core::Result<StorageStats> get_stats() = 0;

    /**
     * @brief Compress buckets that have become old enough
     */
    virtual StorageOperationResult compact() = 0;

    /**
     * @brief Delete buckets that end before older_than
     */
    virtual StorageOperationResult purge_old_data(core::Timestamp older_than) = 0;

    virtual StorageOperationResult backup(const std::string& path) = 0;
    virtual StorageOperationResult restore(const std::string& path) = 0;

    /**
     * @brief Drop in-memory state; the next call re-initializes
     */
    virtual void close() = 0;
};

} // namespace storage
} // namespace usagedb

#endif // USAGEDB_STORAGE_STORAGE_H_
