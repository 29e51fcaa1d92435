#ifndef USAGEDB_STORAGE_FILE_STORAGE_H_
#define USAGEDB_STORAGE_FILE_STORAGE_H_

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

#include "usagedb/core/config.h"
#include "usagedb/storage/bucket_index.h"
#include "usagedb/storage/compression.h"
#include "usagedb/storage/storage.h"

namespace usagedb {
namespace storage {

/**
 * @brief File backed usage storage organised into time buckets
 *
 * Layout under config.base_dir:
 *   index.json                 bucket catalog (see BucketIndex)
 *   buckets/<key>.json         uncompressed bucket, JSON array ascending by timestamp
 *   buckets/<key>.json.gz      gzip compressed bucket
 *   backups/                   reserved for backup artifacts
 *
 * Every write rewrites the whole bucket file. The engine assumes it is the
 * only writer of its directory; concurrent writers from other processes
 * lose updates (last writer wins).
 */
class FileBasedStorage : public UsageStorage {
public:
    explicit FileBasedStorage(core::StorageConfig config,
                              std::shared_ptr<spdlog::logger> logger = nullptr);
    ~FileBasedStorage() override = default;

    FileBasedStorage(const FileBasedStorage&) = delete;
    FileBasedStorage& operator=(const FileBasedStorage&) = delete;

    /**
     * @brief Create the directory layout and load the bucket index
     *
     * Called implicitly by every operation; calling it again is a no-op
     * until close().
     */
    core::Result<void> init();

    StorageOperationResult store(const core::UsageDataPoint& point) override;
    StorageOperationResult store_batch(const std::vector<core::UsageDataPoint>& points) override;
    core::Result<std::vector<core::UsageDataPoint>> query(const QueryRange& range) override;
    core::Result<std::vector<AggregatedUsage>> query_aggregated(
        const QueryRange& range, core::AggregationWindow window) override;
    core::Result<StorageStats> get_stats() override;
    StorageOperationResult compact() override;
    StorageOperationResult purge_old_data(core::Timestamp older_than) override;
    StorageOperationResult backup(const std::string& path) override;
    StorageOperationResult restore(const std::string& path) override;
    void close() override;

    /**
     * @brief Purge everything older than max_retention_days
     */
    StorageOperationResult enforce_retention();

    std::string bucket_key(core::Timestamp ts) const;
    const BucketIndex& index() const { return index_; }
    bool initialized() const { return initialized_; }
    const core::StorageConfig& config() const { return config_; }

private:
    core::Result<std::string> get_or_create_bucket(core::Timestamp ts);
    core::Result<std::string> read_bucket_raw(const StorageBucket& bucket) const;
    core::Result<std::vector<core::UsageDataPoint>> read_bucket(const StorageBucket& bucket) const;
    core::Result<void> write_bucket(const StorageBucket& bucket,
                                    const std::vector<core::UsageDataPoint>& points) const;
    std::string bucket_file_path(const std::string& key) const;
    core::Timestamp now() const { return config_.clock(); }

    core::StorageConfig config_;
    std::shared_ptr<spdlog::logger> logger_;
    std::string buckets_dir_;
    std::string backups_dir_;
    BucketIndex index_;
    GzipCompressor compressor_;
    bool initialized_;
    core::Timestamp last_compaction_;
    core::Timestamp last_backup_;
};

/**
 * @brief Create a file based storage instance
 */
std::unique_ptr<FileBasedStorage> CreateFileBasedStorage(const core::StorageConfig& config,
                                                         std::shared_ptr<spdlog::logger> logger = nullptr);

} // namespace storage
} // namespace usagedb

#endif // USAGEDB_STORAGE_FILE_STORAGE_H_
