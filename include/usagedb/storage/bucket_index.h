#ifndef USAGEDB_STORAGE_BUCKET_INDEX_H_
#define USAGEDB_STORAGE_BUCKET_INDEX_H_

#include <map>
#include <string>
#include <utility>
#include <vector>

#include "usagedb/core/result.h"
#include "usagedb/core/types.h"
#include "usagedb/storage/bucket.h"

namespace usagedb {
namespace storage {

/**
 * @brief Catalog of bucket key -> bucket descriptor, persisted as index.json
 *
 * On disk:
 *   {"buckets": [[key, {timeRange, granularity, filePath, compressionLevel,
 *    encrypted}], ...], "lastUpdated": <ms>, "version": "1.0"}
 */
class BucketIndex {
public:
    using Map = std::map<std::string, StorageBucket>;

    explicit BucketIndex(std::string index_path);

    /**
     * @brief Replace the in-memory catalog with the file contents
     *
     * A missing file yields an empty catalog. A file that is not a valid
     * index yields DATA_CORRUPTION and leaves the catalog empty.
     */
    core::Result<void> load();

    /**
     * @brief Write the catalog, stamping lastUpdated with now
     */
    core::Result<void> save(core::Timestamp now) const;

    const StorageBucket* find(const std::string& key) const;
    StorageBucket* find(const std::string& key);

    void put(const std::string& key, StorageBucket bucket);
    bool erase(const std::string& key);
    void clear();

    /**
     * @brief Buckets whose [start, end) touches the inclusive query range
     */
    std::vector<std::pair<std::string, StorageBucket>> intersecting(const core::TimeRange& range) const;

    const Map& buckets() const { return buckets_; }
    size_t size() const { return buckets_.size(); }
    bool empty() const { return buckets_.empty(); }
    const std::string& path() const { return index_path_; }

    static constexpr const char* kVersion = "1.0";

private:
    std::string index_path_;
    Map buckets_;
};

} // namespace storage
} // namespace usagedb

#endif // USAGEDB_STORAGE_BUCKET_INDEX_H_
