#ifndef USAGEDB_STORAGE_BUCKET_H_
#define USAGEDB_STORAGE_BUCKET_H_

#include <string>

#include "usagedb/core/config.h"
#include "usagedb/core/result.h"
#include "usagedb/core/types.h"

namespace usagedb {
namespace storage {

// Compression level stamped on buckets that are written compressed
constexpr int kDefaultCompressionLevel = 6;

// Data older than this is eligible for gzip compression
constexpr core::Duration kCompressionAge = 7 * core::kMillisPerDay;

/**
 * @brief Descriptor of one physical storage unit
 *
 * time_range is half open: [start, end). The points live in file_path, or
 * in file_path + ".gz" when compression_level > 0, never in both.
 */
struct StorageBucket {
    core::TimeRange time_range;
    core::StorageGranularity granularity = core::StorageGranularity::MINUTE;
    std::string file_path;
    int compression_level = 0;
    bool encrypted = false;

    bool compressed() const { return compression_level > 0; }
    std::string active_path() const { return compressed() ? file_path + ".gz" : file_path; }
    std::string inactive_path() const { return compressed() ? file_path : file_path + ".gz"; }

    bool operator==(const StorageBucket& other) const;
};

/**
 * @brief Bucket key for a timestamp
 *
 * daily: "YYYY-MM-DD", weekly: "<Sunday YYYY-MM-DD>-week", monthly: "YYYY-MM".
 * All keys are computed in UTC.
 */
std::string BucketKeyFor(core::BucketStrategy strategy, core::Timestamp ts);

/**
 * @brief Decode a key back into the [start, end) range it covers
 *
 * Decoding is strict for the given strategy; a key produced by another
 * strategy, or a weekly key whose date is not a Sunday, is rejected.
 */
core::Result<core::TimeRange> DecodeBucketKey(core::BucketStrategy strategy, const std::string& key);

core::StorageGranularity GranularityForAge(core::Duration age);

bool IsCompressionEligible(core::Duration age);

} // namespace storage
} // namespace usagedb

#endif // USAGEDB_STORAGE_BUCKET_H_
