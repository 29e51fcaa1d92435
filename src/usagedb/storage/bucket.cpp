#include "usagedb/storage/bucket.h"

#include "usagedb/core/time_util.h"

namespace usagedb {
namespace storage {

namespace {
const char* kWeekSuffix = "-week";
const size_t kWeekSuffixLength = 5;
}

bool StorageBucket::operator==(const StorageBucket& other) const {
    return time_range == other.time_range &&
           granularity == other.granularity &&
           file_path == other.file_path &&
           compression_level == other.compression_level &&
           encrypted == other.encrypted;
}

std::string BucketKeyFor(core::BucketStrategy strategy, core::Timestamp ts) {
    switch (strategy) {
        case core::BucketStrategy::DAILY:
            return core::FormatDate(ts);
        case core::BucketStrategy::WEEKLY:
            return core::FormatDate(core::StartOfWeek(ts)) + kWeekSuffix;
        case core::BucketStrategy::MONTHLY:
            return core::FormatMonth(ts);
    }
    throw core::InvalidArgumentError("Unsupported bucket strategy");
}

core::Result<core::TimeRange> DecodeBucketKey(core::BucketStrategy strategy, const std::string& key) {
    switch (strategy) {
        case core::BucketStrategy::DAILY: {
            auto start = core::ParseDate(key);
            if (!start) {
                break;
            }
            return core::TimeRange(*start, *start + core::kMillisPerDay);
        }
        case core::BucketStrategy::WEEKLY: {
            if (key.size() <= kWeekSuffixLength ||
                key.compare(key.size() - kWeekSuffixLength, kWeekSuffixLength, kWeekSuffix) != 0) {
                break;
            }
            auto start = core::ParseDate(key.substr(0, key.size() - kWeekSuffixLength));
            if (!start || core::Weekday(*start) != 0) {
                break;
            }
            return core::TimeRange(*start, *start + core::kMillisPerWeek);
        }
        case core::BucketStrategy::MONTHLY: {
            auto start = core::ParseMonth(key);
            if (!start) {
                break;
            }
            return core::TimeRange(*start, core::AddMonths(*start, 1));
        }
    }
    return core::Result<core::TimeRange>::error(
        "Invalid " + std::string(core::BucketStrategyName(strategy)) + " bucket key: " + key,
        core::Error::Code::INVALID_ARGUMENT);
}

core::StorageGranularity GranularityForAge(core::Duration age) {
    if (age < 7 * core::kMillisPerDay) return core::StorageGranularity::MINUTE;
    if (age < 30 * core::kMillisPerDay) return core::StorageGranularity::HOUR;
    return core::StorageGranularity::DAY;
}

bool IsCompressionEligible(core::Duration age) {
    return age > kCompressionAge;
}

} // namespace storage
} // namespace usagedb
