#ifndef USAGEDB_CORE_TYPES_H_
#define USAGEDB_CORE_TYPES_H_

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace usagedb {
namespace core {

/**
 * @brief Represents a timestamp in milliseconds since Unix epoch
 */
using Timestamp = int64_t;

/**
 * @brief Represents a duration in milliseconds
 */
using Duration = int64_t;

constexpr Duration kMillisPerSecond = 1000;
constexpr Duration kMillisPerMinute = 60 * kMillisPerSecond;
constexpr Duration kMillisPerHour = 60 * kMillisPerMinute;
constexpr Duration kMillisPerDay = 24 * kMillisPerHour;
constexpr Duration kMillisPerWeek = 7 * kMillisPerDay;

/**
 * @brief Source of "now" for age based decisions
 *
 * Engines never read the wall clock directly so that tests can pin time.
 */
using Clock = std::function<Timestamp()>;

Clock SystemClock();

/**
 * @brief One usage/cost sample as recorded by the budget tracker
 *
 * Points are immutable once written. metadata_json holds a compact JSON
 * object when present.
 */
struct UsageDataPoint {
    Timestamp timestamp = 0;
    std::string date;                 // YYYY-MM-DD
    int64_t request_count = 0;
    double total_cost = 0.0;
    int64_t daily_limit = 0;
    double usage_percentage = 0.0;
    std::string reset_time;
    std::optional<std::string> session_id;
    std::optional<std::vector<std::string>> features;
    std::optional<std::string> metadata_json;

    bool operator==(const UsageDataPoint& other) const;
    bool operator!=(const UsageDataPoint& other) const { return !(*this == other); }
};

/**
 * @brief Inclusive time range [start, end]
 */
struct TimeRange {
    Timestamp start = 0;
    Timestamp end = 0;

    TimeRange() = default;
    TimeRange(Timestamp s, Timestamp e) : start(s), end(e) {}
    bool contains(Timestamp ts) const { return ts >= start && ts <= end; }
    bool operator==(const TimeRange& other) const { return start == other.start && end == other.end; }
};

/**
 * @brief Nominal sampling resolution assigned to a bucket at creation
 */
enum class StorageGranularity {
    MINUTE,
    HOUR,
    DAY
};

/**
 * @brief Time-bucketed grouping used for rollups
 */
enum class AggregationWindow {
    HOUR,
    DAY,
    WEEK,
    MONTH
};

const char* GranularityName(StorageGranularity granularity);
StorageGranularity ParseGranularity(const std::string& name);

const char* WindowName(AggregationWindow window);
AggregationWindow ParseWindow(const std::string& name);

} // namespace core
} // namespace usagedb

#endif // USAGEDB_CORE_TYPES_H_
