#include "usagedb/core/types.h"

#include <chrono>

#include "usagedb/core/error.h"

namespace usagedb {
namespace core {

Clock SystemClock() {
    return []() -> Timestamp {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    };
}

bool UsageDataPoint::operator==(const UsageDataPoint& other) const {
    return timestamp == other.timestamp &&
           date == other.date &&
           request_count == other.request_count &&
           total_cost == other.total_cost &&
           daily_limit == other.daily_limit &&
           usage_percentage == other.usage_percentage &&
           reset_time == other.reset_time &&
           session_id == other.session_id &&
           features == other.features &&
           metadata_json == other.metadata_json;
}

const char* GranularityName(StorageGranularity granularity) {
    switch (granularity) {
        case StorageGranularity::MINUTE: return "minute";
        case StorageGranularity::HOUR: return "hour";
        case StorageGranularity::DAY: return "day";
    }
    return "day";
}

StorageGranularity ParseGranularity(const std::string& name) {
    if (name == "minute") return StorageGranularity::MINUTE;
    if (name == "hour") return StorageGranularity::HOUR;
    if (name == "day") return StorageGranularity::DAY;
    throw InvalidArgumentError("Unsupported granularity: " + name);
}

const char* WindowName(AggregationWindow window) {
    switch (window) {
        case AggregationWindow::HOUR: return "hour";
        case AggregationWindow::DAY: return "day";
        case AggregationWindow::WEEK: return "week";
        case AggregationWindow::MONTH: return "month";
    }
    return "day";
}

AggregationWindow ParseWindow(const std::string& name) {
    if (name == "hour") return AggregationWindow::HOUR;
    if (name == "day") return AggregationWindow::DAY;
    if (name == "week") return AggregationWindow::WEEK;
    if (name == "month") return AggregationWindow::MONTH;
    throw InvalidArgumentError("Unsupported aggregation window: " + name);
}

} // namespace core
} // namespace usagedb
