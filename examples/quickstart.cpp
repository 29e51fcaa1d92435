#include "usagedb/common/config_loader.h"
#include "usagedb/common/logger.h"
#include "usagedb/core/time_util.h"
#include "usagedb/query/query_engine.h"
#include "usagedb/storage/file_storage.h"
#include <iostream>
#include <memory>

using namespace usagedb;

// Usage: usagedb_quickstart [config.json]
int main(int argc, char** argv) {
    std::cout << "=== UsageDB Quick Start Example ===" << std::endl;

    common::UsageDbConfig config;
    if (argc > 1) {
        auto loaded = common::ConfigLoader::load_file(argv[1]);
        if (!loaded.ok()) {
            std::cerr << "Config failed: " << loaded.error() << std::endl;
            return 1;
        }
        config = loaded.take_value();
    } else {
        config.storage.base_dir = "./usagedb_data/historical-data";
        config.query.base_dir = "./usagedb_data/query-engine";
    }

    common::Logger::Init();
    common::Logger::SetLevel(config.log_level);

    std::shared_ptr<storage::FileBasedStorage> storage =
        storage::CreateFileBasedStorage(config.storage, common::MakeLogger("storage"));
    auto init_result = storage->init();
    if (!init_result.ok()) {
        USAGEDB_CRITICAL("Init failed: {}", init_result.error());
        return 1;
    }
    USAGEDB_INFO("Storage initialized at {}", config.storage.base_dir);

    // A week of hourly samples ending now
    const core::Timestamp now = config.storage.clock();
    std::vector<core::UsageDataPoint> points;
    for (int hour = 7 * 24; hour > 0; --hour) {
        core::UsageDataPoint point;
        point.timestamp = now - hour * core::kMillisPerHour;
        point.date = core::FormatDate(point.timestamp);
        point.request_count = hour % 13;
        point.total_cost = 0.02 * (hour % 13);
        point.daily_limit = 10;
        point.usage_percentage = point.total_cost / point.daily_limit * 100;
        point.reset_time = core::FormatIsoTimestamp(core::StartOfDay(point.timestamp) + core::kMillisPerDay);
        point.session_id = hour % 2 == 0 ? "cli" : "ide";
        points.push_back(point);
    }

    auto write_result = storage->store_batch(points);
    if (!write_result.success) {
        USAGEDB_CRITICAL("Write failed: {}", write_result.error.value_or("unknown error"));
        return 1;
    }
    USAGEDB_INFO("Stored {} points in {}ms", write_result.records_affected, write_result.execution_time_ms);

    auto engine = query::CreateQueryEngine(storage, nullptr, config.query, common::MakeLogger("query"));
    auto top = engine->create_query()
                   .time_range(now - 7 * core::kMillisPerDay, now)
                   .where("sessionId", query::FilterOperator::EQ, "ide")
                   .order_by("totalCost", query::SortDirection::DESC)
                   .limit(3)
                   .select({"date", "totalCost"})
                   .execute();
    if (!top.ok()) {
        USAGEDB_ERROR("Query failed: {}", top.error());
        return 1;
    }
    std::cout << "Most expensive IDE hours:" << std::endl;
    for (const auto& row : top.value()) {
        std::cout << "  " << (*row)["date"].GetString() << "  $" << (*row)["totalCost"].GetDouble() << std::endl;
    }

    auto daily = storage->query_aggregated(storage::QueryRange(now - 7 * core::kMillisPerDay, now),
                                           core::AggregationWindow::DAY);
    if (daily.ok()) {
        std::cout << "Daily totals:" << std::endl;
        for (const auto& window : daily.value()) {
            std::cout << "  " << core::FormatDate(window.window_start) << "  " << window.total_requests
                      << " requests, $" << window.total_cost << std::endl;
        }
    } else {
        USAGEDB_ERROR("Aggregation failed: {}", daily.error());
    }

    auto compacted = storage->compact();
    if (!compacted.success) {
        USAGEDB_WARN("Compaction failed: {}", compacted.error.value_or("unknown error"));
    } else {
        USAGEDB_DEBUG("Compacted {} buckets", compacted.records_affected);
    }

    auto stats = storage->get_stats();
    if (stats.ok()) {
        std::cout << "Buckets: " << stats.value().storage_buckets.size()
                  << ", compressed: " << stats.value().compressed_buckets
                  << ", points: " << stats.value().total_data_points << std::endl;
    }

    storage->close();
    std::cout << "Quick start complete!" << std::endl;
    return 0;
}
