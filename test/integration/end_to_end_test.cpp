#include <gtest/gtest.h>

#include <filesystem>
#include <memory>

#include "usagedb/common/logger.h"
#include "usagedb/query/query_engine.h"
#include "usagedb/storage/file_storage.h"
#include "test_util/temp_dir.h"
#include "test_util/usage_fixtures.h"

namespace usagedb {
namespace integration {
namespace {

namespace fs = std::filesystem;
using query::FilterOperator;
using query::Where;
using testutil::Jan;

/**
 * @brief File backed storage driven through the query engine
 *
 * Covers the write path, caching across storage changes, compaction of
 * old buckets, purge with backup/restore and reopening from disk.
 */
class EndToEndTest : public ::testing::Test {
protected:
    EndToEndTest() : dir_("usagedb_e2e"), now_(std::make_shared<core::Timestamp>(Jan(20))) {}

    core::StorageConfig StorageConfig() const {
        core::StorageConfig config;
        config.base_dir = (dir_.path() / "historical-data").string();
        config.clock = testutil::FixedClock(now_);
        return config;
    }

    core::QueryEngineConfig EngineConfig() const {
        core::QueryEngineConfig config;
        config.base_dir = (dir_.path() / "query-engine").string();
        config.clock = testutil::FixedClock(now_);
        return config;
    }

    void OpenAll() {
        storage_ = storage::CreateFileBasedStorage(StorageConfig(), common::MakeNullLogger());
        ASSERT_TRUE(storage_->init().ok());
        engine_ = query::CreateQueryEngine(storage_, nullptr, EngineConfig(), common::MakeNullLogger());
        ASSERT_TRUE(engine_->init().ok());
    }

    // Two points a day for the first two weeks of January
    void Seed() {
        std::vector<core::UsageDataPoint> points;
        for (int day = 1; day <= 14; ++day) {
            for (int hour : {9, 17}) {
                auto point = testutil::MakePoint(Jan(day, hour), day + hour / 100.0, day * 2);
                point.session_id = hour == 9 ? "morning" : "evening";
                point.features = std::vector<std::string>{"chat"};
                points.push_back(point);
            }
        }
        auto stored = storage_->store_batch(points);
        ASSERT_TRUE(stored.success) << stored.error.value_or("");
        ASSERT_EQ(stored.records_affected, 28u);
        engine_->notify_write();
    }

    size_t CountAll() {
        auto result = engine_->query({});
        EXPECT_TRUE(result.ok());
        return result.ok() ? result.value().total_count : 0;
    }

    testutil::ScopedTestDir dir_;
    std::shared_ptr<core::Timestamp> now_;
    std::shared_ptr<storage::FileBasedStorage> storage_;
    std::unique_ptr<query::QueryEngine> engine_;
};

TEST_F(EndToEndTest, StoreThenQuery) {
    OpenAll();
    Seed();

    EXPECT_EQ(storage_->index().size(), 14u);

    query::QueryOptions options;
    options.sort = {query::SortSpec{"totalCost", query::SortDirection::DESC}};
    options.limit = 3;
    auto top = engine_->query({Where("sessionId", FilterOperator::EQ, "evening")}, options);
    ASSERT_TRUE(top.ok()) << top.error();
    ASSERT_EQ(top.value().rows.size(), 3u);
    EXPECT_DOUBLE_EQ((*top.value().rows[0])["totalCost"].GetDouble(), 14.17);
    EXPECT_EQ(top.value().total_count, 14u);
    EXPECT_TRUE(top.value().has_more);

    auto grouped = engine_->aggregate_query({}, {query::GroupBySpec{"sessionId", query::GroupAggregation::COUNT}});
    ASSERT_TRUE(grouped.ok());
    ASSERT_EQ(grouped.value().rows.size(), 2u);
    EXPECT_STREQ((*grouped.value().rows[0])["sessionId"].GetString(), "morning");
    EXPECT_EQ((*grouped.value().rows[0])["sessionId_count"].GetUint64(), 14u);

    auto daily = storage_->query_aggregated(storage::QueryRange(Jan(1), Jan(2) - 1), core::AggregationWindow::DAY);
    ASSERT_TRUE(daily.ok());
    ASSERT_EQ(daily.value().size(), 1u);
    EXPECT_EQ(daily.value()[0].data_points, 2u);
    EXPECT_EQ(daily.value()[0].total_requests, 4);
}

TEST_F(EndToEndTest, WritesInvalidateCachedResults) {
    OpenAll();
    Seed();
    EXPECT_EQ(CountAll(), 28u);

    ASSERT_TRUE(storage_->store(testutil::MakePoint(Jan(15, 8), 1.0)).success);
    // Still the cached answer until the engine is told
    EXPECT_EQ(CountAll(), 28u);

    engine_->notify_write();
    EXPECT_EQ(CountAll(), 29u);
}

TEST_F(EndToEndTest, CompactionKeepsResults) {
    OpenAll();
    Seed();
    const size_t before = CountAll();

    auto compacted = storage_->compact();
    ASSERT_TRUE(compacted.success) << compacted.error.value_or("");
    EXPECT_GT(compacted.records_affected, 0u);
    engine_->notify_write();

    auto stats = storage_->get_stats();
    ASSERT_TRUE(stats.ok());
    EXPECT_GT(stats.value().compressed_buckets, 0u);
    EXPECT_LT(stats.value().compressed_buckets, 14u);
    EXPECT_EQ(stats.value().total_data_points, 28u);
    EXPECT_EQ(CountAll(), before);
}

TEST_F(EndToEndTest, PurgeAndRestoreFromBackup) {
    OpenAll();
    Seed();

    const std::string backup_dir = (dir_.path() / "backup").string();
    auto backed_up = storage_->backup(backup_dir);
    ASSERT_TRUE(backed_up.success) << backed_up.error.value_or("");

    auto purged = storage_->purge_old_data(Jan(9));
    ASSERT_TRUE(purged.success);
    EXPECT_EQ(purged.records_affected, 14u);
    engine_->notify_write();
    EXPECT_EQ(CountAll(), 14u);

    auto restored = storage_->restore(backup_dir);
    ASSERT_TRUE(restored.success) << restored.error.value_or("");
    engine_->notify_write();
    EXPECT_EQ(CountAll(), 28u);
}

TEST_F(EndToEndTest, StateSurvivesReopen) {
    OpenAll();
    Seed();

    query::IndexSpec spec;
    spec.field = "sessionId";
    ASSERT_TRUE(engine_->create_index(spec).ok());

    query::SavedQuery saved;
    saved.id = "mornings";
    saved.request.filters.push_back(Where("sessionId", FilterOperator::EQ, "morning"));
    ASSERT_TRUE(engine_->save_query(saved).ok());

    engine_.reset();
    storage_->close();
    storage_.reset();

    OpenAll();
    EXPECT_EQ(storage_->index().size(), 14u);
    EXPECT_EQ(engine_->list_indexes().size(), 1u);

    auto result = engine_->execute_saved_query("mornings");
    ASSERT_TRUE(result.ok()) << result.error();
    EXPECT_EQ(result.value().total_count, 14u);
    EXPECT_EQ(result.value().stats.index_seeks, 1u);
    EXPECT_TRUE(fs::exists(dir_.path() / "query-engine" / "saved-queries" / "saved-queries.json"));
}

} // namespace
} // namespace integration
} // namespace usagedb
